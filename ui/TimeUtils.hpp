// Display helpers shared by the table model and the command line: object
// timestamps, sizes and batch progress.
#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>
#include "opens3/ProgressAggregator.hpp"

namespace opens3ui {

// Last-modified / creation time in local time, short locale format. Zero
// (folders, unknown) renders as an em dash.
inline QString localShortTime(quint64 epochSecs) {
    const QString none = QStringLiteral("—");
    if (epochSecs == 0)
        return none;
    const QDateTime at = QDateTime::fromSecsSinceEpoch(qint64(epochSecs));
    return at.isValid() ? QLocale::system().toString(at, QLocale::ShortFormat)
                        : none;
}

inline QString sizeText(quint64 bytes) {
    return QString::fromStdString(opens3::formatBytes(bytes));
}

// "3.0 MiB / 10.0 MiB (30%)" for byte batches, "2 / 5 (40%)" for object
// batches (delete, create folder).
inline QString progressText(quint64 done, quint64 total, bool countsBytes) {
    const int pct = total == 0 ? 100 : int((done * 100) / total);
    const QString d = countsBytes ? sizeText(done) : QString::number(done);
    const QString t = countsBytes ? sizeText(total) : QString::number(total);
    return QStringLiteral("%1 / %2 (%3%)").arg(d, t).arg(pct);
}

} // namespace opens3ui
