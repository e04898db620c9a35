// Runs transfer jobs off the caller's thread (one worker per job) and
// re-emits engine events as Qt signals on the dispatcher's thread.
#pragma once
#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "opens3/ConnectionBinder.hpp"
#include "opens3/TransferEngine.hpp"

class JobDispatcher : public QObject {
    Q_OBJECT
public:
    explicit JobDispatcher(QObject *parent = nullptr);
    ~JobDispatcher() override;

    // Starts the job against the given binding. Ids start at 1. Only one job
    // per kind is expected at a time; a second one is logged and still run.
    quint64 submit(opens3::JobKind kind, opens3::TransferJob job,
                   const opens3::BucketBinding &binding);

    void cancel(quint64 id);
    void cancelAll();

    bool isRunning(quint64 id) const;
    bool isKindActive(opens3::JobKind kind) const;
    int activeCount() const;

signals:
    void progressLine(quint64 id, const QString &line);
    void batchProgress(quint64 id, quint64 done, quint64 total);
    void rateUpdated(quint64 id, double bytesPerSec, const QString &rateText,
                     const QString &etaText);
    void jobFinished(quint64 id, bool cancelled, const QString &error);
    void refreshNeeded();

private slots:
    void onTick();

private:
    struct Job {
        quint64 id = 0;
        opens3::JobKind kind = opens3::JobKind::Download;
        opens3::CancelTokenPtr token;
        std::shared_ptr<opens3::TransferEngine> engine;
        opens3::RateEstimator rate;
        std::atomic<bool> finished{false};
        std::thread worker;
    };

    void finishJob(quint64 id, const opens3::TransferOutcome &outcome,
                   opens3::JobKind kind);
    void updateTimer();

    mutable std::mutex mtx_;
    std::map<quint64, std::unique_ptr<Job>> jobs_;
    quint64 nextId_ = 1;
    QTimer tick_;
};
