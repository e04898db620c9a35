// RemoteModel over a mock-backed StorageModel: row order, display columns
// and navigation through model indexes.
#include "RemoteModel.hpp"
#include "TimeUtils.hpp"
#include "opens3/MockStorageClient.hpp"

#include <QCoreApplication>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

QString cell(const RemoteModel &m, int row, int col,
             int role = Qt::DisplayRole) {
    return m.data(m.index(row, col), role).toString();
}

void test_rows_and_navigation(TestContext &t) {
    auto backend = std::make_shared<opens3::MockStorageBackend>();
    backend->addBucket("zeta");
    backend->addBucket("alpha");
    backend->putObject("alpha", "b.txt", "12345");
    backend->putObject("alpha", "a.txt", "1");
    backend->putObject("alpha", "z/", "");
    backend->putObject("alpha", "z/inner.txt", "in");

    opens3::ConnectionConfig cfg;
    cfg.endpoint = "https://s3.example.com";
    cfg.region = "us-east-1";
    cfg.access_key = "ak";
    cfg.secret_key = "sk";
    opens3::StorageModel storage(cfg, opens3::MockStorageClient::factory(backend));
    RemoteModel m(&storage);

    QString why;
    t.check(m.setLocation(opens3::Location{}, &why), "bucket list loads");
    t.check(m.rowCount() == 2 && m.columnCount() == RemoteModel::ColumnCount,
            "one row per bucket");
    t.check(cell(m, 0, RemoteModel::NameColumn) == QStringLiteral("alpha"),
            "buckets sorted by name");
    t.check(cell(m, 0, RemoteModel::NameColumn, Qt::ToolTipRole) ==
                QStringLiteral("Bucket"),
            "bucket kind exposed");
    t.check(m.locationText().isEmpty(), "no location text in bucket list");

    t.check(m.enter(m.index(0, 0), &why), "enter bucket by index");
    t.check(m.locationText() == QStringLiteral("alpha/"), "location text");
    t.check(m.rowCount() == 3, "folder and two files");
    t.check(cell(m, 0, RemoteModel::NameColumn) == QStringLiteral("z/"),
            "folders sort first and end with '/'");
    t.check(cell(m, 0, RemoteModel::SizeColumn).isEmpty(),
            "folders show no size");
    t.check(cell(m, 1, RemoteModel::NameColumn) == QStringLiteral("a.txt") &&
                cell(m, 2, RemoteModel::NameColumn) == QStringLiteral("b.txt"),
            "files sorted by name");
    t.check(cell(m, 2, RemoteModel::SizeColumn) == QStringLiteral("5 B"),
            "file size text");
    t.check(m.data(m.index(2, RemoteModel::SizeColumn), Qt::UserRole)
                    .toULongLong() == 5,
            "raw size under UserRole");
    t.check(m.keyAt(m.index(0, 0)) == QStringLiteral("z/") &&
                m.keyAt(m.index(2, 0)) == QStringLiteral("b.txt"),
            "keys relative to the bucket");

    t.check(!m.enter(m.index(1, 0), &why), "files are not entered");
    t.check(m.enter(m.index(0, 0), &why), "enter folder");
    t.check(m.rowCount() == 1 && m.keyAt(m.index(0, 0)) ==
                                     QStringLiteral("z/inner.txt"),
            "folder contents keyed with the prefix");

    t.check(m.goUp(&why) && m.locationText() == QStringLiteral("alpha/"),
            "go up to bucket root");

    why.clear();
    t.check(!m.setLocation(opens3::Location{"missing", ""}, &why),
            "unknown bucket fails");
    t.check(!why.isEmpty(), "error text provided");
    t.check(m.rowCount() == 2, "rows fall back to the bucket list");
}

void test_progress_text(TestContext &t) {
    t.check(opens3ui::progressText(3, 10, false) == QStringLiteral("3 / 10 (30%)"),
            "object batches count items");
    t.check(opens3ui::progressText(512, 1024, true) ==
                QStringLiteral("512 B / 1.0 KiB (50%)"),
            "byte batches use size text");
    t.check(opens3ui::progressText(0, 0, true).endsWith(QStringLiteral("(100%)")),
            "empty batch is complete");
    t.check(opens3ui::localShortTime(0) == QStringLiteral("\u2014"),
            "unknown time renders as a dash");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_rows_and_navigation(t);
    test_progress_text(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opens3_remote_model_tests\n";
    return EXIT_SUCCESS;
}
