// JobDispatcher: job ids, signal delivery on the dispatcher's thread and
// cancellation semantics, driven by a QCoreApplication event loop.
#include "JobDispatcher.hpp"
#include "opens3/MockStorageClient.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QStringList>
#include <QThread>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

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

constexpr std::uint64_t kMiB = 1024 * 1024;

// Holds every upload after its first chunk until the job is cancelled (or a
// safety timeout passes), so tests can cancel mid-transfer deterministically.
class GatedStorageClient : public opens3::MockStorageClient {
public:
    using opens3::MockStorageClient::MockStorageClient;

    bool putObject(const std::string &bucket, const std::string &key,
                   const std::string &local_path, opens3::OpError &err,
                   ProgressCB progress, CancelCB shouldCancel) override {
        ProgressCB gated = [progress, shouldCancel](std::uint64_t done,
                                                    std::uint64_t total) {
            if (progress)
                progress(done, total);
            const auto deadline =
                std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (shouldCancel && !shouldCancel() &&
                   std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
        };
        return MockStorageClient::putObject(bucket, key, local_path, err, gated,
                                            shouldCancel);
    }
};

bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return true;
}

struct Recorder {
    int finished = 0;
    bool lastCancelled = false;
    QString lastError;
    int batches = 0;
    quint64 lastDone = 0;
    quint64 lastTotal = 0;
    int refreshes = 0;
    QStringList lines;
    Qt::HANDLE signalThread = nullptr;

    void attach(JobDispatcher &d) {
        QObject::connect(&d, &JobDispatcher::jobFinished,
                         [this](quint64, bool cancelled, const QString &error) {
                             ++finished;
                             lastCancelled = cancelled;
                             lastError = error;
                             signalThread = QThread::currentThreadId();
                         });
        QObject::connect(&d, &JobDispatcher::batchProgress,
                         [this](quint64, quint64 done, quint64 total) {
                             ++batches;
                             lastDone = done;
                             lastTotal = total;
                         });
        QObject::connect(&d, &JobDispatcher::refreshNeeded,
                         [this]() { ++refreshes; });
        QObject::connect(&d, &JobDispatcher::progressLine,
                         [this](quint64, const QString &line) { lines << line; });
    }
};

struct DispatchFixture {
    std::shared_ptr<opens3::MockStorageBackend> backend =
        std::make_shared<opens3::MockStorageBackend>();
    opens3::BucketBinding binding;
    fs::path scratch;

    DispatchFixture() {
        backend->addBucket("data");
        binding.config.endpoint = "https://s3.example.com";
        binding.config.region = "us-east-1";
        binding.config.bucket = "data";
        binding.config.part_size = kMiB;
        binding.client =
            std::make_shared<GatedStorageClient>(backend, binding.config);
        scratch = fs::temp_directory_path() /
                  ("opens3-dispatch-" +
                   std::to_string(std::chrono::steady_clock::now()
                                      .time_since_epoch()
                                      .count()));
        fs::create_directories(scratch);
    }
    ~DispatchFixture() {
        std::error_code ec;
        fs::remove_all(scratch, ec);
    }

    std::string makeFile(const std::string &name, std::uint64_t size) {
        const fs::path p = scratch / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << std::string(size, 'd');
        return p.string();
    }
};

void test_ids_and_completion(TestContext &t) {
    DispatchFixture f;
    JobDispatcher d;
    Recorder r;
    r.attach(d);

    opens3::TransferItem folder;
    folder.remote_key = "new/";
    const quint64 first = d.submit(opens3::JobKind::CreateFolder, {folder}, f.binding);
    t.check(first == 1, "ids start at 1");
    t.check(waitUntil([&] { return r.finished == 1; }), "first job finishes");
    t.check(!r.lastCancelled && r.lastError.isEmpty(), "first job succeeded");
    t.check(r.signalThread == QThread::currentThreadId(),
            "signals arrive on the dispatcher's thread");
    t.check(r.lastDone == 1 && r.lastTotal == 1, "final aggregate delivered");
    t.check(waitUntil([&] { return r.refreshes == 1; }), "refresh requested once");
    t.check(!d.isRunning(first) && d.activeCount() == 0, "job retired");
    t.check(r.lines.contains(QStringLiteral("Create folder completed")),
            "terminal line forwarded");

    opens3::TransferItem del;
    del.remote_key = "new/";
    const quint64 second = d.submit(opens3::JobKind::Delete, {del}, f.binding);
    t.check(second == 2, "ids increase");
    t.check(waitUntil([&] { return r.finished == 2; }), "second job finishes");
    t.check(!f.backend->hasObject("data", "new/"), "folder deleted");
}

void test_cancel_mid_transfer(TestContext &t) {
    DispatchFixture f;
    JobDispatcher d;
    Recorder r;
    r.attach(d);

    bool cancelRequested = false;
    int batchesAfterCancel = 0;
    quint64 id = 0;
    QObject::connect(&d, &JobDispatcher::progressLine,
                     [&](quint64 jobId, const QString &line) {
                         if (!cancelRequested &&
                             line.startsWith(QStringLiteral("Uploading"))) {
                             cancelRequested = true;
                             d.cancel(jobId);
                         }
                     });
    QObject::connect(&d, &JobDispatcher::batchProgress,
                     [&](quint64, quint64, quint64) {
                         if (cancelRequested)
                             ++batchesAfterCancel;
                     });

    opens3::TransferItem item;
    item.remote_key = "big.bin";
    item.local_path = f.makeFile("big.bin", 4 * kMiB);
    id = d.submit(opens3::JobKind::Upload, {item}, f.binding);
    t.check(d.isKindActive(opens3::JobKind::Upload), "upload is active");
    t.check(waitUntil([&] { return r.finished == 1; }), "cancelled job finishes");
    t.check(cancelRequested, "cancel was requested");
    t.check(r.lastCancelled, "job reported as cancelled");
    t.check(r.lastError.isEmpty(), "cancellation is not an error");
    t.check(batchesAfterCancel == 0, "no progress after cancel");
    t.check(!d.isRunning(id), "job retired after cancel");
    t.check(!f.backend->hasObject("data", "big.bin"), "nothing stored");
}

void test_failure_reports_error(TestContext &t) {
    DispatchFixture f;
    f.backend->fail_keys.insert("bad.bin");
    JobDispatcher d;
    Recorder r;
    r.attach(d);

    opens3::TransferItem item;
    item.remote_key = "bad.bin";
    item.local_path = f.makeFile("bad.bin", 10);
    // Single chunk: the mock only fails after the first chunk, so split it.
    opens3::BucketBinding small = f.binding;
    small.config.part_size = 4;
    small.client = std::make_shared<opens3::MockStorageClient>(f.backend, small.config);
    d.submit(opens3::JobKind::Upload, {item}, small);
    t.check(waitUntil([&] { return r.finished == 1; }), "failed job finishes");
    t.check(!r.lastCancelled, "failure is not a cancellation");
    t.check(r.lastError.contains(QStringLiteral("Connection reset by peer")),
            "backend message in the error");
}

void test_cancel_all_on_destruction(TestContext &t) {
    DispatchFixture f;
    {
        JobDispatcher d;
        opens3::TransferItem item;
        item.remote_key = "held.bin";
        item.local_path = f.makeFile("held.bin", 3 * kMiB);
        d.submit(opens3::JobKind::Upload, {item}, f.binding);
        t.check(d.activeCount() == 1, "one active job");
    }
    t.check(!f.backend->hasObject("data", "held.bin"),
            "destroying the dispatcher cancels its jobs");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_ids_and_completion(t);
    test_cancel_mid_transfer(t);
    test_failure_reports_error(t);
    test_cancel_all_on_destruction(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opens3_dispatcher_tests\n";
    return EXIT_SUCCESS;
}
