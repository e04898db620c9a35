// TransferEngine batches against the in-memory backend: byte and object
// progress, cancellation, failure reporting and local layout of folder
// downloads.
#include "opens3/ConnectionBinder.hpp"
#include "opens3/HierarchicalLister.hpp"
#include "opens3/MockStorageClient.hpp"
#include "opens3/TransferEngine.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

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

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

constexpr std::uint64_t kMiB = 1024 * 1024;

std::string uniqueToken() {
    return std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
}

// Scratch directory removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        path = fs::temp_directory_path() / ("opens3-xfer-" + uniqueToken());
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void writeFile(const fs::path &p, const std::string &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct RecordingListener : opens3::TransferListener {
    std::vector<std::string> lines;
    std::vector<opens3::BatchProgress> events;
    int refreshes = 0;
    // When set, cancels this token on the first aggregate event.
    opens3::CancelToken *cancelOnFirstEvent = nullptr;
    std::size_t eventsAtCancel = 0;

    void onProgressLine(const std::string &line) override { lines.push_back(line); }
    void onBatchProgress(const opens3::BatchProgress &p) override {
        events.push_back(p);
        if (cancelOnFirstEvent && !cancelOnFirstEvent->isCancelled()) {
            cancelOnFirstEvent->cancel();
            eventsAtCancel = events.size();
        }
    }
    void onRefreshNeeded() override { ++refreshes; }
};

struct EngineFixture {
    std::shared_ptr<opens3::MockStorageBackend> backend =
        std::make_shared<opens3::MockStorageBackend>();
    std::shared_ptr<opens3::MockStorageClient> client;

    explicit EngineFixture(std::uint64_t part_size = kMiB) {
        backend->addBucket("data");
        opens3::ConnectionConfig cfg;
        cfg.endpoint = "https://s3.example.com";
        cfg.region = "us-east-1";
        cfg.bucket = "data";
        cfg.part_size = part_size;
        client = std::make_shared<opens3::MockStorageClient>(backend, cfg);
    }
};

void test_upload_reports_progress(TestContext &t) {
    EngineFixture f;
    TempDir tmp;
    const fs::path src = tmp.path / "big.bin";
    writeFile(src, std::string(10 * kMiB, 'x'));

    opens3::TransferItem item;
    item.remote_key = "incoming/";
    item.local_path = src.string();
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Upload, {item}, token, l);

    t.check(outcome.state == opens3::JobState::Completed, "upload completes");
    t.check(f.backend->hasObject("data", "incoming/big.bin"),
            "key ending in '/' gets the file name appended");
    t.check(l.events.size() >= 10, "at least one event per part");
    t.check(!l.events.empty() && l.events.back().final &&
                l.events.back().done == 10 * kMiB &&
                l.events.back().total == 10 * kMiB,
            "final event reports the full batch");
    bool monotonic = true;
    for (std::size_t i = 1; i < l.events.size(); ++i)
        monotonic = monotonic && l.events[i].done >= l.events[i - 1].done;
    t.check(monotonic, "aggregate progress never decreases");
    t.check(engine.bytesDone() == engine.bytesTotal(), "counters settle at total");
    t.check(!l.lines.empty() && l.lines.back() == "Upload completed",
            "terminal line");
    t.checkContains(l.lines.front(), "(10485760 bytes)", "item line carries size");
    t.check(l.refreshes == 1, "one refresh after remote mutation");
}

void test_cancel_stops_progress(TestContext &t) {
    EngineFixture f;
    TempDir tmp;
    const fs::path src = tmp.path / "big.bin";
    writeFile(src, std::string(10 * kMiB, 'y'));

    opens3::TransferItem item;
    item.remote_key = "big.bin";
    item.local_path = src.string();
    opens3::CancelToken token;
    RecordingListener l;
    l.cancelOnFirstEvent = &token;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Upload, {item}, token, l);

    t.check(outcome.cancelled(), "outcome is Cancelled");
    t.check(outcome.error.isCancelled(), "error kind is Cancelled");
    t.check(l.events.size() == l.eventsAtCancel,
            "no progress after cancellation");
    t.check(!f.backend->hasObject("data", "big.bin"), "partial object not stored");
    t.check(f.backend->callCount("AbortMultipartUpload") == 1,
            "multipart upload aborted");
    t.check(!l.lines.empty() && l.lines.back() == "Upload cancelled",
            "terminal line");
}

void test_cancel_before_start(TestContext &t) {
    EngineFixture f;
    opens3::TransferItem item;
    item.remote_key = "x/";
    opens3::CancelToken token;
    token.cancel();
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::CreateFolder, {item}, token, l);
    t.check(outcome.cancelled(), "pre-cancelled job ends Cancelled");
    t.check(l.events.empty(), "no progress for a pre-cancelled job");
    t.check(!f.backend->hasObject("data", "x/"), "nothing created");
}

void test_cancel_wakes_waiter(TestContext &t) {
    opens3::CancelToken token;
    t.check(!token.waitFor(std::chrono::milliseconds(10)),
            "waitFor times out while the token is clear");

    bool woke = false;
    const auto start = std::chrono::steady_clock::now();
    std::thread waiter([&] { woke = token.waitFor(std::chrono::seconds(30)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.cancel();
    waiter.join();
    const auto waited = std::chrono::steady_clock::now() - start;
    t.check(woke, "waitFor reports the cancellation");
    t.check(waited < std::chrono::seconds(10), "cancel wakes a blocked waiter");
    t.check(token.waitFor(std::chrono::seconds(30)),
            "a cancelled token never blocks");
}

// Cancels the job's token once the first listing page has been served.
class CancelAfterFirstPageClient : public opens3::MockStorageClient {
public:
    CancelAfterFirstPageClient(std::shared_ptr<opens3::MockStorageBackend> backend,
                               opens3::ConnectionConfig cfg,
                               opens3::CancelToken &token)
        : MockStorageClient(std::move(backend), std::move(cfg)), token_(token) {}

    bool listObjects(const std::string &bucket, const std::string &prefix,
                     const std::string &delimiter,
                     const std::string &continuation_token, int max_keys,
                     opens3::ListPage &out, opens3::OpError &err) override {
        const bool ok = MockStorageClient::listObjects(
            bucket, prefix, delimiter, continuation_token, max_keys, out, err);
        token_.cancel();
        return ok;
    }

private:
    opens3::CancelToken &token_;
};

void test_cancel_during_enumeration(TestContext &t) {
    EngineFixture f;
    f.backend->page_limit = 2;
    for (int i = 0; i < 10; ++i)
        f.backend->putObject("data", "tree/f" + std::to_string(i) + ".txt", "z");

    opens3::ConnectionConfig cfg;
    cfg.endpoint = "https://s3.example.com";
    cfg.region = "us-east-1";
    cfg.bucket = "data";

    for (const opens3::JobKind kind :
         {opens3::JobKind::Delete, opens3::JobKind::Download}) {
        TempDir tmp;
        opens3::CancelToken token;
        auto client =
            std::make_shared<CancelAfterFirstPageClient>(f.backend, cfg, token);
        opens3::TransferItem item;
        item.remote_key = "tree/";
        if (kind == opens3::JobKind::Download)
            item.destination_dir = tmp.path.string();
        f.backend->calls.clear();
        RecordingListener l;
        opens3::TransferEngine engine(client, "data");
        const auto outcome = engine.run(kind, {item}, token, l);

        const std::string name = opens3::jobKindName(kind);
        t.check(outcome.cancelled(), name + ": cancelled while preparing");
        t.check(f.backend->callCount("ListObjectsV2") == 1,
                name + ": enumeration stops after the current page");
        t.check(f.backend->callCount("DeleteObject") == 0 &&
                    f.backend->callCount("GetObject") == 0,
                name + ": no object touched");
        t.check(l.events.empty(), name + ": no progress reported");
    }
    t.check(f.backend->hasObject("data", "tree/f0.txt") &&
                f.backend->hasObject("data", "tree/f9.txt"),
            "objects survive a cancelled delete");
}

void test_failure_keeps_cause(TestContext &t) {
    EngineFixture f;
    TempDir tmp;
    const fs::path src = tmp.path / "f.bin";
    writeFile(src, std::string(3 * kMiB, 'z'));
    f.backend->fail_keys.insert("f.bin");

    opens3::TransferItem item;
    item.remote_key = "f.bin";
    item.local_path = src.string();
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Upload, {item}, token, l);

    t.check(outcome.failed(), "outcome is Failed");
    t.check(outcome.error.kind == opens3::ErrorKind::Transfer,
            "item failure surfaces as a transfer error");
    t.check(outcome.error.message == "Connection reset by peer",
            "backend message preserved");
    t.check(outcome.error.key == "f.bin", "failing key attached");
    t.check(!l.lines.empty() &&
                l.lines.back().rfind("Upload failed: ", 0) == 0,
            "terminal failure line");
    t.check(l.events.empty() || !l.events.back().final,
            "no final event for a failed batch");
}

void test_missing_local_file(TestContext &t) {
    EngineFixture f;
    opens3::TransferItem item;
    item.remote_key = "k";
    item.local_path = "/nonexistent/opens3/file.bin";
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Upload, {item}, token, l);
    t.check(outcome.failed(), "missing file fails the batch");
    t.check(outcome.error.kind == opens3::ErrorKind::LocalIo, "LocalIo reported");
    t.check(outcome.total == 0, "failure happened while preparing");
    t.check(f.backend->callCount("PutObject") == 0, "nothing uploaded");
    t.check(l.refreshes == 0, "no refresh without mutation");
}

void test_folder_download_layout(TestContext &t) {
    EngineFixture f(4);
    f.backend->putObject("data", "docs/", "");
    f.backend->putObject("data", "docs/readme.txt", "hello world");
    f.backend->putObject("data", "docs/img/", "");
    f.backend->putObject("data", "docs/img/logo.png", "PNGDATA");
    f.backend->putObject("data", "other.txt", "nope");

    TempDir tmp;
    opens3::TransferItem item;
    item.remote_key = "docs/";
    item.destination_dir = tmp.path.string();
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Download, {item}, token, l);

    t.check(outcome.state == opens3::JobState::Completed, "folder download completes");
    t.check(readFile(tmp.path / "docs" / "readme.txt") == "hello world",
            "file placed under the folder name");
    t.check(readFile(tmp.path / "docs" / "img" / "logo.png") == "PNGDATA",
            "nested file placed in its subdirectory");
    t.check(!fs::exists(tmp.path / "docs" / "other.txt") &&
                !fs::exists(tmp.path / "other.txt"),
            "keys outside the prefix are not downloaded");
    t.check(outcome.total == 11 + 7, "total counts object bytes");
    t.check(!l.events.empty() && l.events.back().done == 18,
            "final event covers the batch");
    t.check(l.refreshes == 0, "downloads do not request a refresh");

    // A second run overwrites in place.
    f.backend->putObject("data", "docs/readme.txt", "changed");
    opens3::CancelToken again;
    RecordingListener l2;
    opens3::TransferEngine engine2(f.client, "data");
    t.check(engine2.run(opens3::JobKind::Download, {item}, again, l2).state ==
                opens3::JobState::Completed,
            "re-download completes");
    t.check(readFile(tmp.path / "docs" / "readme.txt") == "changed",
            "existing files are overwritten");
}

void test_download_rejects_escaping_keys(TestContext &t) {
    EngineFixture f;
    f.backend->putObject("data", "evil/ok.txt", "fine");
    f.backend->putObject("data", "evil/../../escape.txt", "bad");

    TempDir tmp;
    const fs::path dest = tmp.path / "dest";
    fs::create_directories(dest);
    opens3::TransferItem item;
    item.remote_key = "evil/";
    item.destination_dir = dest.string();
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Download, {item}, token, l);
    t.check(outcome.failed(), "escaping key fails the batch");
    t.check(outcome.error.kind == opens3::ErrorKind::InvalidArgument,
            "rejection is an invalid argument");
    t.check(!fs::exists(tmp.path / "escape.txt") &&
                !fs::exists(dest / "escape.txt"),
            "nothing written outside the destination");
    t.check(f.backend->callCount("GetObject") == 0,
            "rejected before any transfer");
}

void test_download_single_file(TestContext &t) {
    EngineFixture f;
    f.backend->putObject("data", "a/b.txt", "payload");
    TempDir tmp;
    opens3::TransferItem item;
    item.remote_key = "a/b.txt";
    item.local_path = (tmp.path / "nested" / "b.txt").string();
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Download, {item}, token, l);
    t.check(outcome.state == opens3::JobState::Completed, "single download completes");
    t.check(readFile(tmp.path / "nested" / "b.txt") == "payload",
            "missing parent directories are created");
    t.check(f.backend->callCount("HeadObject") == 1,
            "unknown size resolved with HEAD");
}

void test_delete_folder(TestContext &t) {
    EngineFixture f;
    f.backend->putObject("data", "a/", "");
    f.backend->putObject("data", "a/b/", "");
    f.backend->putObject("data", "a/b/c", "1");
    f.backend->putObject("data", "a/b/d/e", "2");
    f.backend->putObject("data", "a/x", "3");

    opens3::TransferItem item;
    item.remote_key = "a/b/";
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Delete, {item}, token, l);

    t.check(outcome.state == opens3::JobState::Completed, "delete completes");
    t.check(outcome.total == 3, "delete counts objects");
    t.check(f.backend->callCount("DeleteObject") == 3,
            "exactly the folder's objects are deleted");
    t.check(!f.backend->hasObject("data", "a/b/") &&
                !f.backend->hasObject("data", "a/b/c") &&
                !f.backend->hasObject("data", "a/b/d/e"),
            "folder contents removed");
    t.check(f.backend->hasObject("data", "a/x") && f.backend->hasObject("data", "a/"),
            "siblings untouched");
    t.check(l.refreshes == 1, "one refresh after deletion");

    opens3::ConnectionConfig cfg = f.client->config();
    opens3::ConnectionBinder binder(cfg, opens3::MockStorageClient::factory(f.backend));
    opens3::BucketBinding b;
    opens3::OpError err;
    t.check(binder.bindBucket("data", b, err), "bind for listing");
    opens3::HierarchicalLister lister(binder);
    std::vector<opens3::FSObject> out;
    t.check(lister.list({"data", "a/"}, out, err), "list parent");
    t.check(out.size() == 1 && out[0].name == "x", "deleted folder no longer listed");
}

void test_create_folder(TestContext &t) {
    EngineFixture f;
    opens3::TransferItem item;
    item.remote_key = "new";
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::CreateFolder, {item}, token, l);
    t.check(outcome.state == opens3::JobState::Completed, "create folder completes");
    t.check(f.backend->hasObject("data", "new/"), "placeholder ends with '/'");
    t.check(!l.events.empty() && l.events.back().done == 1 &&
                l.events.back().total == 1,
            "placeholder counts as one object");
    t.check(!l.lines.empty() && l.lines.back() == "Create folder completed",
            "terminal line");
}

void test_multi_item_refresh_once(TestContext &t) {
    EngineFixture f;
    TempDir tmp;
    opens3::TransferJob job;
    for (int i = 0; i < 3; ++i) {
        const fs::path p = tmp.path / ("f" + std::to_string(i) + ".txt");
        writeFile(p, std::string(100 + i, 'a'));
        opens3::TransferItem item;
        item.local_path = p.string();
        job.push_back(item);
    }
    opens3::CancelToken token;
    RecordingListener l;
    opens3::TransferEngine engine(f.client, "data");
    const auto outcome = engine.run(opens3::JobKind::Upload, job, token, l);
    t.check(outcome.state == opens3::JobState::Completed, "batch completes");
    t.check(outcome.total == 100 + 101 + 102, "total is the sum of sizes");
    t.check(f.backend->hasObject("data", "f0.txt") &&
                f.backend->hasObject("data", "f2.txt"),
            "empty key uploads to the bucket root");
    t.check(l.refreshes == 1, "refresh emitted once per batch");
}

} // namespace

int main() {
    TestContext t;
    test_upload_reports_progress(t);
    test_cancel_stops_progress(t);
    test_cancel_before_start(t);
    test_cancel_wakes_waiter(t);
    test_cancel_during_enumeration(t);
    test_failure_keeps_cause(t);
    test_missing_local_file(t);
    test_folder_download_layout(t);
    test_download_rejects_escaping_keys(t);
    test_download_single_file(t);
    test_delete_folder(t);
    test_create_folder(t);
    test_multi_item_refresh_once(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opens3_transfer_tests\n";
    return EXIT_SUCCESS;
}
