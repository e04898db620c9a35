// Integration tests for the aws-sdk-cpp backed client against a real
// S3-compatible endpoint (MinIO, Garage, AWS). Skipped (exit code 77) unless
// the OPEN_S3_IT_* variables exist.
#include "opens3/AwsS3StorageClient.hpp"
#include "opens3/StorageModel.hpp"
#include "opens3/TransferEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool listContainsName(const std::vector<opens3::FSObject> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const opens3::FSObject &e) {
                           return e.name == name;
                       });
}

struct NullListener : opens3::TransferListener {
    std::uint64_t lastDone = 0;
    void onProgressLine(const std::string &line) override {
        std::cout << "  " << line << "\n";
    }
    void onBatchProgress(const opens3::BatchProgress &p) override {
        lastDone = p.done;
    }
};

} // namespace

int main() {
    const auto endpoint = envValue("OPEN_S3_IT_ENDPOINT");
    const auto accessKey = envValue("OPEN_S3_IT_ACCESS_KEY");
    const auto secretKey = envValue("OPEN_S3_IT_SECRET_KEY");
    const auto bucket = envValue("OPEN_S3_IT_BUCKET");
    const std::string region = envValue("OPEN_S3_IT_REGION").value_or("");
    const bool pathStyle = envValue("OPEN_S3_IT_PATH_STYLE").has_value();

    if (!endpoint || !accessKey || !secretKey || !bucket) {
        std::cout << "[SKIP] opens3_aws_integration_tests requires env vars: "
                  << "OPEN_S3_IT_ENDPOINT, OPEN_S3_IT_ACCESS_KEY, "
                     "OPEN_S3_IT_SECRET_KEY and OPEN_S3_IT_BUCKET\n";
        return kSkipExitCode;
    }

    opens3::AwsSdkSession sdk;
    TestContext t;

    opens3::ConnectionConfig cfg;
    cfg.profile_name = "integration";
    cfg.endpoint = *endpoint;
    cfg.region = region;
    cfg.access_key = *accessKey;
    cfg.secret_key = *secretKey;
    cfg.addressing_style = pathStyle ? opens3::AddressingStyle::Path
                                     : opens3::AddressingStyle::Virtual;
    cfg.part_size = 5 * 1024 * 1024;
    cfg.multipart_threshold = 5 * 1024 * 1024;

    opens3::StorageModel model(cfg, opens3::AwsS3StorageClient::factory());
    opens3::OpError err;
    std::vector<opens3::FSObject> entries;

    bool visible = false;
    t.check(model.checkBucket(*bucket, visible, err),
            "bucket list failed: " + err.describe());

    if (!model.enterBucket(*bucket, entries, err)) {
        std::cerr << "[FAIL] cannot bind bucket: " << err.describe() << "\n";
        return EXIT_FAILURE;
    }

    const std::string token = uniqueToken();
    const std::string folder = "opens3-it-" + token + "/";
    const fs::path localDir =
        fs::temp_directory_path() / ("opens3-it-" + token);
    fs::create_directories(localDir);

    const fs::path small = localDir / "small.txt";
    const fs::path large = localDir / "large.bin";
    const std::string smallBody = "hello from opens3 " + token;
    {
        std::ofstream(small, std::ios::binary) << smallBody;
        std::ofstream out(large, std::ios::binary);
        out << std::string(12 * 1024 * 1024, 'L');
    }

    const opens3::BucketBinding binding = model.bindingSnapshot();
    {
        opens3::TransferItem a;
        a.remote_key = folder;
        a.local_path = small.string();
        opens3::TransferItem b;
        b.remote_key = folder;
        b.local_path = large.string();
        opens3::CancelToken cancel;
        NullListener l;
        opens3::TransferEngine engine(binding.client, *bucket);
        const auto outcome =
            engine.run(opens3::JobKind::Upload, {a, b}, cancel, l);
        t.check(outcome.state == opens3::JobState::Completed,
                "upload failed: " + outcome.error.describe());
        t.check(l.lastDone == outcome.total, "upload final progress");
    }

    t.check(model.navigate({*bucket, folder}, entries, err),
            "listing uploaded folder failed: " + err.describe());
    t.check(listContainsName(entries, "small.txt") &&
                listContainsName(entries, "large.bin"),
            "uploaded files listed");

    std::uint64_t bytes = 0;
    t.check(model.totalSize(folder, bytes, err) &&
                bytes == smallBody.size() + 12 * 1024 * 1024,
            "folder size matches uploads");

    std::string url;
    t.check(model.presignedUrl(folder + "small.txt", 60, url, err) &&
                url.find("X-Amz-Signature") != std::string::npos,
            "presigned url: " + err.describe());

    {
        opens3::TransferItem d;
        d.remote_key = folder;
        d.destination_dir = (localDir / "download").string();
        opens3::CancelToken cancel;
        NullListener l;
        opens3::TransferEngine engine(binding.client, *bucket);
        const auto outcome = engine.run(opens3::JobKind::Download, {d}, cancel, l);
        t.check(outcome.state == opens3::JobState::Completed,
                "download failed: " + outcome.error.describe());
        std::string back;
        const fs::path got = localDir / "download" /
                             folder.substr(0, folder.size() - 1) / "small.txt";
        t.check(readFile(got, back) && back == smallBody, "downloaded content");
    }

    {
        opens3::TransferItem d;
        d.remote_key = folder;
        opens3::CancelToken cancel;
        NullListener l;
        opens3::TransferEngine engine(binding.client, *bucket);
        const auto outcome = engine.run(opens3::JobKind::Delete, {d}, cancel, l);
        t.check(outcome.state == opens3::JobState::Completed,
                "delete failed: " + outcome.error.describe());
    }
    t.check(model.navigate({*bucket, ""}, entries, err) &&
                !listContainsName(entries, folder.substr(0, folder.size() - 1)),
            "folder gone after delete");

    std::error_code ec;
    fs::remove_all(localDir, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opens3_aws_integration_tests\n";
    return EXIT_SUCCESS;
}
