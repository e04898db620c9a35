#pragma once
#include "StorageClient.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace opens3 {

struct MockObject {
    std::string data;
    std::uint64_t mtime = 0;
    bool public_read = false;
};

// Simulated bucket with the quirks real backends show.
struct MockBucket {
    std::string region;            // empty: any signing region accepted
    std::string endpoint;          // required endpoint; empty: any
    std::string redirect_host;     // "Endpoint" sent with PermanentRedirect
    std::optional<AddressingStyle> required_style;
    bool acl_supported = true;
    bool deny_access = false;
    std::uint64_t created = 0;
    std::map<std::string, MockObject> objects;
};

// Shared state behind every MockStorageClient built by the same factory.
class MockStorageBackend {
public:
    // Endpoint answering bucket-less requests; empty: any.
    std::string root_endpoint;
    // Signing region ListBuckets requires; empty: any.
    std::string list_buckets_region;
    // When set, decides the hint sent back for a rejected ListBuckets region
    // (lets tests script misbehaving backends).
    std::function<std::string(const std::string &)> list_buckets_hint;
    // Max entries per listing page.
    int page_limit = 1000;
    // Keys whose upload/download fails after the first chunk.
    std::set<std::string> fail_keys;
    // Buckets that answer every probe with a transport error.
    std::set<std::string> unreachable_buckets;

    std::map<std::string, MockBucket> buckets;

    // "Op bucket key region=.. endpoint=.. style=.." per call.
    std::vector<std::string> calls;

    MockBucket &addBucket(const std::string &name,
                          const std::string &region = {});
    void putObject(const std::string &bucket, const std::string &key,
                   std::string data, std::uint64_t mtime = 0);
    bool hasObject(const std::string &bucket, const std::string &key) const;
    std::size_t callCount(const std::string &op) const;

    mutable std::mutex mtx;
};

class MockStorageClient : public StorageClient {
public:
    MockStorageClient(std::shared_ptr<MockStorageBackend> backend,
                      ConnectionConfig cfg);

    static ClientFactory factory(std::shared_ptr<MockStorageBackend> backend);

    const ConnectionConfig &config() const override { return cfg_; }

    bool listObjects(const std::string &bucket, const std::string &prefix,
                     const std::string &delimiter,
                     const std::string &continuation_token, int max_keys,
                     ListPage &out, OpError &err) override;

    bool listBuckets(std::vector<BucketSummary> &out, OpError &err) override;

    bool headObject(const std::string &bucket, const std::string &key,
                    ObjectInfo &out, OpError &err) override;

    bool getObject(const std::string &bucket, const std::string &key,
                   const std::string &local_path, OpError &err,
                   ProgressCB progress = {},
                   CancelCB shouldCancel = {}) override;

    bool putObject(const std::string &bucket, const std::string &key,
                   const std::string &local_path, OpError &err,
                   ProgressCB progress = {},
                   CancelCB shouldCancel = {}) override;

    bool putEmptyObject(const std::string &bucket, const std::string &key,
                        OpError &err) override;

    bool deleteObject(const std::string &bucket, const std::string &key,
                      OpError &err) override;

    bool presignGetUrl(const std::string &bucket, const std::string &key,
                       std::uint64_t ttl_sec, std::string &url,
                       OpError &err) override;

    bool setPublicRead(const std::string &bucket, const std::string &key,
                       OpError &err) override;

    bool createBucket(const std::string &bucket, OpError &err) override;
    bool deleteBucket(const std::string &bucket, OpError &err) override;

private:
    std::shared_ptr<MockStorageBackend> backend_;
    ConnectionConfig cfg_;

    void logCall(const std::string &op, const std::string &bucket,
                 const std::string &key);
    // Applies the bucket's endpoint/style/region rules. Caller holds mtx.
    bool checkBucketAccess(const std::string &bucket, MockBucket *&out,
                           OpError &err);
};

} // namespace opens3
