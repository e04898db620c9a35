// Abstract interface for S3 primitives. Concrete implementations (aws-sdk-cpp,
// in-memory mock) must respect this API to keep the engine decoupled from the
// SDK that signs and transports requests.
#pragma once
#include "S3Error.hpp"
#include "S3Types.hpp"
#include <functional>
#include <memory>

namespace opens3 {

class StorageClient {
public:
    // Cumulative bytes for the current object and its total size.
    using ProgressCB =
        std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    // Polled at every chunk boundary; returning true aborts the transfer
    // with ErrorKind::Cancelled.
    using CancelCB = std::function<bool()>;

    virtual ~StorageClient() = default;

    // Configuration this client was built from.
    virtual const ConnectionConfig &config() const = 0;

    // One page of ListObjectsV2. Empty delimiter lists recursively.
    virtual bool listObjects(const std::string &bucket,
                             const std::string &prefix,
                             const std::string &delimiter,
                             const std::string &continuation_token,
                             int max_keys, ListPage &out, OpError &err) = 0;

    virtual bool listBuckets(std::vector<BucketSummary> &out,
                             OpError &err) = 0;

    virtual bool headObject(const std::string &bucket, const std::string &key,
                            ObjectInfo &out, OpError &err) = 0;

    // Download one object into local_path (created/truncated).
    virtual bool getObject(const std::string &bucket, const std::string &key,
                           const std::string &local_path, OpError &err,
                           ProgressCB progress = {},
                           CancelCB shouldCancel = {}) = 0;

    // Upload local_path; multipart above config().multipart_threshold. A
    // cancelled or failed multipart upload is aborted on the server.
    virtual bool putObject(const std::string &bucket, const std::string &key,
                           const std::string &local_path, OpError &err,
                           ProgressCB progress = {},
                           CancelCB shouldCancel = {}) = 0;

    // Zero-byte object, used for folder placeholders ("a/b/").
    virtual bool putEmptyObject(const std::string &bucket,
                                const std::string &key, OpError &err) = 0;

    virtual bool deleteObject(const std::string &bucket,
                              const std::string &key, OpError &err) = 0;

    virtual bool presignGetUrl(const std::string &bucket,
                               const std::string &key, std::uint64_t ttl_sec,
                               std::string &url, OpError &err) = 0;

    // ErrorKind::NotSupported when the backend refuses ACL changes.
    virtual bool setPublicRead(const std::string &bucket,
                               const std::string &key, OpError &err) = 0;

    virtual bool createBucket(const std::string &bucket, OpError &err) = 0;
    virtual bool deleteBucket(const std::string &bucket, OpError &err) = 0;
};

// Builds a client from a configuration. Pure construction, no network I/O.
using ClientFactory =
    std::function<std::shared_ptr<StorageClient>(const ConnectionConfig &)>;

} // namespace opens3
