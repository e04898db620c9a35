// Builds storage clients and negotiates the endpoint/region/addressing style
// a bucket actually answers on. The committed binding only changes through
// bindBucket(), returnToRootScope(), setConfig() and promoteRegion().
#pragma once
#include "StorageClient.hpp"
#include <mutex>

namespace opens3 {

// Last successfully probed client for the active bucket.
struct BucketBinding {
    std::shared_ptr<StorageClient> client;
    ConnectionConfig config;  // endpoint, region, style and bucket in use

    bool valid() const { return client != nullptr; }
};

class ConnectionBinder {
public:
    // Attempt budget of listAccessibleBuckets().
    static constexpr int kRegionRetryBudget = 10;

    ConnectionBinder(ConnectionConfig root, ClientFactory factory);

    // Pure construction: overrides merged over the root configuration.
    std::shared_ptr<StorageClient>
    buildClient(const ConfigOverrides &overrides) const;

    // Probes candidate bindings for `bucket` and commits the first one that
    // answers. On failure the committed state is left untouched.
    bool bindBucket(const std::string &bucket, BucketBinding &out,
                    OpError &err);

    // ListBuckets against the root endpoint, following signing-region hints.
    bool listAccessibleBuckets(std::vector<BucketSummary> &out, OpError &err);

    // Drops the bucket binding; the root client is rebuilt on demand.
    void returnToRootScope();

    // Profile switch: new root configuration, binding dropped.
    void setConfig(const ConnectionConfig &cfg);

    // Makes `region` the active region of the bound bucket.
    void promoteRegion(const std::string &region);

    // Copy of the committed binding, building the client if needed.
    BucketBinding snapshot();

    ConnectionConfig rootConfig() const;
    // Bucket named by the profile; the root scope itself is never bucket-bound.
    std::string profileBucket() const;
    ConnectionConfig activeConfig() const;
    std::string activeBucket() const;

    // Attempts used by the last listAccessibleBuckets() call.
    int lastBucketListAttempts() const;

private:
    struct Candidate {
        std::string endpoint;
        AddressingStyle style;
        std::string region;
    };

    ConnectionConfig configFor(const ConnectionConfig &base,
                               const ConfigOverrides &overrides) const;
    bool probe(StorageClient &client, const std::string &bucket,
               OpError &err) const;

    ClientFactory factory_;
    mutable std::mutex mtx_;
    ConnectionConfig root_;
    std::string profileRegion_;
    std::string profileBucket_;
    BucketBinding active_;
    int lastAttempts_ = 0;
};

} // namespace opens3
