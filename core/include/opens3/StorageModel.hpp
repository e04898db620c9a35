// Facade consumed by front ends: navigation state over one ConnectionBinder
// and one HierarchicalLister, plus ad hoc object operations.
#pragma once
#include "ConnectionBinder.hpp"
#include "HierarchicalLister.hpp"

namespace opens3 {

enum class AclResult { Applied, NotSupported, Failed };

struct ObjectProperties {
    std::string display_name;  // key, or "<bucket>/" for a bucket root
    std::string bucket;
    std::string key;
    bool is_folder = false;
    std::uint64_t size = 0;    // folders: recursive total
    std::uint64_t mtime = 0;
    std::string etag;
    std::string content_type;
};

class StorageModel {
public:
    StorageModel(ConnectionConfig cfg, ClientFactory factory);

    // Profile switch. Drops any binding and returns to bucket-list mode.
    void setConfig(const ConnectionConfig &cfg);
    ConnectionConfig rootConfig() const { return binder_.rootConfig(); }

    const Location &currentLocation() const { return current_; }
    const Location &previousLocation() const { return previous_; }

    // All navigation calls list the target and make it current on success.
    // A failure drops the view back to bucket-list mode and returns the
    // listing error.
    bool navigate(const Location &loc, std::vector<FSObject> &out,
                  OpError &err);
    bool refresh(std::vector<FSObject> &out, OpError &err);
    bool enterBucket(const std::string &name, std::vector<FSObject> &out,
                     OpError &err);
    bool enterFolder(const std::string &name, std::vector<FSObject> &out,
                     OpError &err);
    bool goUp(std::vector<FSObject> &out, OpError &err);
    bool goBack(std::vector<FSObject> &out, OpError &err);
    bool goHome(std::vector<FSObject> &out, OpError &err);
    bool leaveToBucketList(std::vector<FSObject> &out, OpError &err);

    // Keys below are relative to the current bucket.
    bool headObject(const std::string &key, ObjectInfo &out, OpError &err);
    bool totalSize(const std::string &prefix, std::uint64_t &bytes,
                   OpError &err);
    bool bucketUsage(std::uint64_t &bytes, OpError &err);
    bool presignedUrl(const std::string &key, std::uint64_t ttl_sec,
                      std::string &url, OpError &err);
    AclResult setPublicReadAcl(const std::string &key, OpError &err);
    bool objectProperties(const std::string &key, ObjectProperties &out,
                          OpError &err);

    // True in `visible` when the bucket shows up in the accessible list.
    bool checkBucket(const std::string &name, bool &visible, OpError &err);
    // Writes then deletes a random probe object to prove write access.
    bool checkProfile(OpError &err);
    bool createBucket(const std::string &name, OpError &err);
    // Refused with ErrorKind::NotEmpty while anything is left in the bucket.
    bool deleteBucket(const std::string &name, OpError &err);

    // Client and bucket a job should run against.
    BucketBinding bindingSnapshot() { return binder_.snapshot(); }

    ConnectionBinder &binder() { return binder_; }
    HierarchicalLister &lister() { return lister_; }

private:
    bool requireBucket(OpError &err) const;
    void fallBackToBucketList(std::vector<FSObject> &out);
    std::shared_ptr<StorageClient> rootClientFor(const std::string &bucket);

    ConnectionBinder binder_;
    HierarchicalLister lister_;
    Location current_;
    Location previous_;
};

} // namespace opens3
