#include "opens3/StorageModel.hpp"
#include "opens3/KeyPaths.hpp"
#include "opens3/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cstdio>
#include <random>

Q_LOGGING_CATEGORY(osModel, "opens3.model")

namespace opens3 {

namespace {

QString q(const std::string &s) { return QString::fromStdString(s); }

std::string randomProbeKey() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(gen()));
    return std::string(".opens3-probe-") + buf;
}

} // namespace

StorageModel::StorageModel(ConnectionConfig cfg, ClientFactory factory)
    : binder_(std::move(cfg), std::move(factory)), lister_(binder_) {}

void StorageModel::setConfig(const ConnectionConfig &cfg) {
    binder_.setConfig(cfg);
    previous_ = current_;
    current_ = Location{};
}

bool StorageModel::requireBucket(OpError &err) const {
    if (!current_.isBucketList())
        return true;
    err = OpError::make(ErrorKind::InvalidArgument, "No bucket selected");
    return false;
}

void StorageModel::fallBackToBucketList(std::vector<FSObject> &out) {
    binder_.returnToRootScope();
    if (!current_.isBucketList())
        previous_ = current_;
    current_ = Location{};
    OpError lerr;
    if (!lister_.list(current_, out, lerr)) {
        out.clear();
        qCWarning(osModel) << "bucket list unavailable after fallback:"
                           << q(lerr.describe());
    }
}

bool StorageModel::navigate(const Location &target, std::vector<FSObject> &out,
                            OpError &err) {
    Location loc = target;
    if (loc.isBucketList()) {
        loc.prefix.clear();
        binder_.returnToRootScope();
    } else {
        loc.prefix = normalizePrefix(loc.prefix);
        if (binder_.activeBucket() != loc.bucket) {
            BucketBinding binding;
            if (!binder_.bindBucket(loc.bucket, binding, err)) {
                qCWarning(osModel) << "cannot bind" << q(loc.bucket) << ":"
                                   << q(err.describe());
                fallBackToBucketList(out);
                return false;
            }
        }
    }

    std::vector<FSObject> entries;
    if (!lister_.list(loc, entries, err)) {
        qCWarning(osModel) << "navigation to" << q(loc.bucket) << q(loc.prefix)
                           << "failed:" << q(err.describe());
        if (!loc.isBucketList())
            fallBackToBucketList(out);
        else
            current_ = Location{};
        return false;
    }
    if (loc != current_)
        previous_ = current_;
    current_ = loc;
    out = std::move(entries);
    return true;
}

bool StorageModel::refresh(std::vector<FSObject> &out, OpError &err) {
    return navigate(current_, out, err);
}

bool StorageModel::enterBucket(const std::string &name,
                               std::vector<FSObject> &out, OpError &err) {
    if (name.empty()) {
        err = OpError::make(ErrorKind::InvalidArgument, "Bucket name is empty");
        return false;
    }
    return navigate(Location{name, {}}, out, err);
}

bool StorageModel::enterFolder(const std::string &name,
                               std::vector<FSObject> &out, OpError &err) {
    if (!requireBucket(err))
        return false;
    return navigate(Location{current_.bucket, childPrefix(current_.prefix, name)},
                    out, err);
}

bool StorageModel::goUp(std::vector<FSObject> &out, OpError &err) {
    return navigate(parentLocation(current_), out, err);
}

bool StorageModel::goBack(std::vector<FSObject> &out, OpError &err) {
    return navigate(previous_, out, err);
}

bool StorageModel::goHome(std::vector<FSObject> &out, OpError &err) {
    if (current_.isBucketList())
        return navigate(Location{}, out, err);
    return navigate(Location{current_.bucket, {}}, out, err);
}

bool StorageModel::leaveToBucketList(std::vector<FSObject> &out, OpError &err) {
    return navigate(Location{}, out, err);
}

bool StorageModel::headObject(const std::string &key, ObjectInfo &out,
                              OpError &err) {
    if (!requireBucket(err))
        return false;
    BucketBinding b = binder_.snapshot();
    if (!b.client->headObject(current_.bucket, key, out, err)) {
        if (err.key.empty())
            err.key = key;
        return false;
    }
    return true;
}

bool StorageModel::totalSize(const std::string &prefix, std::uint64_t &bytes,
                             OpError &err) {
    if (!requireBucket(err))
        return false;
    return lister_.totalSize(current_.bucket, normalizePrefix(prefix), bytes,
                             err);
}

bool StorageModel::bucketUsage(std::uint64_t &bytes, OpError &err) {
    if (!requireBucket(err))
        return false;
    return lister_.totalSize(current_.bucket, {}, bytes, err);
}

bool StorageModel::presignedUrl(const std::string &key, std::uint64_t ttl_sec,
                                std::string &url, OpError &err) {
    if (!requireBucket(err))
        return false;
    BucketBinding b = binder_.snapshot();
    if (!b.client->presignGetUrl(current_.bucket, key, ttl_sec, url, err))
        return false;
    qCInfo(osModel) << "presigned" << q(key) << "ttl" << ttl_sec
                    << q(redactUrlForLog(url));
    return true;
}

AclResult StorageModel::setPublicReadAcl(const std::string &key, OpError &err) {
    if (!requireBucket(err))
        return AclResult::Failed;
    BucketBinding b = binder_.snapshot();
    if (b.client->setPublicRead(current_.bucket, key, err))
        return AclResult::Applied;
    if (err.kind == ErrorKind::NotSupported) {
        qCInfo(osModel) << "ACL not supported by backend for" << q(key);
        return AclResult::NotSupported;
    }
    qCWarning(osModel) << "ACL change failed:" << q(err.describe());
    return AclResult::Failed;
}

bool StorageModel::objectProperties(const std::string &key,
                                    ObjectProperties &out, OpError &err) {
    if (!requireBucket(err))
        return false;
    ObjectProperties p;
    p.bucket = current_.bucket;
    p.key = key;
    if (key.empty() || isFolderKey(key)) {
        p.is_folder = true;
        p.display_name = key.empty() ? current_.bucket + "/" : key;
        if (!lister_.totalSize(current_.bucket, key, p.size, err))
            return false;
        out = std::move(p);
        return true;
    }
    ObjectInfo info;
    if (!headObject(key, info, err))
        return false;
    p.display_name = key;
    p.size = info.size;
    p.mtime = info.mtime;
    p.etag = info.etag;
    p.etag.erase(std::remove(p.etag.begin(), p.etag.end(), '"'), p.etag.end());
    p.content_type = info.content_type;
    out = std::move(p);
    return true;
}

bool StorageModel::checkBucket(const std::string &name, bool &visible,
                               OpError &err) {
    std::vector<BucketSummary> buckets;
    if (!binder_.listAccessibleBuckets(buckets, err))
        return false;
    visible = std::any_of(buckets.begin(), buckets.end(),
                          [&](const BucketSummary &b) { return b.name == name; });
    return true;
}

bool StorageModel::checkProfile(OpError &err) {
    std::string bucket = current_.bucket;
    if (bucket.empty())
        bucket = binder_.profileBucket();
    if (bucket.empty()) {
        // Nothing to write to: reading the bucket list proves the credentials.
        std::vector<BucketSummary> buckets;
        return binder_.listAccessibleBuckets(buckets, err);
    }
    BucketBinding binding;
    bool boundHere = false;
    if (binder_.activeBucket() == bucket) {
        binding = binder_.snapshot();
    } else if (!binder_.bindBucket(bucket, binding, err)) {
        return false;
    } else {
        boundHere = current_.isBucketList();
    }
    const std::string key = randomProbeKey();
    const bool ok = binding.client->putEmptyObject(bucket, key, err);
    if (!ok)
        qCWarning(osModel) << "profile check write failed:" << q(err.describe());
    const bool cleaned = ok && binding.client->deleteObject(bucket, key, err);
    if (ok && !cleaned)
        qCWarning(osModel) << "profile check cleanup failed:" << q(err.describe());
    // The bucket list stays root-scoped.
    if (boundHere)
        binder_.returnToRootScope();
    if (!cleaned)
        return false;
    qCInfo(osModel) << "profile check ok for" << q(bucket);
    return true;
}

std::shared_ptr<StorageClient>
StorageModel::rootClientFor(const std::string &bucket) {
    ConfigOverrides ov;
    ov.bucket = bucket;
    return binder_.buildClient(ov);
}

bool StorageModel::createBucket(const std::string &name, OpError &err) {
    if (name.empty()) {
        err = OpError::make(ErrorKind::InvalidArgument, "Bucket name is empty");
        return false;
    }
    auto client = rootClientFor(name);
    if (!client->createBucket(name, err))
        return false;
    qCInfo(osModel) << "created bucket" << q(name);
    return true;
}

bool StorageModel::deleteBucket(const std::string &name, OpError &err) {
    if (name.empty()) {
        err = OpError::make(ErrorKind::InvalidArgument, "Bucket name is empty");
        return false;
    }
    std::shared_ptr<StorageClient> client;
    if (binder_.activeBucket() == name) {
        client = binder_.snapshot().client;
    } else {
        client = rootClientFor(name);
    }
    ListPage page;
    if (!client->listObjects(name, "", "", "", 1, page, err))
        return false;
    if (!page.objects.empty() || !page.common_prefixes.empty()) {
        err = OpError::make(ErrorKind::NotEmpty, "Bucket is not empty");
        err.bucket = name;
        return false;
    }
    if (!client->deleteBucket(name, err))
        return false;
    if (current_.bucket == name) {
        binder_.returnToRootScope();
        previous_ = Location{};
        current_ = Location{};
    }
    qCInfo(osModel) << "deleted bucket" << q(name);
    return true;
}

} // namespace opens3
