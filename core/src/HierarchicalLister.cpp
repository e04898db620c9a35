#include "opens3/HierarchicalLister.hpp"
#include "opens3/EndpointHeuristics.hpp"
#include "opens3/KeyPaths.hpp"

#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(osList, "opens3.list")

namespace opens3 {

namespace {

constexpr int kPageSize = 1000;

QString q(const std::string &s) { return QString::fromStdString(s); }

OpError listError(const OpError &cause, const Location &loc) {
    OpError e = cause.rewrap(ErrorKind::List);
    e.bucket = loc.bucket;
    e.prefix = loc.prefix.empty() ? std::string("/") : loc.prefix;
    return e;
}

} // namespace

bool HierarchicalLister::listLevel(StorageClient &client, const Location &loc,
                                   std::vector<FSObject> &out, OpError &err) {
    std::vector<FSObject> entries;
    std::string token;
    do {
        ListPage page;
        if (!client.listObjects(loc.bucket, loc.prefix, "/", token, kPageSize,
                                page, err))
            return false;
        for (const std::string &cp : page.common_prefixes) {
            FSObject f;
            f.kind = FSObjectKind::Folder;
            f.name = lastSegment(cp);
            entries.push_back(std::move(f));
        }
        for (const ObjectEntry &o : page.objects) {
            if (o.key == loc.prefix)
                continue;
            FSObject f;
            f.kind = FSObjectKind::File;
            f.name = lastSegment(o.key);
            f.size = o.size;
            f.mtime = o.mtime;
            entries.push_back(std::move(f));
        }
        if (page.truncated && page.next_token.empty()) {
            err = OpError::make(ErrorKind::Backend,
                                "Truncated listing without continuation token");
            return false;
        }
        token = page.truncated ? page.next_token : std::string();
    } while (!token.empty());
    out = std::move(entries);
    return true;
}

bool HierarchicalLister::list(const Location &loc, std::vector<FSObject> &out,
                              OpError &err) {
    if (loc.isBucketList()) {
        std::vector<BucketSummary> buckets;
        if (!binder_.listAccessibleBuckets(buckets, err))
            return false;
        out.clear();
        for (const BucketSummary &b : buckets) {
            FSObject f;
            f.kind = FSObjectKind::Bucket;
            f.name = b.name;
            f.mtime = b.created;
            out.push_back(std::move(f));
        }
        return true;
    }

    BucketBinding binding = binder_.snapshot();
    if (!binding.client) {
        err = listError(OpError::make(ErrorKind::Backend, "No storage client"), loc);
        return false;
    }
    OpError first;
    if (listLevel(*binding.client, loc, out, first)) {
        qCDebug(osList) << "listed" << q(loc.bucket) << q(loc.prefix)
                        << static_cast<int>(out.size()) << "entries";
        return true;
    }

    std::string hint;
    if (first.kind == ErrorKind::RegionMismatch) {
        hint = first.region_hint;
        if (hint.empty())
            hint = regionFromErrorMessage(first.message);
    }
    if (hint.empty() || hint == binding.config.region) {
        err = listError(first, loc);
        qCWarning(osList) << "listing failed:" << q(err.describe());
        return false;
    }

    qCInfo(osList) << "region mismatch listing" << q(loc.bucket)
                   << "retrying with" << q(hint);
    ConfigOverrides ov;
    ov.endpoint = binding.config.endpoint;
    ov.addressing_style = binding.config.addressing_style;
    ov.bucket = binding.config.bucket;
    ov.region = hint;
    auto retryClient = binder_.buildClient(ov);
    OpError second;
    if (!retryClient || !listLevel(*retryClient, loc, out, second)) {
        err = listError(retryClient ? second : first, loc);
        qCWarning(osList) << "listing failed after region retry:"
                          << q(err.describe());
        return false;
    }
    binder_.promoteRegion(hint);
    return true;
}

bool HierarchicalLister::collectObjects(StorageClient &client,
                                        const std::string &bucket,
                                        const std::string &prefix,
                                        std::vector<ObjectEntry> &out,
                                        OpError &err,
                                        StorageClient::CancelCB shouldCancel) {
    std::string token;
    do {
        if (shouldCancel && shouldCancel()) {
            err = OpError::cancelled();
            return false;
        }
        ListPage page;
        if (!client.listObjects(bucket, prefix, "", token, kPageSize, page, err)) {
            if (err.bucket.empty())
                err.bucket = bucket;
            if (err.prefix.empty())
                err.prefix = prefix;
            return false;
        }
        out.insert(out.end(), page.objects.begin(), page.objects.end());
        token = page.truncated ? page.next_token : std::string();
    } while (!token.empty());
    return true;
}

bool HierarchicalLister::totalSize(const std::string &bucket,
                                   const std::string &prefix,
                                   std::uint64_t &bytes, OpError &err) {
    BucketBinding binding = binder_.snapshot();
    if (!binding.client) {
        err = OpError::make(ErrorKind::Backend, "No storage client");
        return false;
    }
    std::vector<ObjectEntry> objects;
    if (!collectObjects(*binding.client, bucket, prefix, objects, err)) {
        err = listError(err, {bucket, prefix});
        return false;
    }
    std::uint64_t sum = 0;
    for (const ObjectEntry &o : objects) {
        if (!isFolderKey(o.key))
            sum += o.size;
    }
    bytes = sum;
    return true;
}

} // namespace opens3
