#include "opens3/MockStorageClient.hpp"
#include "opens3/EndpointHeuristics.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>

namespace opens3 {

namespace {

std::uint64_t nowEpoch() {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

std::string fakeEtag(const std::string &data) {
    return "\"" + std::to_string(std::hash<std::string>{}(data)) + "\"";
}

std::string effectiveRegion(const ConnectionConfig &cfg) {
    return cfg.region.empty() ? std::string("us-east-1") : cfg.region;
}

OpError backendError(ErrorKind kind, const std::string &code, int status,
                     const std::string &msg) {
    OpError e;
    e.kind = kind;
    e.code = code;
    e.http_status = status;
    e.message = msg;
    return e;
}

} // namespace

MockBucket &MockStorageBackend::addBucket(const std::string &name,
                                          const std::string &region) {
    std::lock_guard<std::mutex> lk(mtx);
    MockBucket &b = buckets[name];
    b.region = region;
    if (b.created == 0)
        b.created = nowEpoch();
    return b;
}

void MockStorageBackend::putObject(const std::string &bucket,
                                   const std::string &key, std::string data,
                                   std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(mtx);
    MockObject o;
    o.data = std::move(data);
    o.mtime = mtime ? mtime : nowEpoch();
    buckets[bucket].objects[key] = std::move(o);
}

bool MockStorageBackend::hasObject(const std::string &bucket,
                                   const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx);
    auto b = buckets.find(bucket);
    return b != buckets.end() && b->second.objects.count(key) > 0;
}

std::size_t MockStorageBackend::callCount(const std::string &op) const {
    std::lock_guard<std::mutex> lk(mtx);
    const std::string prefix = op + " ";
    return static_cast<std::size_t>(
        std::count_if(calls.begin(), calls.end(), [&](const std::string &c) {
            return c.compare(0, prefix.size(), prefix) == 0;
        }));
}

MockStorageClient::MockStorageClient(
    std::shared_ptr<MockStorageBackend> backend, ConnectionConfig cfg)
    : backend_(std::move(backend)), cfg_(std::move(cfg)) {}

ClientFactory
MockStorageClient::factory(std::shared_ptr<MockStorageBackend> backend) {
    return [backend](const ConnectionConfig &cfg) {
        return std::make_shared<MockStorageClient>(backend, cfg);
    };
}

void MockStorageClient::logCall(const std::string &op,
                                const std::string &bucket,
                                const std::string &key) {
    backend_->calls.push_back(op + " " + bucket + " " + key +
                              " region=" + effectiveRegion(cfg_) +
                              " endpoint=" + normalizeEndpoint(cfg_.endpoint) +
                              " style=" +
                              addressingStyleName(cfg_.addressing_style));
}

bool MockStorageClient::checkBucketAccess(const std::string &bucket,
                                          MockBucket *&out, OpError &err) {
    if (backend_->unreachable_buckets.count(bucket)) {
        err = backendError(ErrorKind::Network, "", 0,
                           "Could not resolve host for bucket " + bucket);
        return false;
    }
    auto it = backend_->buckets.find(bucket);
    if (it == backend_->buckets.end()) {
        err = backendError(ErrorKind::NotFound, "NoSuchBucket", 404,
                           "The specified bucket does not exist");
        err.bucket = bucket;
        return false;
    }
    MockBucket &b = it->second;
    if (!b.endpoint.empty() &&
        normalizeEndpoint(b.endpoint) != normalizeEndpoint(cfg_.endpoint)) {
        err = backendError(
            ErrorKind::PermanentRedirect, "PermanentRedirect", 301,
            "The bucket you are attempting to access must be addressed using "
            "the specified endpoint. Please send all future requests to this "
            "endpoint.");
        err.bucket = bucket;
        err.suggested_endpoint = b.redirect_host;
        err.region_hint = b.region;
        return false;
    }
    if (b.required_style && *b.required_style != cfg_.addressing_style) {
        if (*b.required_style == AddressingStyle::Path) {
            err = backendError(ErrorKind::Network, "", 0,
                               "Could not resolve host: " + bucket + "." +
                                   endpointAuthority(cfg_.endpoint));
        } else {
            err = backendError(
                ErrorKind::PermanentRedirect, "PermanentRedirect", 301,
                "The bucket you are attempting to access must be addressed "
                "using the specified endpoint.");
            err.suggested_endpoint = b.redirect_host;
            err.region_hint = b.region;
        }
        err.bucket = bucket;
        return false;
    }
    if (!b.region.empty() && b.region != effectiveRegion(cfg_)) {
        err = backendError(ErrorKind::RegionMismatch,
                           "AuthorizationHeaderMalformed", 400,
                           "The authorization header is malformed; the region '" +
                               effectiveRegion(cfg_) + "' is wrong; expecting '" +
                               b.region + "'");
        err.bucket = bucket;
        err.region_hint = b.region;
        return false;
    }
    if (b.deny_access) {
        err = backendError(ErrorKind::AccessDenied, "AccessDenied", 403,
                           "Access Denied");
        err.bucket = bucket;
        return false;
    }
    out = &b;
    return true;
}

bool MockStorageClient::listObjects(const std::string &bucket,
                                    const std::string &prefix,
                                    const std::string &delimiter,
                                    const std::string &continuation_token,
                                    int max_keys, ListPage &out,
                                    OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("ListObjectsV2", bucket, prefix);
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;

    struct Entry {
        std::string name;
        const MockObject *obj;
    };
    std::vector<Entry> entries;
    std::string lastPrefix;
    for (auto it = b->objects.lower_bound(prefix); it != b->objects.end();
         ++it) {
        const std::string &key = it->first;
        if (key.compare(0, prefix.size(), prefix) != 0)
            break;
        if (!delimiter.empty()) {
            const std::string rest = key.substr(prefix.size());
            const auto pos = rest.find(delimiter);
            if (pos != std::string::npos) {
                const std::string cp =
                    prefix + rest.substr(0, pos + delimiter.size());
                if (cp != lastPrefix) {
                    entries.push_back({cp, nullptr});
                    lastPrefix = cp;
                }
                continue;
            }
        }
        entries.push_back({key, &it->second});
    }

    std::size_t start = 0;
    if (!continuation_token.empty()) {
        try {
            start = static_cast<std::size_t>(std::stoul(continuation_token));
        } catch (const std::exception &) {
            err = backendError(ErrorKind::Backend, "InvalidArgument", 400,
                               "The continuation token provided is incorrect");
            return false;
        }
    }
    int limit = max_keys > 0 ? max_keys : 1000;
    limit = std::min(limit, std::max(1, backend_->page_limit));
    const std::size_t end =
        std::min(entries.size(), start + static_cast<std::size_t>(limit));

    out = ListPage{};
    for (std::size_t i = start; i < end; ++i) {
        const Entry &e = entries[i];
        if (!e.obj) {
            out.common_prefixes.push_back(e.name);
            continue;
        }
        ObjectEntry oe;
        oe.key = e.name;
        oe.size = e.obj->data.size();
        oe.mtime = e.obj->mtime;
        oe.etag = fakeEtag(e.obj->data);
        out.objects.push_back(std::move(oe));
    }
    out.truncated = end < entries.size();
    if (out.truncated)
        out.next_token = std::to_string(end);
    return true;
}

bool MockStorageClient::listBuckets(std::vector<BucketSummary> &out,
                                    OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("ListBuckets", "", "");
    if (!backend_->root_endpoint.empty() &&
        normalizeEndpoint(backend_->root_endpoint) !=
            normalizeEndpoint(cfg_.endpoint)) {
        err = backendError(ErrorKind::Network, "", 0,
                           "Could not connect to " + cfg_.endpoint);
        return false;
    }
    const std::string region = effectiveRegion(cfg_);
    std::string expected;
    if (backend_->list_buckets_hint)
        expected = backend_->list_buckets_hint(region);
    else if (!backend_->list_buckets_region.empty() &&
             backend_->list_buckets_region != region)
        expected = backend_->list_buckets_region;
    if (!expected.empty()) {
        err = backendError(ErrorKind::RegionMismatch,
                           "AuthorizationHeaderMalformed", 400,
                           "The authorization header is malformed; the region '" +
                               region + "' is wrong; expecting '" + expected +
                               "'");
        err.region_hint = expected;
        return false;
    }
    out.clear();
    for (const auto &kv : backend_->buckets)
        out.push_back({kv.first, kv.second.created});
    return true;
}

bool MockStorageClient::headObject(const std::string &bucket,
                                   const std::string &key, ObjectInfo &out,
                                   OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("HeadObject", bucket, key);
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;
    auto it = b->objects.find(key);
    if (it == b->objects.end()) {
        err = backendError(ErrorKind::NotFound, "NoSuchKey", 404,
                           "The specified key does not exist.");
        err.bucket = bucket;
        err.key = key;
        return false;
    }
    out = ObjectInfo{};
    out.key = key;
    out.size = it->second.data.size();
    out.mtime = it->second.mtime;
    std::string etag = fakeEtag(it->second.data);
    etag.erase(std::remove(etag.begin(), etag.end(), '"'), etag.end());
    out.etag = etag;
    out.content_type = "binary/octet-stream";
    return true;
}

bool MockStorageClient::getObject(const std::string &bucket,
                                  const std::string &key,
                                  const std::string &local_path, OpError &err,
                                  ProgressCB progress, CancelCB shouldCancel) {
    std::string data;
    bool failMidway = false;
    {
        std::lock_guard<std::mutex> lk(backend_->mtx);
        logCall("GetObject", bucket, key);
        MockBucket *b = nullptr;
        if (!checkBucketAccess(bucket, b, err))
            return false;
        auto it = b->objects.find(key);
        if (it == b->objects.end()) {
            err = backendError(ErrorKind::NotFound, "NoSuchKey", 404,
                               "The specified key does not exist.");
            err.bucket = bucket;
            err.key = key;
            return false;
        }
        data = it->second.data;
        failMidway = backend_->fail_keys.count(key) > 0;
    }

    std::ofstream outFile(local_path, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        err = OpError::make(ErrorKind::LocalIo,
                            "Cannot open local file for writing: " + local_path);
        return false;
    }
    const std::uint64_t total = data.size();
    const std::uint64_t chunk = std::max<std::uint64_t>(1, cfg_.part_size);
    std::uint64_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err = OpError::cancelled();
            return false;
        }
        if (failMidway && done > 0) {
            err = backendError(ErrorKind::Network, "", 0,
                               "Connection reset by peer");
            err.key = key;
            return false;
        }
        const std::uint64_t n = std::min(chunk, total - done);
        outFile.write(data.data() + done, static_cast<std::streamsize>(n));
        if (!outFile) {
            err = OpError::make(ErrorKind::LocalIo,
                                "Write failed: " + local_path);
            return false;
        }
        done += n;
        if (progress)
            progress(done, total);
    }
    return true;
}

bool MockStorageClient::putObject(const std::string &bucket,
                                  const std::string &key,
                                  const std::string &local_path, OpError &err,
                                  ProgressCB progress, CancelCB shouldCancel) {
    {
        std::lock_guard<std::mutex> lk(backend_->mtx);
        logCall("PutObject", bucket, key);
        MockBucket *b = nullptr;
        if (!checkBucketAccess(bucket, b, err))
            return false;
    }
    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        err = OpError::make(ErrorKind::LocalIo,
                            "Cannot open local file: " + local_path);
        return false;
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    const std::uint64_t total = content.size();
    const bool multipart = total > cfg_.multipart_threshold;
    const bool failMidway = [&] {
        std::lock_guard<std::mutex> lk(backend_->mtx);
        return backend_->fail_keys.count(key) > 0;
    }();

    auto abortUpload = [&]() {
        if (!multipart)
            return;
        std::lock_guard<std::mutex> lk(backend_->mtx);
        logCall("AbortMultipartUpload", bucket, key);
    };

    const std::uint64_t chunk = std::max<std::uint64_t>(1, cfg_.part_size);
    std::uint64_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            abortUpload();
            err = OpError::cancelled();
            return false;
        }
        if (failMidway && done > 0) {
            abortUpload();
            err = backendError(ErrorKind::Network, "", 0,
                               "Connection reset by peer");
            err.key = key;
            return false;
        }
        done += std::min(chunk, total - done);
        if (progress)
            progress(done, total);
    }

    std::lock_guard<std::mutex> lk(backend_->mtx);
    MockObject o;
    o.data = content;
    o.mtime = nowEpoch();
    backend_->buckets[bucket].objects[key] = std::move(o);
    return true;
}

bool MockStorageClient::putEmptyObject(const std::string &bucket,
                                       const std::string &key, OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("PutObject", bucket, key);
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;
    MockObject o;
    o.mtime = nowEpoch();
    b->objects[key] = std::move(o);
    return true;
}

bool MockStorageClient::deleteObject(const std::string &bucket,
                                     const std::string &key, OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("DeleteObject", bucket, key);
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;
    if (backend_->fail_keys.count(key)) {
        err = backendError(ErrorKind::AccessDenied, "AccessDenied", 403,
                           "Access Denied");
        err.bucket = bucket;
        err.key = key;
        return false;
    }
    b->objects.erase(key); // deleting a missing key succeeds, as on S3
    return true;
}

bool MockStorageClient::presignGetUrl(const std::string &bucket,
                                      const std::string &key,
                                      std::uint64_t ttl_sec, std::string &url,
                                      OpError &err) {
    if (bucket.empty() || key.empty()) {
        err = OpError::make(ErrorKind::InvalidArgument,
                            "Bucket and key are required");
        return false;
    }
    const std::string endpoint = normalizeEndpoint(cfg_.endpoint);
    const std::string query = "?X-Amz-Expires=" + std::to_string(ttl_sec) +
                              "&X-Amz-Signature=mock";
    if (cfg_.addressing_style == AddressingStyle::Path) {
        url = endpoint + "/" + bucket + "/" + key + query;
    } else {
        const std::string authority = endpointAuthority(endpoint);
        const std::string host = hostEmbedsBucket(authority, bucket)
                                     ? authority
                                     : bucket + "." + authority;
        url = endpointScheme(endpoint) + "://" + host + "/" + key + query;
    }
    return true;
}

bool MockStorageClient::setPublicRead(const std::string &bucket,
                                      const std::string &key, OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("PutObjectAcl", bucket, key);
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;
    if (!b->acl_supported) {
        err = backendError(ErrorKind::NotSupported, "NotImplemented", 501,
                           "A header you provided implies functionality that "
                           "is not implemented");
        err.bucket = bucket;
        err.key = key;
        return false;
    }
    auto it = b->objects.find(key);
    if (it == b->objects.end()) {
        err = backendError(ErrorKind::NotFound, "NoSuchKey", 404,
                           "The specified key does not exist.");
        err.bucket = bucket;
        err.key = key;
        return false;
    }
    it->second.public_read = true;
    return true;
}

bool MockStorageClient::createBucket(const std::string &bucket, OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("CreateBucket", bucket, "");
    if (backend_->buckets.count(bucket)) {
        err = backendError(ErrorKind::Backend, "BucketAlreadyOwnedByYou", 409,
                           "Your previous request to create the named bucket "
                           "succeeded and you already own it.");
        err.bucket = bucket;
        return false;
    }
    MockBucket &b = backend_->buckets[bucket];
    b.region = cfg_.region;
    b.created = nowEpoch();
    return true;
}

bool MockStorageClient::deleteBucket(const std::string &bucket, OpError &err) {
    std::lock_guard<std::mutex> lk(backend_->mtx);
    logCall("DeleteBucket", bucket, "");
    MockBucket *b = nullptr;
    if (!checkBucketAccess(bucket, b, err))
        return false;
    if (!b->objects.empty()) {
        err = backendError(ErrorKind::NotEmpty, "BucketNotEmpty", 409,
                           "The bucket you tried to delete is not empty");
        err.bucket = bucket;
        return false;
    }
    backend_->buckets.erase(bucket);
    return true;
}

} // namespace opens3
