#include "opens3/AwsS3StorageClient.hpp"
#include "opens3/EndpointHeuristics.hpp"
#include "opens3/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <QString>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/core/utils/xml/XmlSerializer.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteBucketRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectAclRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

Q_LOGGING_CATEGORY(osAws, "opens3.aws")

namespace opens3 {

namespace {

const char *kTag = "opens3";

QString q(const std::string &s) { return QString::fromStdString(s); }

std::string xmlChild(const Aws::S3::S3Error &e, const char *name) {
    const Aws::Utils::Xml::XmlDocument &doc = e.GetXmlPayload();
    if (!doc.WasParseSuccessful())
        return {};
    Aws::Utils::Xml::XmlNode node = doc.GetRootElement().FirstChild(name);
    return node.IsNull() ? std::string() : std::string(node.GetText().c_str());
}

std::string header(const Aws::S3::S3Error &e, const char *name) {
    const auto &headers = e.GetResponseHeaders();
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : std::string(it->second.c_str());
}

// Maps an SDK error onto OpError without touching the backend's text.
OpError fromAws(const Aws::S3::S3Error &e, const std::string &bucket,
                const std::string &key) {
    OpError o;
    o.code = e.GetExceptionName().c_str();
    o.message = e.GetMessage().c_str();
    o.http_status = static_cast<int>(e.GetResponseCode());
    o.bucket = bucket;
    o.key = key;

    if (e.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE ||
        e.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION) {
        o.kind = ErrorKind::Network;
        o.http_status = 0;
        return o;
    }

    o.region_hint = header(e, "x-amz-bucket-region");
    if (o.region_hint.empty())
        o.region_hint = xmlChild(e, "Region");

    if (o.code == "PermanentRedirect" || o.code == "TemporaryRedirect" ||
        o.http_status == 301 || o.http_status == 307) {
        o.kind = ErrorKind::PermanentRedirect;
        o.suggested_endpoint = xmlChild(e, "Endpoint");
        return o;
    }
    const std::string expected = regionFromErrorMessage(o.message);
    if (o.code == "AuthorizationHeaderMalformed" ||
        o.code == "IllegalLocationConstraintException" || !expected.empty()) {
        o.kind = ErrorKind::RegionMismatch;
        if (!expected.empty())
            o.region_hint = expected;
        return o;
    }
    switch (e.GetErrorType()) {
    case Aws::S3::S3Errors::ACCESS_DENIED:
        o.kind = ErrorKind::AccessDenied;
        return o;
    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
    case Aws::S3::S3Errors::NO_SUCH_KEY:
    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
        o.kind = ErrorKind::NotFound;
        return o;
    default:
        break;
    }
    if (o.http_status == 403)
        o.kind = ErrorKind::AccessDenied;
    else if (o.http_status == 404)
        o.kind = ErrorKind::NotFound;
    else if (o.http_status == 501 || o.code == "NotImplemented")
        o.kind = ErrorKind::NotSupported;
    else if (o.code == "BucketNotEmpty")
        o.kind = ErrorKind::NotEmpty;
    else
        o.kind = ErrorKind::Backend;
    return o;
}

std::uint64_t seconds(const Aws::Utils::DateTime &t) {
    const auto s = t.Seconds();
    return s > 0 ? static_cast<std::uint64_t>(s) : 0;
}

std::string stripQuotes(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
    return s;
}

} // namespace

struct AwsSdkSession::Impl {
    Aws::SDKOptions options;
};

AwsSdkSession::AwsSdkSession() : impl_(std::make_unique<Impl>()) {
    impl_->options.loggingOptions.logLevel =
        awsTraceEnabled() ? Aws::Utils::Logging::LogLevel::Debug
                          : Aws::Utils::Logging::LogLevel::Off;
    Aws::InitAPI(impl_->options);
    qCInfo(osAws) << "aws sdk initialized";
}

AwsSdkSession::~AwsSdkSession() {
    Aws::ShutdownAPI(impl_->options);
    qCInfo(osAws) << "aws sdk shut down";
}

AwsS3StorageClient::AwsS3StorageClient(ConnectionConfig cfg)
    : cfg_(std::move(cfg)) {
    Aws::S3::S3ClientConfiguration cc;
    cc.region = cfg_.region.empty() ? "us-east-1" : cfg_.region.c_str();
    cc.connectTimeoutMs = static_cast<long>(cfg_.connect_timeout_sec) * 1000;
    cc.requestTimeoutMs = static_cast<long>(cfg_.request_timeout_sec) * 1000;
    cc.verifySSL = cfg_.verify_tls;
    cc.retryStrategy =
        Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kTag, cfg_.retries);
    cc.useVirtualAddressing = cfg_.addressing_style == AddressingStyle::Virtual;
    cc.payloadSigningPolicy =
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never;

    const std::string endpoint = normalizeEndpoint(cfg_.endpoint);
    if (!endpoint.empty()) {
        std::string authority = endpointAuthority(endpoint);
        // A bucket-specific host from a redirect: the SDK prepends the
        // bucket itself in virtual style.
        if (cc.useVirtualAddressing)
            authority = stripBucketLabel(authority, cfg_.bucket);
        cc.scheme = endpointScheme(endpoint) == "http" ? Aws::Http::Scheme::HTTP
                                                       : Aws::Http::Scheme::HTTPS;
        cc.endpointOverride = (endpointScheme(endpoint) + "://" + authority).c_str();
    }

    const Aws::Auth::AWSCredentials creds(cfg_.access_key.c_str(),
                                          cfg_.secret_key.c_str());
    s3_ = std::make_unique<Aws::S3::S3Client>(
        creds, Aws::MakeShared<Aws::S3::S3EndpointProvider>(kTag), cc);
    qCDebug(osAws) << "client" << q(endpoint) << q(cfg_.region)
                   << addressingStyleName(cfg_.addressing_style) << "key"
                   << q(redactForLog(cfg_.access_key));
}

AwsS3StorageClient::~AwsS3StorageClient() = default;

ClientFactory AwsS3StorageClient::factory() {
    return [](const ConnectionConfig &cfg) {
        return std::make_shared<AwsS3StorageClient>(cfg);
    };
}

bool AwsS3StorageClient::listObjects(const std::string &bucket,
                                     const std::string &prefix,
                                     const std::string &delimiter,
                                     const std::string &continuation_token,
                                     int max_keys, ListPage &out,
                                     OpError &err) {
    Aws::S3::Model::ListObjectsV2Request req;
    req.SetBucket(bucket.c_str());
    if (!prefix.empty())
        req.SetPrefix(prefix.c_str());
    if (!delimiter.empty())
        req.SetDelimiter(delimiter.c_str());
    if (!continuation_token.empty())
        req.SetContinuationToken(continuation_token.c_str());
    if (max_keys > 0)
        req.SetMaxKeys(max_keys);

    auto outcome = s3_->ListObjectsV2(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, {});
        err.prefix = prefix;
        return false;
    }
    const auto &r = outcome.GetResult();
    out = ListPage{};
    for (const auto &obj : r.GetContents()) {
        ObjectEntry e;
        e.key = obj.GetKey().c_str();
        e.size = static_cast<std::uint64_t>(obj.GetSize());
        e.mtime = seconds(obj.GetLastModified());
        e.etag = obj.GetETag().c_str();
        out.objects.push_back(std::move(e));
    }
    for (const auto &cp : r.GetCommonPrefixes())
        out.common_prefixes.push_back(cp.GetPrefix().c_str());
    out.truncated = r.GetIsTruncated();
    out.next_token = r.GetNextContinuationToken().c_str();
    return true;
}

bool AwsS3StorageClient::listBuckets(std::vector<BucketSummary> &out,
                                     OpError &err) {
    auto outcome = s3_->ListBuckets();
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), {}, {});
        return false;
    }
    out.clear();
    for (const auto &b : outcome.GetResult().GetBuckets())
        out.push_back({b.GetName().c_str(), seconds(b.GetCreationDate())});
    return true;
}

bool AwsS3StorageClient::headObject(const std::string &bucket,
                                    const std::string &key, ObjectInfo &out,
                                    OpError &err) {
    Aws::S3::Model::HeadObjectRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    auto outcome = s3_->HeadObject(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, key);
        return false;
    }
    const auto &r = outcome.GetResult();
    out = ObjectInfo{};
    out.key = key;
    out.size = static_cast<std::uint64_t>(r.GetContentLength());
    out.mtime = seconds(r.GetLastModified());
    out.etag = stripQuotes(r.GetETag().c_str());
    out.content_type = r.GetContentType().c_str();
    return true;
}

bool AwsS3StorageClient::getObject(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &local_path, OpError &err,
                                   ProgressCB progress, CancelCB shouldCancel) {
    {
        std::ofstream probe(local_path, std::ios::binary | std::ios::trunc);
        if (!probe.is_open()) {
            err = OpError::make(ErrorKind::LocalIo,
                                "Cannot open local file for writing: " + local_path);
            err.key = key;
            return false;
        }
    }

    Aws::S3::Model::GetObjectRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    req.SetResponseStreamFactory([local_path]() {
        return Aws::New<Aws::FStream>(kTag, local_path.c_str(),
                                      std::ios_base::out | std::ios_base::in |
                                          std::ios_base::binary |
                                          std::ios_base::trunc);
    });

    std::uint64_t done = 0;
    std::uint64_t total = 0;
    req.SetDataReceivedEventHandler(
        [&](const Aws::Http::HttpRequest *, Aws::Http::HttpResponse *resp,
            long long n) {
            if (total == 0 && resp && resp->HasHeader("content-length"))
                total = std::strtoull(resp->GetHeader("content-length").c_str(),
                                      nullptr, 10);
            done += static_cast<std::uint64_t>(n > 0 ? n : 0);
            // A retried range restarts the stream; never report past the end.
            if (total > 0)
                done = std::min(done, total);
            if (progress)
                progress(done, total);
        });
    if (shouldCancel) {
        req.SetContinueRequestHandler(
            [shouldCancel](const Aws::Http::HttpRequest *) {
                return !shouldCancel();
            });
    }

    auto outcome = s3_->GetObject(req);
    if (!outcome.IsSuccess()) {
        if (shouldCancel && shouldCancel()) {
            err = OpError::cancelled();
            return false;
        }
        err = fromAws(outcome.GetError(), bucket, key);
        return false;
    }
    return true;
}

bool AwsS3StorageClient::putObject(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &local_path, OpError &err,
                                   ProgressCB progress, CancelCB shouldCancel) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        err = OpError::make(ErrorKind::LocalIo,
                            "Cannot read local file " + local_path + ": " +
                                ec.message());
        err.key = key;
        return false;
    }
    if (static_cast<std::uint64_t>(size) > cfg_.multipart_threshold)
        return putMultipart(bucket, key, local_path, size, err, progress,
                            shouldCancel);

    auto body = Aws::MakeShared<Aws::FStream>(
        kTag, local_path.c_str(), std::ios_base::in | std::ios_base::binary);
    if (!body->good()) {
        err = OpError::make(ErrorKind::LocalIo, "Cannot open local file: " + local_path);
        err.key = key;
        return false;
    }
    Aws::S3::Model::PutObjectRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    req.SetBody(body);
    req.SetContentLength(static_cast<long long>(size));

    std::uint64_t sent = 0;
    const std::uint64_t total = size;
    req.SetDataSentEventHandler(
        [&](const Aws::Http::HttpRequest *, long long n) {
            sent = std::min(total, sent + static_cast<std::uint64_t>(n > 0 ? n : 0));
            if (progress)
                progress(sent, total);
        });
    if (shouldCancel) {
        req.SetContinueRequestHandler(
            [shouldCancel](const Aws::Http::HttpRequest *) {
                return !shouldCancel();
            });
    }

    auto outcome = s3_->PutObject(req);
    if (!outcome.IsSuccess()) {
        if (shouldCancel && shouldCancel()) {
            err = OpError::cancelled();
            return false;
        }
        err = fromAws(outcome.GetError(), bucket, key);
        return false;
    }
    return true;
}

bool AwsS3StorageClient::putMultipart(const std::string &bucket,
                                      const std::string &key,
                                      const std::string &local_path,
                                      std::uint64_t size, OpError &err,
                                      const ProgressCB &progress,
                                      const CancelCB &shouldCancel) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        err = OpError::make(ErrorKind::LocalIo, "Cannot open local file: " + local_path);
        err.key = key;
        return false;
    }

    Aws::S3::Model::CreateMultipartUploadRequest createReq;
    createReq.SetBucket(bucket.c_str());
    createReq.SetKey(key.c_str());
    auto created = s3_->CreateMultipartUpload(createReq);
    if (!created.IsSuccess()) {
        err = fromAws(created.GetError(), bucket, key);
        return false;
    }
    const Aws::String uploadId = created.GetResult().GetUploadId();

    auto abortUpload = [&]() {
        Aws::S3::Model::AbortMultipartUploadRequest abortReq;
        abortReq.SetBucket(bucket.c_str());
        abortReq.SetKey(key.c_str());
        abortReq.SetUploadId(uploadId);
        auto aborted = s3_->AbortMultipartUpload(abortReq);
        if (!aborted.IsSuccess())
            qCWarning(osAws) << "abort multipart failed for" << q(key) << ":"
                             << q(aborted.GetError().GetMessage().c_str());
    };

    const std::uint64_t partSize =
        std::max<std::uint64_t>(5ull * 1024 * 1024, cfg_.part_size);
    std::vector<char> buffer(static_cast<std::size_t>(partSize));
    Aws::Vector<Aws::S3::Model::CompletedPart> parts;
    std::uint64_t base = 0;
    int partNumber = 1;
    while (base < size) {
        if (shouldCancel && shouldCancel()) {
            abortUpload();
            err = OpError::cancelled();
            return false;
        }
        const std::uint64_t n = std::min(partSize, size - base);
        in.read(buffer.data(), static_cast<std::streamsize>(n));
        if (static_cast<std::uint64_t>(in.gcount()) != n) {
            abortUpload();
            err = OpError::make(ErrorKind::LocalIo, "Short read from " + local_path);
            err.key = key;
            return false;
        }
        auto body = Aws::MakeShared<Aws::StringStream>(kTag);
        body->write(buffer.data(), static_cast<std::streamsize>(n));

        Aws::S3::Model::UploadPartRequest partReq;
        partReq.SetBucket(bucket.c_str());
        partReq.SetKey(key.c_str());
        partReq.SetUploadId(uploadId);
        partReq.SetPartNumber(partNumber);
        partReq.SetContentLength(static_cast<long long>(n));
        partReq.SetBody(body);
        std::uint64_t sentInPart = 0;
        partReq.SetDataSentEventHandler(
            [&](const Aws::Http::HttpRequest *, long long sent) {
                sentInPart = std::min(
                    n, sentInPart + static_cast<std::uint64_t>(sent > 0 ? sent : 0));
                if (progress)
                    progress(base + sentInPart, size);
            });
        if (shouldCancel) {
            partReq.SetContinueRequestHandler(
                [shouldCancel](const Aws::Http::HttpRequest *) {
                    return !shouldCancel();
                });
        }

        auto uploaded = s3_->UploadPart(partReq);
        if (!uploaded.IsSuccess()) {
            abortUpload();
            if (shouldCancel && shouldCancel()) {
                err = OpError::cancelled();
                return false;
            }
            err = fromAws(uploaded.GetError(), bucket, key);
            return false;
        }
        parts.push_back(Aws::S3::Model::CompletedPart()
                            .WithPartNumber(partNumber)
                            .WithETag(uploaded.GetResult().GetETag()));
        base += n;
        ++partNumber;
        if (progress)
            progress(base, size);
    }

    Aws::S3::Model::CompletedMultipartUpload completed;
    completed.SetParts(parts);
    Aws::S3::Model::CompleteMultipartUploadRequest completeReq;
    completeReq.SetBucket(bucket.c_str());
    completeReq.SetKey(key.c_str());
    completeReq.SetUploadId(uploadId);
    completeReq.SetMultipartUpload(std::move(completed));
    auto done = s3_->CompleteMultipartUpload(completeReq);
    if (!done.IsSuccess()) {
        abortUpload();
        err = fromAws(done.GetError(), bucket, key);
        return false;
    }
    return true;
}

bool AwsS3StorageClient::putEmptyObject(const std::string &bucket,
                                        const std::string &key, OpError &err) {
    Aws::S3::Model::PutObjectRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    req.SetBody(Aws::MakeShared<Aws::StringStream>(kTag));
    req.SetContentLength(0);
    auto outcome = s3_->PutObject(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, key);
        return false;
    }
    return true;
}

bool AwsS3StorageClient::deleteObject(const std::string &bucket,
                                      const std::string &key, OpError &err) {
    Aws::S3::Model::DeleteObjectRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    auto outcome = s3_->DeleteObject(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, key);
        return false;
    }
    return true;
}

bool AwsS3StorageClient::presignGetUrl(const std::string &bucket,
                                       const std::string &key,
                                       std::uint64_t ttl_sec, std::string &url,
                                       OpError &err) {
    const Aws::String signed_url = s3_->GeneratePresignedUrl(
        bucket.c_str(), key.c_str(), Aws::Http::HttpMethod::HTTP_GET,
        static_cast<long long>(ttl_sec));
    if (signed_url.empty()) {
        err = OpError::make(ErrorKind::Backend, "Could not presign URL");
        err.bucket = bucket;
        err.key = key;
        return false;
    }
    url = signed_url.c_str();
    return true;
}

bool AwsS3StorageClient::setPublicRead(const std::string &bucket,
                                       const std::string &key, OpError &err) {
    Aws::S3::Model::PutObjectAclRequest req;
    req.SetBucket(bucket.c_str());
    req.SetKey(key.c_str());
    req.SetACL(Aws::S3::Model::ObjectCannedACL::public_read);
    auto outcome = s3_->PutObjectAcl(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, key);
        // Buckets with ACLs disabled answer AccessControlListNotSupported.
        if (err.code == "AccessControlListNotSupported")
            err.kind = ErrorKind::NotSupported;
        return false;
    }
    return true;
}

bool AwsS3StorageClient::createBucket(const std::string &bucket, OpError &err) {
    Aws::S3::Model::CreateBucketRequest req;
    req.SetBucket(bucket.c_str());
    if (!cfg_.region.empty() && cfg_.region != "us-east-1") {
        Aws::S3::Model::CreateBucketConfiguration conf;
        conf.SetLocationConstraint(
            Aws::S3::Model::BucketLocationConstraintMapper::
                GetBucketLocationConstraintForName(cfg_.region.c_str()));
        req.SetCreateBucketConfiguration(conf);
    }
    auto outcome = s3_->CreateBucket(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, {});
        return false;
    }
    return true;
}

bool AwsS3StorageClient::deleteBucket(const std::string &bucket, OpError &err) {
    Aws::S3::Model::DeleteBucketRequest req;
    req.SetBucket(bucket.c_str());
    auto outcome = s3_->DeleteBucket(req);
    if (!outcome.IsSuccess()) {
        err = fromAws(outcome.GetError(), bucket, {});
        return false;
    }
    return true;
}

} // namespace opens3
