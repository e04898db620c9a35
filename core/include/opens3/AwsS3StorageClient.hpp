// StorageClient backed by aws-sdk-cpp. The SDK signs and transports every
// request; this class maps configuration in and errors out.
#pragma once
#include "StorageClient.hpp"

namespace Aws {
namespace S3 {
class S3Client;
}
} // namespace Aws

namespace opens3 {

// Process-wide SDK lifetime (Aws::InitAPI / Aws::ShutdownAPI). Exactly one
// must outlive every AwsS3StorageClient.
class AwsSdkSession {
public:
    AwsSdkSession();
    ~AwsSdkSession();
    AwsSdkSession(const AwsSdkSession &) = delete;
    AwsSdkSession &operator=(const AwsSdkSession &) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class AwsS3StorageClient : public StorageClient {
public:
    explicit AwsS3StorageClient(ConnectionConfig cfg);
    ~AwsS3StorageClient() override;

    static ClientFactory factory();

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
    bool putMultipart(const std::string &bucket, const std::string &key,
                      const std::string &local_path, std::uint64_t size,
                      OpError &err, const ProgressCB &progress,
                      const CancelCB &shouldCancel);

    ConnectionConfig cfg_;
    std::unique_ptr<Aws::S3::S3Client> s3_;
};

} // namespace opens3
