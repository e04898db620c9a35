// Best-effort string heuristics for heterogeneous S3-compatible backends:
// endpoint normalization, bucket/region hints hidden in hostnames and error
// messages. None of this is a formal protocol; keep it pure and testable.
#pragma once
#include <string>
#include <vector>

namespace opens3 {

// "minio.local:9000" -> "https://minio.local:9000"; trailing '/' removed.
std::string normalizeEndpoint(const std::string &raw);

// "https://a.b.c:9000/x" -> "https"
std::string endpointScheme(const std::string &endpoint);

// "https://a.b.c:9000/x" -> "a.b.c:9000"
std::string endpointAuthority(const std::string &endpoint);

// "a.b.c:9000" -> "a.b.c"
std::string hostWithoutPort(const std::string &authority);

// Endpoint built from a hint host, reusing the scheme of the current one.
// Hints may carry their own scheme; it is kept when present.
std::string endpointFromHint(const std::string &hint,
                             const std::string &current_endpoint);

std::string leftmostLabel(const std::string &host);

// host == "<bucket>.<rest>"
bool hostEmbedsBucket(const std::string &host, const std::string &bucket);

// "<bucket>.rest" -> "rest" (host unchanged when it does not embed bucket).
std::string stripBucketLabel(const std::string &host,
                             const std::string &bucket);

// Leftmost label of a host with at least three labels when it names a bucket
// other than `bucket` ("other.s3.eu-west-1.amazonaws.com",
// "other.eu-west.example.com"). Empty for service and region labels
// ("s3.eu-west-1.amazonaws.com") and for the requested bucket itself.
std::string foreignBucketInHost(const std::string &host,
                                const std::string &bucket);

// Region from AWS-style hostnames: s3.<r>.amazonaws.com, s3-<r>.amazonaws.com,
// s3.dualstack.<r>.amazonaws.com, <bucket>.s3.<r>.amazonaws.com.
std::string regionFromHost(const std::string &host);

// Region the server expects, from messages like
// "... the region 'us-east-1' is wrong; expecting 'eu-west-1'".
std::string regionFromErrorMessage(const std::string &message);

// {"us-east-1", profile, current} without empties or duplicates, in order.
std::vector<std::string> seedSigningRegions(const std::string &profile_region,
                                            const std::string &current_region);

} // namespace opens3
