#include "opens3/ConnectionBinder.hpp"
#include "opens3/EndpointHeuristics.hpp"
#include "opens3/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <deque>
#include <set>

Q_LOGGING_CATEGORY(osBind, "opens3.bind")

namespace opens3 {

namespace {

QString q(const std::string &s) { return QString::fromStdString(s); }

// Upper bound on probes per bindBucket() call.
constexpr std::size_t kMaxProbes = 12;

std::string candidateId(const std::string &endpoint, AddressingStyle style,
                        const std::string &region) {
    return endpoint + "|" + addressingStyleName(style) + "|" + region;
}

} // namespace

ConnectionBinder::ConnectionBinder(ConnectionConfig root, ClientFactory factory)
    : factory_(std::move(factory)) {
    setConfig(root);
}

ConnectionConfig
ConnectionBinder::configFor(const ConnectionConfig &base,
                            const ConfigOverrides &overrides) const {
    ConnectionConfig cfg = base;
    if (overrides.endpoint)
        cfg.endpoint = normalizeEndpoint(*overrides.endpoint);
    if (overrides.region)
        cfg.region = *overrides.region;
    if (overrides.addressing_style)
        cfg.addressing_style = *overrides.addressing_style;
    if (overrides.bucket)
        cfg.bucket = *overrides.bucket;
    return cfg;
}

std::shared_ptr<StorageClient>
ConnectionBinder::buildClient(const ConfigOverrides &overrides) const {
    ConnectionConfig base;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        base = root_;
    }
    return factory_(configFor(base, overrides));
}

bool ConnectionBinder::probe(StorageClient &client, const std::string &bucket,
                             OpError &err) const {
    ListPage page;
    return client.listObjects(bucket, "", "/", "", 1, page, err);
}

bool ConnectionBinder::bindBucket(const std::string &bucket,
                                  BucketBinding &out, OpError &err) {
    if (bucket.empty()) {
        err = OpError::make(ErrorKind::InvalidArgument, "Bucket name is empty");
        return false;
    }

    // Rebinding the same bucket starts from what already works; any other
    // bucket starts from the profile's root endpoint.
    ConnectionConfig base;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        base = (active_.config.bucket == bucket) ? active_.config : root_;
    }
    base.bucket = bucket;

    std::deque<Candidate> queue;
    queue.push_back({base.endpoint, base.addressing_style, base.region});
    queue.push_back(
        {base.endpoint, oppositeStyle(base.addressing_style), base.region});

    std::set<std::string> tried;
    bool redirectQueued = false;
    std::string redirectEndpoint;
    OpError last;
    OpError deferred;

    while (!queue.empty() && tried.size() < kMaxProbes) {
        const Candidate c = queue.front();
        queue.pop_front();
        if (!tried.insert(candidateId(c.endpoint, c.style, c.region)).second)
            continue;

        ConfigOverrides ov;
        ov.endpoint = c.endpoint;
        ov.addressing_style = c.style;
        ov.region = c.region;
        const ConnectionConfig cfg = configFor(base, ov);
        auto client = factory_(cfg);

        OpError perr;
        if (client && probe(*client, bucket, perr)) {
            qCInfo(osBind) << "bound bucket" << q(bucket) << "endpoint"
                           << q(cfg.endpoint) << "region" << q(cfg.region)
                           << "style" << addressingStyleName(cfg.addressing_style);
            std::lock_guard<std::mutex> lk(mtx_);
            active_.client = client;
            active_.config = cfg;
            out = active_;
            return true;
        }
        if (!client)
            perr = OpError::make(ErrorKind::Backend, "Could not create client");

        qCInfo(osBind) << "probe failed" << q(bucket) << q(c.endpoint)
                       << addressingStyleName(c.style) << q(c.region) << ":"
                       << q(perr.describe());
        last = perr;

        if (perr.kind == ErrorKind::RegionMismatch) {
            std::string hint = perr.region_hint;
            if (hint.empty())
                hint = regionFromErrorMessage(perr.message);
            if (!hint.empty() && hint != c.region)
                queue.push_front({c.endpoint, c.style, hint});
            continue;
        }

        if (perr.isRedirectClass()) {
            if (perr.suggested_endpoint.empty() || redirectQueued)
                continue;
            const std::string ep =
                endpointFromHint(perr.suggested_endpoint, c.endpoint);
            const std::string host = hostWithoutPort(endpointAuthority(ep));
            const std::string foreign = foreignBucketInHost(host, bucket);
            if (!foreign.empty()) {
                err = perr.rewrap(ErrorKind::Binding);
                err.bucket = bucket;
                err.suggested_endpoint = ep;
                err.message = "Suggested endpoint " + ep +
                              " addresses bucket '" + foreign +
                              "', not '" + bucket + "': " + perr.message;
                qCWarning(osBind) << "bucket mismatch in redirect" << q(ep);
                return false;
            }
            redirectQueued = true;
            redirectEndpoint = ep;
            std::string region = perr.region_hint;
            if (region.empty())
                region = regionFromHost(host);
            if (region.empty())
                region = c.region;
            if (hostEmbedsBucket(host, bucket)) {
                queue.push_back({ep, AddressingStyle::Virtual, region});
            } else {
                queue.push_back({ep, c.style, region});
                queue.push_back({ep, oppositeStyle(c.style), region});
            }
            continue;
        }

        if (perr.isTransport())
            continue;

        // Structural failure: the backend answered and said no. A suggested
        // endpoint still waiting in the queue gets its turn first.
        const bool redirectPending =
            redirectQueued &&
            std::any_of(queue.begin(), queue.end(), [&](const Candidate &n) {
                return n.endpoint == redirectEndpoint;
            });
        if (redirectPending) {
            if (deferred.ok())
                deferred = perr;
            continue;
        }
        err = perr;
        if (err.bucket.empty())
            err.bucket = bucket;
        return false;
    }

    if (!deferred.ok()) {
        err = deferred;
        if (err.bucket.empty())
            err.bucket = bucket;
        qCWarning(osBind) << "suggested endpoint failed for" << q(bucket) << ":"
                          << q(last.describe());
        return false;
    }

    err = last.rewrap(ErrorKind::Binding);
    err.bucket = bucket;
    if (err.message.empty())
        err.message = "No endpoint/addressing style combination answered";
    qCWarning(osBind) << "binding exhausted for" << q(bucket) << ":"
                      << q(err.describe());
    return false;
}

bool ConnectionBinder::listAccessibleBuckets(std::vector<BucketSummary> &out,
                                             OpError &err) {
    ConnectionConfig base;
    std::string profileRegion;
    std::string currentRegion;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        base = root_;
        profileRegion = profileRegion_;
        currentRegion = active_.config.region;
    }
    base.bucket.clear();

    std::deque<std::string> queue;
    std::set<std::string> seen;
    for (const std::string &r : seedSigningRegions(profileRegion, currentRegion)) {
        queue.push_back(r);
        seen.insert(r);
    }

    OpError last = OpError::make(ErrorKind::Backend, "No signing region to try");
    int attempts = 0;
    while (!queue.empty() && attempts < kRegionRetryBudget) {
        const std::string region = queue.front();
        queue.pop_front();
        ++attempts;

        ConfigOverrides ov;
        ov.region = region;
        auto client = factory_(configFor(base, ov));
        OpError lerr;
        if (client && client->listBuckets(out, lerr)) {
            qCInfo(osBind) << "ListBuckets ok with signing region" << q(region)
                           << "buckets:" << static_cast<int>(out.size());
            std::lock_guard<std::mutex> lk(mtx_);
            lastAttempts_ = attempts;
            return true;
        }
        last = lerr;
        qCInfo(osBind) << "ListBuckets failed with signing region" << q(region)
                       << ":" << q(lerr.describe());

        if (lerr.kind == ErrorKind::RegionMismatch) {
            std::string hint = lerr.region_hint;
            if (hint.empty())
                hint = regionFromErrorMessage(lerr.message);
            if (!hint.empty() && seen.insert(hint).second)
                queue.push_back(hint);
        }
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        lastAttempts_ = attempts;
    }
    err = last;
    return false;
}

void ConnectionBinder::returnToRootScope() {
    std::lock_guard<std::mutex> lk(mtx_);
    active_.client.reset();
    active_.config = root_;
    qCInfo(osBind) << "returned to root scope" << q(root_.endpoint);
}

void ConnectionBinder::setConfig(const ConnectionConfig &cfg) {
    std::lock_guard<std::mutex> lk(mtx_);
    root_ = cfg;
    root_.endpoint = normalizeEndpoint(cfg.endpoint);
    root_.bucket.clear();
    profileRegion_ = cfg.region;
    profileBucket_ = cfg.bucket;
    active_.client.reset();
    active_.config = root_;
    qCInfo(osBind) << "config set profile" << q(root_.profile_name) << "endpoint"
                   << q(root_.endpoint) << "access key"
                   << q(redactForLog(root_.access_key));
}

void ConnectionBinder::promoteRegion(const std::string &region) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (region.empty() || active_.config.region == region)
        return;
    active_.config.region = region;
    active_.client = factory_(active_.config);
    qCInfo(osBind) << "promoted region" << q(region) << "for bucket"
                   << q(active_.config.bucket);
}

BucketBinding ConnectionBinder::snapshot() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!active_.client)
        active_.client = factory_(active_.config);
    return active_;
}

ConnectionConfig ConnectionBinder::rootConfig() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return root_;
}

std::string ConnectionBinder::profileBucket() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return profileBucket_;
}

ConnectionConfig ConnectionBinder::activeConfig() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.config;
}

std::string ConnectionBinder::activeBucket() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.config.bucket;
}

int ConnectionBinder::lastBucketListAttempts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastAttempts_;
}

} // namespace opens3
