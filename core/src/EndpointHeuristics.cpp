#include "opens3/EndpointHeuristics.hpp"

#include <algorithm>
#include <cctype>

namespace opens3 {

namespace {

std::string toLower(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trimmed(const std::string &s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::vector<std::string> splitLabels(const std::string &host) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= host.size()) {
        auto dot = host.find('.', start);
        if (dot == std::string::npos)
            dot = host.size();
        out.push_back(host.substr(start, dot - start));
        start = dot + 1;
    }
    return out;
}

bool looksLikeRegion(const std::string &s) {
    // us-east-1, eu-central-2, ap-southeast-1, cn-north-1, us-gov-west-1 ...
    if (s.size() < 4 || s.find('-') == std::string::npos)
        return false;
    if (!std::isdigit(static_cast<unsigned char>(s.back())))
        return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::islower(static_cast<unsigned char>(c)) ||
               std::isdigit(static_cast<unsigned char>(c)) || c == '-';
    });
}

// Labels that name the service or a region rather than a bucket: "s3",
// "s3-eu-west-1", "eu-west-1", IPv4 octets.
bool isServiceLabel(const std::string &label) {
    if (label == "s3" || label.compare(0, 3, "s3-") == 0)
        return true;
    if (looksLikeRegion(label))
        return true;
    return std::all_of(label.begin(), label.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

} // namespace

std::string normalizeEndpoint(const std::string &raw) {
    std::string e = trimmed(raw);
    if (e.empty())
        return e;
    if (e.find("://") == std::string::npos)
        e = "https://" + e;
    while (!e.empty() && e.back() == '/')
        e.pop_back();
    return e;
}

std::string endpointScheme(const std::string &endpoint) {
    const auto pos = endpoint.find("://");
    if (pos == std::string::npos)
        return "https";
    return toLower(endpoint.substr(0, pos));
}

std::string endpointAuthority(const std::string &endpoint) {
    std::string rest = endpoint;
    const auto pos = rest.find("://");
    if (pos != std::string::npos)
        rest = rest.substr(pos + 3);
    const auto slash = rest.find('/');
    if (slash != std::string::npos)
        rest = rest.substr(0, slash);
    return toLower(rest);
}

std::string hostWithoutPort(const std::string &authority) {
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        return close == std::string::npos ? authority
                                          : authority.substr(0, close + 1);
    }
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos)
        return authority;
    return authority.substr(0, colon);
}

std::string endpointFromHint(const std::string &hint,
                             const std::string &current_endpoint) {
    const std::string h = trimmed(hint);
    if (h.empty())
        return {};
    if (h.find("://") != std::string::npos)
        return normalizeEndpoint(h);
    return endpointScheme(current_endpoint) + "://" + endpointAuthority(h);
}

std::string leftmostLabel(const std::string &host) {
    const auto dot = host.find('.');
    return dot == std::string::npos ? host : host.substr(0, dot);
}

bool hostEmbedsBucket(const std::string &host, const std::string &bucket) {
    if (bucket.empty())
        return false;
    const std::string h = toLower(hostWithoutPort(host));
    const std::string prefix = toLower(bucket) + ".";
    return h.size() > prefix.size() && h.compare(0, prefix.size(), prefix) == 0;
}

std::string stripBucketLabel(const std::string &host,
                             const std::string &bucket) {
    if (!hostEmbedsBucket(host, bucket))
        return host;
    return host.substr(bucket.size() + 1);
}

std::string foreignBucketInHost(const std::string &host,
                                const std::string &bucket) {
    const std::string h = toLower(hostWithoutPort(host));
    if (splitLabels(h).size() < 3)
        return {};
    const std::string first = leftmostLabel(h);
    if (first.empty() || first == toLower(bucket) || isServiceLabel(first))
        return {};
    return first;
}

std::string regionFromHost(const std::string &host) {
    const auto labels = splitLabels(toLower(hostWithoutPort(host)));
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const std::string &l = labels[i];
        if (l == "s3") {
            std::size_t j = i + 1;
            if (j < labels.size() && labels[j] == "dualstack")
                ++j;
            if (j < labels.size() && looksLikeRegion(labels[j]))
                return labels[j];
            return {};
        }
        if (l.compare(0, 3, "s3-") == 0) {
            const std::string r = l.substr(3);
            if (looksLikeRegion(r))
                return r;
            return {};
        }
    }
    return {};
}

std::string regionFromErrorMessage(const std::string &message) {
    static const std::string kMarker = "expecting '";
    const auto pos = message.find(kMarker);
    if (pos == std::string::npos)
        return {};
    const auto start = pos + kMarker.size();
    const auto end = message.find('\'', start);
    if (end == std::string::npos)
        return {};
    // Self-hosted backends use free-form region names ("garage", "default").
    const std::string r = message.substr(start, end - start);
    const bool token = !r.empty() &&
                       std::none_of(r.begin(), r.end(), [](char c) {
                           return std::isspace(static_cast<unsigned char>(c));
                       });
    return token ? r : std::string();
}

std::vector<std::string> seedSigningRegions(const std::string &profile_region,
                                            const std::string &current_region) {
    std::vector<std::string> out;
    for (const std::string &r : {std::string("us-east-1"),
                                 trimmed(profile_region),
                                 trimmed(current_region)}) {
        if (r.empty())
            continue;
        if (std::find(out.begin(), out.end(), r) == out.end())
            out.push_back(r);
    }
    return out;
}

} // namespace opens3
