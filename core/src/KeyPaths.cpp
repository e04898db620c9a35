#include "opens3/KeyPaths.hpp"

namespace opens3 {

std::string normalizePrefix(const std::string &prefix) {
    std::string p = prefix;
    while (!p.empty() && p.front() == kKeySeparator)
        p.erase(p.begin());
    if (!p.empty() && p.back() != kKeySeparator)
        p.push_back(kKeySeparator);
    return p;
}

std::string lastSegment(const std::string &key) {
    std::string k = key;
    while (!k.empty() && k.back() == kKeySeparator)
        k.pop_back();
    const auto pos = k.rfind(kKeySeparator);
    if (pos == std::string::npos)
        return k;
    return k.substr(pos + 1);
}

std::string parentPrefix(const std::string &prefix) {
    std::string p = prefix;
    while (!p.empty() && p.back() == kKeySeparator)
        p.pop_back();
    const auto pos = p.rfind(kKeySeparator);
    if (pos == std::string::npos)
        return {};
    return p.substr(0, pos + 1);
}

std::string childPrefix(const std::string &prefix, const std::string &name) {
    std::string n = name;
    while (!n.empty() && n.back() == kKeySeparator)
        n.pop_back();
    return normalizePrefix(prefix) + n + kKeySeparator;
}

std::string relativeKey(const std::string &key, const std::string &base) {
    if (!base.empty() && key.compare(0, base.size(), base) == 0)
        return key.substr(base.size());
    return key;
}

bool hasDotSegments(const std::string &relative) {
    std::size_t start = 0;
    while (start <= relative.size()) {
        auto end = relative.find(kKeySeparator, start);
        if (end == std::string::npos)
            end = relative.size();
        const std::string seg = relative.substr(start, end - start);
        if (seg == "." || seg == "..")
            return true;
        start = end + 1;
    }
    return false;
}

Location parentLocation(const Location &loc) {
    if (loc.bucket.empty())
        return {};
    if (loc.prefix.empty())
        return {}; // leaving the bucket
    return {loc.bucket, parentPrefix(loc.prefix)};
}

} // namespace opens3
