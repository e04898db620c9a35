// Pure helpers for '/'-delimited object keys and folder prefixes.
#pragma once
#include "S3Types.hpp"
#include <string>

namespace opens3 {

constexpr char kKeySeparator = '/';

inline bool isFolderKey(const std::string &key) {
    return !key.empty() && key.back() == kKeySeparator;
}

// "a/b/" or "" (never "a/b").
std::string normalizePrefix(const std::string &prefix);

// Last non-empty segment: "a/b/" -> "b", "a/b/c.txt" -> "c.txt".
std::string lastSegment(const std::string &key);

// Prefix one level up: "a/b/" -> "a/", "a/" -> "".
std::string parentPrefix(const std::string &prefix);

// Child folder prefix: ("a/", "b") -> "a/b/".
std::string childPrefix(const std::string &prefix, const std::string &name);

// key relative to base ("a/b/c", "a/") -> "b/c"; key itself when unrelated.
std::string relativeKey(const std::string &key, const std::string &base);

// True when any segment is "." or ".." (would escape a local destination).
bool hasDotSegments(const std::string &relative);

Location parentLocation(const Location &loc);

} // namespace opens3
