// Environment switches for diagnostics and the redaction applied to
// credentials and signed URLs before they reach a log line.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace opens3 {

// Trimmed, lowercased value of an environment variable ("" when unset).
inline std::string normalizedEnv(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

inline bool isTruthy(const std::string &v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool envFlagEnabled(const char *name) {
    return isTruthy(normalizedEnv(name));
}

// OPEN_S3_ENV=dev|development|local|debug
inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("OPEN_S3_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Clear-text secrets need both a dev environment and an explicit opt-in.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("OPEN_S3_LOG_SENSITIVE");
}

// Routes the SDK's own log output (Debug level) when set.
inline bool awsTraceEnabled() { return envFlagEnabled("OPEN_S3_AWS_TRACE"); }

// Access and secret keys: first four characters, then "***".
inline std::string redactForLog(const std::string &secret) {
    if (sensitiveLoggingEnabled() || secret.empty())
        return secret;
    if (secret.size() <= 4)
        return "***";
    return secret.substr(0, 4) + "***";
}

// Presigned URLs: the query string carries the credential and signature.
inline std::string redactUrlForLog(const std::string &url) {
    if (sensitiveLoggingEnabled())
        return url;
    const auto q = url.find('?');
    return q == std::string::npos ? url : url.substr(0, q) + "?***";
}

} // namespace opens3
