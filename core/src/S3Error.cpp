#include "opens3/S3Error.hpp"

namespace opens3 {

const char *errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::Network:
        return "Network";
    case ErrorKind::AccessDenied:
        return "AccessDenied";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::PermanentRedirect:
        return "PermanentRedirect";
    case ErrorKind::RegionMismatch:
        return "RegionMismatch";
    case ErrorKind::Binding:
        return "Binding";
    case ErrorKind::List:
        return "List";
    case ErrorKind::NotEmpty:
        return "NotEmpty";
    case ErrorKind::NotSupported:
        return "NotSupported";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::Transfer:
        return "Transfer";
    case ErrorKind::LocalIo:
        return "LocalIo";
    case ErrorKind::Backend:
        return "Backend";
    }
    return "Unknown";
}

bool OpError::isRedirectClass() const {
    if (kind == ErrorKind::PermanentRedirect ||
        kind == ErrorKind::RegionMismatch)
        return true;
    return http_status == 301 || http_status == 307;
}

std::string OpError::describe() const {
    std::string out;
    if (!code.empty())
        out += "[" + code + "] ";
    out += message.empty() ? std::string(errorKindName(kind)) : message;

    std::string ctx;
    auto add = [&ctx](const char *name, const std::string &v) {
        if (v.empty())
            return;
        if (!ctx.empty())
            ctx += ", ";
        ctx += name;
        ctx += "=";
        ctx += v;
    };
    add("bucket", bucket);
    add("prefix", prefix);
    add("key", key);
    add("endpoint", suggested_endpoint);
    if (!ctx.empty())
        out += " (" + ctx + ")";
    return out;
}

} // namespace opens3
