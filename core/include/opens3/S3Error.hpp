// Error value returned through the core's bool + out-parameter convention.
// Backend codes and messages are carried verbatim; describe() only adds
// context, it never rewords what the storage service said.
#pragma once
#include <string>

namespace opens3 {

enum class ErrorKind {
    None,
    InvalidArgument,
    Network,            // transport: DNS, connect, TLS, timeouts
    AccessDenied,
    NotFound,
    PermanentRedirect,  // wrong endpoint for this bucket
    RegionMismatch,     // wrong signing region, hint usually attached
    Binding,            // no endpoint/style/region combination worked
    List,               // fatal listing failure
    NotEmpty,           // bucket deletion refused
    NotSupported,       // backend rejects the feature (e.g. ACLs)
    Cancelled,          // user cancellation, not a failure
    Transfer,           // any other failure inside a transfer item
    LocalIo,
    Backend             // anything else the service reported
};

const char *errorKindName(ErrorKind k);

struct OpError {
    ErrorKind kind = ErrorKind::None;
    std::string code;     // backend error code, e.g. "AccessDenied"
    std::string message;  // backend message, verbatim
    int http_status = 0;

    // Context
    std::string bucket;
    std::string prefix;
    std::string key;

    // Hints extracted from redirect-class responses.
    std::string region_hint;
    std::string suggested_endpoint;

    bool ok() const { return kind == ErrorKind::None; }
    bool isCancelled() const { return kind == ErrorKind::Cancelled; }
    bool isRedirectClass() const;
    bool isTransport() const { return kind == ErrorKind::Network; }

    void clear() { *this = OpError{}; }

    // Single line for logs and the UI: "[Code] message (bucket=…, prefix=…)".
    std::string describe() const;

    // Same backend detail under a different kind, with context added.
    OpError rewrap(ErrorKind k) const {
        OpError e = *this;
        e.kind = k;
        return e;
    }

    static OpError make(ErrorKind k, std::string msg) {
        OpError e;
        e.kind = k;
        e.message = std::move(msg);
        return e;
    }
    static OpError cancelled() {
        return make(ErrorKind::Cancelled, "Cancelled by user");
    }
};

} // namespace opens3
