// Basic types shared between the UI layer and the core for S3 connections,
// listings and transfer jobs. Kept as plain structs so the UI can copy them
// across threads freely.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace opens3 {

// Whether the bucket name travels in the hostname or in the URL path.
enum class AddressingStyle {
    Path,    // https://host/bucket/key
    Virtual  // https://bucket.host/key
};

inline AddressingStyle oppositeStyle(AddressingStyle s) {
    return s == AddressingStyle::Path ? AddressingStyle::Virtual
                                      : AddressingStyle::Path;
}

inline const char *addressingStyleName(AddressingStyle s) {
    return s == AddressingStyle::Path ? "path" : "virtual";
}

struct ConnectionConfig {
    std::string profile_name;  // diagnostics only
    std::string endpoint;      // https://host[:port]
    std::string region;        // empty = unknown
    std::string access_key;
    std::string secret_key;
    bool verify_tls = true;
    AddressingStyle addressing_style = AddressingStyle::Virtual;
    int connect_timeout_sec = 3;
    int request_timeout_sec = 30;
    int retries = 3;

    // Bucket the client is scoped to (empty at root scope).
    std::string bucket;

    // Files larger than the threshold go up as multipart uploads; part_size
    // is also the granularity of progress callbacks.
    std::uint64_t multipart_threshold = 8ull * 1024 * 1024;
    std::uint64_t part_size = 8ull * 1024 * 1024;
};

// Field-wise overrides merged over a stored ConnectionConfig.
struct ConfigOverrides {
    std::optional<std::string> endpoint;
    std::optional<std::string> region;
    std::optional<AddressingStyle> addressing_style;
    std::optional<std::string> bucket;
};

enum class FSObjectKind { Bucket, Folder, File };

// One entry of a listing. Folders and buckets carry size 0 and mtime 0.
struct FSObject {
    FSObjectKind kind = FSObjectKind::File;
    std::string name;          // display name (last path segment)
    std::uint64_t size = 0;    // bytes, files only
    std::uint64_t mtime = 0;   // epoch seconds, files (and bucket creation)
};

// Current folder: empty bucket means "bucket-list mode". The prefix is either
// empty (bucket root) or ends with '/'.
struct Location {
    std::string bucket;
    std::string prefix;

    bool isBucketList() const { return bucket.empty(); }
    bool operator==(const Location &o) const {
        return bucket == o.bucket && prefix == o.prefix;
    }
    bool operator!=(const Location &o) const { return !(*this == o); }
};

struct BucketSummary {
    std::string name;
    std::uint64_t created = 0;  // epoch seconds
};

// Raw entry of a flat key listing.
struct ObjectEntry {
    std::string key;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0;
    std::string etag;
};

// One page of a prefix/delimiter listing.
struct ListPage {
    std::vector<ObjectEntry> objects;
    std::vector<std::string> common_prefixes;
    std::string next_token;  // empty when the listing is exhausted
    bool truncated = false;
};

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0;
    std::string etag;  // quotes stripped
    std::string content_type;
};

enum class JobKind { Download, Upload, Delete, CreateFolder };

inline const char *jobKindName(JobKind k) {
    switch (k) {
    case JobKind::Download:
        return "Download";
    case JobKind::Upload:
        return "Upload";
    case JobKind::Delete:
        return "Delete";
    case JobKind::CreateFolder:
        return "Create folder";
    }
    return "Unknown";
}

// One element of a batch.
//  - upload:   local_path empty -> create folder placeholder at remote_key
//  - download: local_path empty + destination_dir set -> whole prefix
struct TransferItem {
    std::string remote_key;
    std::optional<std::string> local_path;
    std::optional<std::uint64_t> known_size;
    std::optional<std::string> destination_dir;
};

using TransferJob = std::vector<TransferItem>;

enum class JobState { Preparing, Running, Completed, Cancelled, Failed };

inline const char *jobStateName(JobState s) {
    switch (s) {
    case JobState::Preparing:
        return "Preparing";
    case JobState::Running:
        return "Running";
    case JobState::Completed:
        return "Completed";
    case JobState::Cancelled:
        return "Cancelled";
    case JobState::Failed:
        return "Failed";
    }
    return "Unknown";
}

} // namespace opens3
