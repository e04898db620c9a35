// One directory level at a time over a flat, paginated key space.
#pragma once
#include "ConnectionBinder.hpp"
#include <vector>

namespace opens3 {

class HierarchicalLister {
public:
    explicit HierarchicalLister(ConnectionBinder &binder) : binder_(binder) {}

    // Bucket-list mode yields one Bucket entry per accessible bucket.
    // Otherwise every page is fetched; common prefixes become Folders and
    // objects become Files, except the placeholder equal to the prefix.
    bool list(const Location &loc, std::vector<FSObject> &out, OpError &err);

    // Sum of every object under `prefix`, placeholders excluded.
    bool totalSize(const std::string &bucket, const std::string &prefix,
                   std::uint64_t &bytes, OpError &err);

    // Every object under `prefix` (recursive, placeholders included).
    // `shouldCancel` is polled before each page.
    static bool collectObjects(StorageClient &client, const std::string &bucket,
                               const std::string &prefix,
                               std::vector<ObjectEntry> &out, OpError &err,
                               StorageClient::CancelCB shouldCancel = {});

private:
    bool listLevel(StorageClient &client, const Location &loc,
                   std::vector<FSObject> &out, OpError &err);

    ConnectionBinder &binder_;
};

} // namespace opens3
