#include "opens3/TransferEngine.hpp"
#include "opens3/HierarchicalLister.hpp"
#include "opens3/KeyPaths.hpp"

#include <QLoggingCategory>
#include <QString>

#include <filesystem>

Q_LOGGING_CATEGORY(osXfer, "opens3.transfer")

namespace fs = std::filesystem;

namespace opens3 {

namespace {

QString q(const std::string &s) { return QString::fromStdString(s); }

bool countsObjects(JobKind kind) {
    return kind == JobKind::Delete || kind == JobKind::CreateFolder;
}

bool ensureDirectory(const std::string &dir, OpError &err) {
    std::error_code ec;
    fs::create_directories(fs::path(dir), ec);
    if (ec) {
        err = OpError::make(ErrorKind::LocalIo,
                            "Cannot create directory " + dir + ": " + ec.message());
        return false;
    }
    return true;
}

// Any failure inside an item that is not a local or argument problem.
OpError itemError(const OpError &cause, const std::string &bucket,
                  const std::string &key) {
    OpError e = cause;
    if (e.kind != ErrorKind::LocalIo && e.kind != ErrorKind::InvalidArgument &&
        e.kind != ErrorKind::Cancelled)
        e.kind = ErrorKind::Transfer;
    if (e.bucket.empty())
        e.bucket = bucket;
    if (e.key.empty())
        e.key = key;
    return e;
}

} // namespace

TransferEngine::TransferEngine(std::shared_ptr<StorageClient> client,
                               std::string bucket)
    : client_(std::move(client)), bucket_(std::move(bucket)) {}

bool TransferEngine::prepareDownload(const TransferItem &item,
                                     const CancelToken &cancel,
                                     std::vector<Step> &steps, OpError &err) {
    if (item.local_path) {
        std::uint64_t size = 0;
        if (item.known_size) {
            size = *item.known_size;
        } else {
            ObjectInfo info;
            if (!client_->headObject(bucket_, item.remote_key, info, err)) {
                err = itemError(err, bucket_, item.remote_key);
                return false;
            }
            size = info.size;
        }
        steps.push_back({Step::Op::GetFile, item.remote_key, *item.local_path,
                         size});
        return true;
    }
    if (!item.destination_dir) {
        err = OpError::make(ErrorKind::InvalidArgument,
                            "Download item has neither a local path nor a "
                            "destination directory");
        err.key = item.remote_key;
        return false;
    }

    const std::string prefix = normalizePrefix(item.remote_key);
    const fs::path root = fs::path(*item.destination_dir) / lastSegment(prefix);
    std::vector<ObjectEntry> objects;
    if (!HierarchicalLister::collectObjects(
            *client_, bucket_, prefix, objects, err,
            [&cancel]() { return cancel.isCancelled(); })) {
        err = itemError(err, bucket_, prefix);
        return false;
    }
    steps.push_back({Step::Op::MakeDir, prefix, root.string(), 0});
    for (const ObjectEntry &o : objects) {
        const std::string rel = relativeKey(o.key, prefix);
        if (rel.empty())
            continue; // the folder's own placeholder
        if (hasDotSegments(rel)) {
            err = OpError::make(ErrorKind::InvalidArgument,
                                "Refusing key that escapes the destination");
            err.bucket = bucket_;
            err.key = o.key;
            return false;
        }
        if (isFolderKey(rel)) {
            steps.push_back({Step::Op::MakeDir, o.key, (root / rel).string(), 0});
            continue;
        }
        steps.push_back({Step::Op::GetFile, o.key, (root / rel).string(), o.size});
    }
    return true;
}

bool TransferEngine::prepareUpload(const TransferItem &item,
                                   std::vector<Step> &steps, OpError &err) {
    if (!item.local_path) {
        std::string key = item.remote_key;
        if (!isFolderKey(key))
            key.push_back(kKeySeparator);
        steps.push_back({Step::Op::PutPlaceholder, key, {}, 0});
        return true;
    }

    std::string key = item.remote_key;
    if (key.empty() || isFolderKey(key))
        key += fs::path(*item.local_path).filename().string();

    std::uint64_t size = 0;
    if (item.known_size) {
        size = *item.known_size;
    } else {
        std::error_code ec;
        const auto sz = fs::file_size(fs::path(*item.local_path), ec);
        if (ec) {
            err = OpError::make(ErrorKind::LocalIo, "Cannot read local file " +
                                                        *item.local_path + ": " +
                                                        ec.message());
            err.key = key;
            return false;
        }
        size = static_cast<std::uint64_t>(sz);
    }
    steps.push_back({Step::Op::PutFile, key, *item.local_path, size});
    return true;
}

bool TransferEngine::prepareDelete(const TransferItem &item,
                                   const CancelToken &cancel,
                                   std::vector<Step> &steps, OpError &err) {
    if (!isFolderKey(item.remote_key)) {
        steps.push_back({Step::Op::DeleteKey, item.remote_key, {}, 1});
        return true;
    }
    std::vector<ObjectEntry> objects;
    if (!HierarchicalLister::collectObjects(
            *client_, bucket_, item.remote_key, objects, err,
            [&cancel]() { return cancel.isCancelled(); })) {
        err = itemError(err, bucket_, item.remote_key);
        return false;
    }
    bool sawPlaceholder = false;
    for (const ObjectEntry &o : objects) {
        sawPlaceholder = sawPlaceholder || o.key == item.remote_key;
        steps.push_back({Step::Op::DeleteKey, o.key, {}, 1});
    }
    // Deleting a missing placeholder is harmless and covers implicit folders.
    if (!sawPlaceholder)
        steps.push_back({Step::Op::DeleteKey, item.remote_key, {}, 1});
    return true;
}

bool TransferEngine::prepare(JobKind kind, const TransferJob &job,
                             const CancelToken &cancel,
                             std::vector<Step> &steps, OpError &err) {
    for (const TransferItem &item : job) {
        if (cancel.isCancelled()) {
            err = OpError::cancelled();
            return false;
        }
        bool ok = false;
        switch (kind) {
        case JobKind::Download:
            ok = prepareDownload(item, cancel, steps, err);
            break;
        case JobKind::Upload:
            ok = prepareUpload(item, steps, err);
            break;
        case JobKind::CreateFolder: {
            TransferItem placeholder;
            placeholder.remote_key = item.remote_key;
            ok = prepareUpload(placeholder, steps, err);
            if (ok)
                steps.back().size = 1;
            break;
        }
        case JobKind::Delete:
            ok = prepareDelete(item, cancel, steps, err);
            break;
        }
        if (!ok)
            return false;
    }
    return true;
}

bool TransferEngine::execute(const Step &step, AggregatorState &agg,
                             const CancelToken &cancel,
                             TransferListener &listener, bool &mutated,
                             OpError &err) {
    auto report = [&](const std::string &key, std::uint64_t cumulative) {
        if (cancel.isCancelled())
            return;
        BatchProgress p;
        const bool due = agg.record(key, cumulative, ProgressClock::now(), p);
        done_.store(agg.done());
        if (due)
            listener.onBatchProgress(p);
    };
    auto shouldCancel = [&cancel]() { return cancel.isCancelled(); };

    switch (step.op) {
    case Step::Op::MakeDir:
        listener.onProgressLine("Creating directory " + step.local);
        return ensureDirectory(step.local, err);

    case Step::Op::GetFile: {
        listener.onProgressLine("Downloading " + step.key + " -> " + step.local +
                                " (" + std::to_string(step.size) + " bytes)");
        const fs::path parent = fs::path(step.local).parent_path();
        if (!parent.empty() && !ensureDirectory(parent.string(), err))
            return false;
        const bool ok = client_->getObject(
            bucket_, step.key, step.local, err,
            [&](std::uint64_t done, std::uint64_t) { report(step.key, done); },
            shouldCancel);
        if (ok)
            report(step.key, step.size);
        return ok;
    }

    case Step::Op::PutFile: {
        listener.onProgressLine("Uploading " + step.local + " -> " + step.key +
                                " (" + std::to_string(step.size) + " bytes)");
        const bool ok = client_->putObject(
            bucket_, step.key, step.local, err,
            [&](std::uint64_t done, std::uint64_t) { report(step.key, done); },
            shouldCancel);
        if (ok) {
            mutated = true;
            report(step.key, step.size);
        }
        return ok;
    }

    case Step::Op::PutPlaceholder:
        listener.onProgressLine("Creating folder " + step.key);
        if (!client_->putEmptyObject(bucket_, step.key, err))
            return false;
        mutated = true;
        report(step.key, step.size);
        return true;

    case Step::Op::DeleteKey:
        listener.onProgressLine("Deleting " + step.key);
        if (!client_->deleteObject(bucket_, step.key, err))
            return false;
        mutated = true;
        report(step.key, step.size);
        return true;
    }
    return false;
}

TransferOutcome TransferEngine::run(JobKind kind, const TransferJob &job,
                                    const CancelToken &cancel,
                                    TransferListener &listener) {
    TransferOutcome outcome;
    const std::string kindName = jobKindName(kind);
    state_.store(JobState::Preparing);
    done_.store(0);
    total_.store(0);

    auto finish = [&](JobState st, const OpError &e) {
        outcome.state = st;
        outcome.error = e;
        outcome.done = done_.load();
        outcome.total = total_.load();
        state_.store(st);
        switch (st) {
        case JobState::Completed:
            listener.onProgressLine(kindName + " completed");
            break;
        case JobState::Cancelled:
            listener.onProgressLine(kindName + " cancelled");
            break;
        default:
            listener.onProgressLine(kindName + " failed: " + e.describe());
            break;
        }
        qCInfo(osXfer) << q(kindName) << jobStateName(st) << outcome.done << "/"
                       << outcome.total << q(e.ok() ? std::string() : e.describe());
        return outcome;
    };

    if (!client_) {
        return finish(JobState::Failed,
                      OpError::make(ErrorKind::Backend, "No storage client"));
    }

    std::vector<Step> steps;
    OpError err;
    if (!prepare(kind, job, cancel, steps, err)) {
        return finish(err.isCancelled() ? JobState::Cancelled : JobState::Failed,
                      err);
    }

    std::uint64_t total = 0;
    for (const Step &s : steps)
        total += s.size;
    total_.store(total);
    qCInfo(osXfer) << q(kindName) << "prepared" << static_cast<int>(steps.size())
                   << "steps, total" << total
                   << (countsObjects(kind) ? "objects" : "bytes");

    state_.store(JobState::Running);
    AggregatorState agg(total);
    bool mutated = false;
    JobState terminal = JobState::Completed;
    for (const Step &step : steps) {
        if (cancel.isCancelled()) {
            err = OpError::cancelled();
            terminal = JobState::Cancelled;
            break;
        }
        OpError serr;
        if (!execute(step, agg, cancel, listener, mutated, serr)) {
            if (serr.isCancelled() || cancel.isCancelled()) {
                err = OpError::cancelled();
                terminal = JobState::Cancelled;
            } else {
                err = itemError(serr, bucket_, step.key);
                terminal = JobState::Failed;
            }
            break;
        }
    }

    if (terminal == JobState::Completed) {
        const BatchProgress last = agg.finish();
        done_.store(last.done);
        listener.onBatchProgress(last);
    }
    if (mutated)
        listener.onRefreshNeeded();
    return finish(terminal, err);
}

} // namespace opens3
