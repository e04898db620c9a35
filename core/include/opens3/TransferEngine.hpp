// Executes one batch (TransferJob) under one CancelToken:
// Preparing -> Running -> {Completed | Cancelled | Failed}.
#pragma once
#include "CancelToken.hpp"
#include "ProgressAggregator.hpp"
#include "StorageClient.hpp"
#include <atomic>

namespace opens3 {

// Receives engine events on the worker's thread. Implementations must not
// block: these run inside SDK progress callbacks.
class TransferListener {
public:
    virtual ~TransferListener() = default;
    virtual void onProgressLine(const std::string &line) = 0;
    virtual void onBatchProgress(const BatchProgress &p) = 0;
    // At most once per batch, after any remote mutation.
    virtual void onRefreshNeeded() {}
};

struct TransferOutcome {
    JobState state = JobState::Preparing;
    OpError error;  // Cancelled or the failing item's error
    std::uint64_t done = 0;
    std::uint64_t total = 0;

    bool cancelled() const { return state == JobState::Cancelled; }
    bool failed() const { return state == JobState::Failed; }
};

class TransferEngine {
public:
    TransferEngine(std::shared_ptr<StorageClient> client, std::string bucket);

    // Runs the whole job synchronously. Download and upload batches count
    // progress in bytes; delete and create-folder batches count objects.
    TransferOutcome run(JobKind kind, const TransferJob &job,
                        const CancelToken &cancel, TransferListener &listener);

    // Safe to poll from another thread while run() executes.
    JobState state() const { return state_.load(); }
    std::uint64_t bytesDone() const { return done_.load(); }
    std::uint64_t bytesTotal() const { return total_.load(); }

private:
    struct Step {
        enum class Op { GetFile, MakeDir, PutFile, PutPlaceholder, DeleteKey };
        Op op;
        std::string key;
        std::string local;
        std::uint64_t size = 0;
    };

    bool prepare(JobKind kind, const TransferJob &job,
                 const CancelToken &cancel, std::vector<Step> &steps,
                 OpError &err);
    bool prepareDownload(const TransferItem &item, const CancelToken &cancel,
                         std::vector<Step> &steps, OpError &err);
    bool prepareUpload(const TransferItem &item, std::vector<Step> &steps,
                       OpError &err);
    bool prepareDelete(const TransferItem &item, const CancelToken &cancel,
                       std::vector<Step> &steps, OpError &err);

    bool execute(const Step &step, AggregatorState &agg,
                 const CancelToken &cancel, TransferListener &listener,
                 bool &mutated, OpError &err);

    std::shared_ptr<StorageClient> client_;
    std::string bucket_;
    std::atomic<JobState> state_{JobState::Preparing};
    std::atomic<std::uint64_t> done_{0};
    std::atomic<std::uint64_t> total_{0};
};

} // namespace opens3
