// Dispatcher implementation: worker threads post every event back to the
// dispatcher's thread, where progress of cancelled jobs is dropped.
#include "JobDispatcher.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <vector>

Q_LOGGING_CATEGORY(osDispatch, "opens3.dispatch")

namespace {

// Forwards engine callbacks (worker thread) to the dispatcher's thread.
class QueuedListener : public opens3::TransferListener {
public:
    QueuedListener(JobDispatcher *target, quint64 id,
                   opens3::CancelTokenPtr token)
        : target_(target), id_(id), token_(std::move(token)) {}

    void onProgressLine(const std::string &line) override {
        JobDispatcher *d = target_;
        const quint64 id = id_;
        const QString text = QString::fromStdString(line);
        QMetaObject::invokeMethod(
            d, [d, id, text]() { emit d->progressLine(id, text); },
            Qt::QueuedConnection);
    }

    void onBatchProgress(const opens3::BatchProgress &p) override {
        if (token_->isCancelled())
            return;
        JobDispatcher *d = target_;
        const quint64 id = id_;
        const opens3::CancelTokenPtr token = token_;
        QMetaObject::invokeMethod(
            d,
            [d, id, token, p]() {
                if (token->isCancelled())
                    return;
                emit d->batchProgress(id, p.done, p.total);
            },
            Qt::QueuedConnection);
    }

    void onRefreshNeeded() override {
        JobDispatcher *d = target_;
        QMetaObject::invokeMethod(
            d, [d]() { emit d->refreshNeeded(); }, Qt::QueuedConnection);
    }

private:
    JobDispatcher *target_;
    quint64 id_;
    opens3::CancelTokenPtr token_;
};

} // namespace

JobDispatcher::JobDispatcher(QObject *parent) : QObject(parent) {
    tick_.setInterval(static_cast<int>(opens3::RateEstimator::kTick.count()));
    connect(&tick_, &QTimer::timeout, this, &JobDispatcher::onTick);
}

JobDispatcher::~JobDispatcher() {
    cancelAll();
    std::map<quint64, std::unique_ptr<Job>> toJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        toJoin.swap(jobs_);
    }
    for (auto &kv : toJoin) {
        if (kv.second->worker.joinable())
            kv.second->worker.join();
    }
    qCInfo(osDispatch) << "dispatcher destroyed, joined" << toJoin.size()
                       << "workers";
}

quint64 JobDispatcher::submit(opens3::JobKind kind, opens3::TransferJob job,
                              const opens3::BucketBinding &binding) {
    if (isKindActive(kind)) {
        qCWarning(osDispatch) << "a" << opens3::jobKindName(kind)
                              << "job is already running; starting another";
    }

    auto entry = std::make_unique<Job>();
    Job *raw = entry.get();
    raw->kind = kind;
    raw->token = std::make_shared<opens3::CancelToken>();
    raw->engine = std::make_shared<opens3::TransferEngine>(
        binding.client, binding.config.bucket);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        raw->id = nextId_++;
        jobs_[raw->id] = std::move(entry);
    }
    const quint64 id = raw->id;
    qCInfo(osDispatch) << "submit" << opens3::jobKindName(kind) << "id=" << id
                       << "items=" << static_cast<int>(job.size());

    auto engine = raw->engine;
    auto token = raw->token;
    raw->worker = std::thread([this, raw, id, kind, engine, token,
                               job = std::move(job)]() {
        QueuedListener listener(this, id, token);
        const opens3::TransferOutcome outcome =
            engine->run(kind, job, *token, listener);
        raw->finished.store(true);
        QMetaObject::invokeMethod(
            this, [this, id, outcome, kind]() { finishJob(id, outcome, kind); },
            Qt::QueuedConnection);
    });
    updateTimer();
    return id;
}

void JobDispatcher::finishJob(quint64 id, const opens3::TransferOutcome &outcome,
                              opens3::JobKind kind) {
    const QString error =
        outcome.failed() ? QString::fromStdString(outcome.error.describe())
                         : QString();
    qCInfo(osDispatch) << "finished" << opens3::jobKindName(kind) << "id=" << id
                       << opens3::jobStateName(outcome.state);
    emit jobFinished(id, outcome.cancelled(), error);

    std::unique_ptr<Job> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = jobs_.find(id);
        if (it != jobs_.end()) {
            done = std::move(it->second);
            jobs_.erase(it);
        }
    }
    if (done && done->worker.joinable()) {
        qCInfo(osDispatch) << "joining finished worker thread id=" << id;
        done->worker.join();
    }
    updateTimer();
}

void JobDispatcher::cancel(quint64 id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return;
    it->second->token->cancel();
    qCInfo(osDispatch) << "cancel requested id=" << id;
}

void JobDispatcher::cancelAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &kv : jobs_)
        kv.second->token->cancel();
    qCInfo(osDispatch) << "cancelAll requested";
}

bool JobDispatcher::isRunning(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    return it != jobs_.end() && !it->second->finished.load();
}

bool JobDispatcher::isKindActive(opens3::JobKind kind) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto &kv : jobs_) {
        if (kv.second->kind == kind && !kv.second->finished.load())
            return true;
    }
    return false;
}

int JobDispatcher::activeCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto &kv : jobs_) {
        if (!kv.second->finished.load())
            ++n;
    }
    return n;
}

void JobDispatcher::onTick() {
    struct Update {
        quint64 id;
        opens3::RateSnapshot snap;
    };
    std::vector<Update> updates;
    const auto now = opens3::ProgressClock::now();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &kv : jobs_) {
            Job &j = *kv.second;
            if (j.finished.load() || j.token->isCancelled())
                continue;
            if (j.engine->state() != opens3::JobState::Running)
                continue;
            updates.push_back(
                {j.id, j.rate.tick(now, j.engine->bytesDone(),
                                   j.engine->bytesTotal())});
        }
    }
    for (const Update &u : updates) {
        emit rateUpdated(u.id, u.snap.bytes_per_sec,
                         QString::fromStdString(u.snap.rate_text),
                         QString::fromStdString(u.snap.eta_text));
    }
    updateTimer();
}

void JobDispatcher::updateTimer() {
    bool anyLive = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto &kv : jobs_) {
            if (!kv.second->finished.load() && !kv.second->token->isCancelled()) {
                anyLive = true;
                break;
            }
        }
    }
    if (anyLive && !tick_.isActive())
        tick_.start();
    else if (!anyLive && tick_.isActive())
        tick_.stop();
}
