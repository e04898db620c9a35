// opens3: headless driver over the storage model and the job dispatcher.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <csignal>
#include "JobDispatcher.hpp"
#include "ProfileStore.hpp"
#include "RemoteModel.hpp"
#include "TimeUtils.hpp"
#include "opens3/AwsS3StorageClient.hpp"
#include "opens3/KeyPaths.hpp"
#include "opens3/StorageModel.hpp"

Q_LOGGING_CATEGORY(osCli, "opens3.cli")

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

void onSigint(int) { gInterrupted = 1; }

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2, ExitCancelled = 130 };

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

// "bucket/some/key" -> {"bucket", "some/key"}
opens3::Location splitTarget(const QString &target) {
    const std::string t = target.toStdString();
    const auto slash = t.find('/');
    if (slash == std::string::npos)
        return {t, {}};
    return {t.substr(0, slash), t.substr(slash + 1)};
}

int fail(const opens3::OpError &e) {
    err() << "error: " << QString::fromStdString(e.describe()) << Qt::endl;
    return e.isCancelled() ? ExitCancelled : ExitFailed;
}

// Rows come out of the table model already sorted: containers first.
void printListing(const RemoteModel &view) {
    for (int row = 0; row < view.rowCount(); ++row) {
        const auto cell = [&](int col, int role = Qt::DisplayRole) {
            return view.data(view.index(row, col), role).toString();
        };
        out() << cell(RemoteModel::NameColumn, Qt::ToolTipRole)
                     .toUpper()
                     .leftJustified(8)
              << cell(RemoteModel::SizeColumn).rightJustified(10) << "  "
              << cell(RemoteModel::ModifiedColumn).leftJustified(18) << "  "
              << cell(RemoteModel::NameColumn) << Qt::endl;
    }
}

int listInto(RemoteModel &view, const opens3::Location &loc) {
    QString why;
    if (!view.setLocation(loc, &why)) {
        err() << "error: " << why << Qt::endl;
        return ExitFailed;
    }
    printListing(view);
    return ExitOk;
}

// Runs one job through the dispatcher and blocks in the event loop until it
// finishes. Ctrl-C cancels cooperatively.
int runJob(QCoreApplication &app, opens3::StorageModel &model,
           opens3::JobKind kind, opens3::TransferJob job) {
    JobDispatcher dispatcher;
    int code = ExitOk;
    QObject::connect(&dispatcher, &JobDispatcher::progressLine,
                     [](quint64, const QString &line) {
                         err() << line << Qt::endl;
                     });
    const bool countsBytes = kind == opens3::JobKind::Download ||
                             kind == opens3::JobKind::Upload;
    QObject::connect(&dispatcher, &JobDispatcher::batchProgress,
                     [countsBytes](quint64, quint64 done, quint64 total) {
                         err() << "  " << opens3ui::progressText(done, total,
                                                                 countsBytes)
                               << Qt::endl;
                     });
    QObject::connect(&dispatcher, &JobDispatcher::rateUpdated,
                     [](quint64, double, const QString &rate,
                        const QString &eta) {
                         err() << "  " << rate << "  ETA " << eta << Qt::endl;
                     });
    QObject::connect(&dispatcher, &JobDispatcher::jobFinished,
                     [&](quint64, bool cancelled, const QString &error) {
                         if (cancelled)
                             code = ExitCancelled;
                         else if (!error.isEmpty())
                             code = ExitFailed;
                         app.quit();
                     });

    QTimer interruptPoll;
    interruptPoll.setInterval(100);
    QObject::connect(&interruptPoll, &QTimer::timeout, [&]() {
        if (gInterrupted) {
            gInterrupted = 0;
            err() << "cancelling..." << Qt::endl;
            dispatcher.cancelAll();
        }
    });
    interruptPoll.start();

    dispatcher.submit(kind, std::move(job), model.bindingSnapshot());
    app.exec();
    return code;
}

bool bindTo(opens3::StorageModel &model, const std::string &bucket,
            opens3::OpError &e) {
    std::vector<opens3::FSObject> ignored;
    return model.enterBucket(bucket, ignored, e);
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OpenS3");
    QCoreApplication::setApplicationName("OpenS3");

    QCommandLineParser parser;
    parser.setApplicationDescription("Browse and transfer S3 objects");
    parser.addHelpOption();
    QCommandLineOption profileOpt(
        "profile", "Stored profile name, or 'env' for OPEN_S3_* variables.",
        "name", ProfileStore::kEnvProfileName);
    parser.addOption(profileOpt);
    parser.addPositionalArgument(
        "command", "buckets | ls | du | get | get-dir | put | mkdir | rm | "
                   "presign | stat | profiles");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString cmd = args.first();
    const auto need = [&](int n) {
        if (args.size() < n + 1) {
            err() << "usage: opens3 " << cmd << " needs " << n
                  << " argument(s)" << Qt::endl;
            return false;
        }
        return true;
    };

    ProfileStore store;
    if (cmd == "profiles") {
        for (const ConnectionProfile &p : store.load())
            out() << p.name << "  " << QString::fromStdString(p.config.endpoint)
                  << Qt::endl;
        if (ProfileStore::fromEnvironment())
            out() << ProfileStore::kEnvProfileName << "  (environment)" << Qt::endl;
        return ExitOk;
    }

    const QString profileName = parser.value(profileOpt);
    const std::optional<ConnectionProfile> profile = store.find(profileName);
    if (!profile) {
        err() << "unknown profile: " << profileName << Qt::endl;
        return ExitUsage;
    }
    QString why;
    if (!ProfileStore::validate(profile->config, &why)) {
        err() << "invalid profile " << profileName << ": " << why << Qt::endl;
        return ExitUsage;
    }

    std::signal(SIGINT, onSigint);
    opens3::AwsSdkSession sdk;
    opens3::StorageModel model(profile->config,
                               opens3::AwsS3StorageClient::factory());
    qCInfo(osCli) << "command" << cmd << "profile" << profileName;

    opens3::OpError e;

    if (cmd == "buckets") {
        RemoteModel view(&model);
        return listInto(view, opens3::Location{});
    }
    if (cmd == "ls") {
        if (!need(1))
            return ExitUsage;
        RemoteModel view(&model);
        return listInto(view, splitTarget(args[1]));
    }
    if (cmd == "du") {
        if (!need(1))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[1]);
        std::uint64_t bytes = 0;
        if (!bindTo(model, loc.bucket, e) || !model.totalSize(loc.prefix, bytes, e))
            return fail(e);
        out() << bytes << "\t" << opens3ui::sizeText(bytes) << Qt::endl;
        return ExitOk;
    }
    if (cmd == "presign") {
        if (!need(1))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[1]);
        const std::uint64_t ttl = args.size() > 2 ? args[2].toULongLong() : 3600;
        std::string url;
        if (!bindTo(model, loc.bucket, e) ||
            !model.presignedUrl(loc.prefix, ttl, url, e))
            return fail(e);
        out() << QString::fromStdString(url) << Qt::endl;
        return ExitOk;
    }
    if (cmd == "stat") {
        if (!need(1))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[1]);
        opens3::ObjectProperties props;
        if (!bindTo(model, loc.bucket, e) ||
            !model.objectProperties(loc.prefix, props, e))
            return fail(e);
        out() << "Name:     " << QString::fromStdString(props.display_name) << Qt::endl
              << "Size:     " << props.size << " (" << opens3ui::sizeText(props.size)
              << ")" << Qt::endl;
        if (!props.is_folder) {
            out() << "Modified: " << opens3ui::localShortTime(props.mtime) << Qt::endl
                  << "ETag:     " << QString::fromStdString(props.etag) << Qt::endl
                  << "Type:     " << QString::fromStdString(props.content_type)
                  << Qt::endl;
        }
        return ExitOk;
    }

    opens3::TransferJob job;
    opens3::JobKind kind = opens3::JobKind::Download;
    std::string bucket;
    if (cmd == "get" || cmd == "get-dir") {
        if (!need(2))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[1]);
        bucket = loc.bucket;
        opens3::TransferItem item;
        item.remote_key = loc.prefix;
        if (cmd == "get")
            item.local_path = args[2].toStdString();
        else
            item.destination_dir = args[2].toStdString();
        job.push_back(item);
    } else if (cmd == "put") {
        if (!need(2))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[2]);
        bucket = loc.bucket;
        kind = opens3::JobKind::Upload;
        opens3::TransferItem item;
        item.remote_key = loc.prefix;
        item.local_path = args[1].toStdString();
        job.push_back(item);
    } else if (cmd == "mkdir" || cmd == "rm") {
        if (!need(1))
            return ExitUsage;
        const opens3::Location loc = splitTarget(args[1]);
        bucket = loc.bucket;
        kind = cmd == "mkdir" ? opens3::JobKind::CreateFolder
                              : opens3::JobKind::Delete;
        opens3::TransferItem item;
        item.remote_key = loc.prefix;
        job.push_back(item);
    } else {
        err() << "unknown command: " << cmd << Qt::endl;
        return ExitUsage;
    }

    if (!bindTo(model, bucket, e))
        return fail(e);
    return runJob(app, model, kind, std::move(job));
}
