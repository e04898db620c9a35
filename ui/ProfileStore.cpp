#include "ProfileStore.hpp"
#include "opens3/EndpointHeuristics.hpp"
#include "opens3/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QSettings>
#include <cstdlib>

Q_LOGGING_CATEGORY(osProfiles, "opens3.profiles")

const QString ProfileStore::kEnvProfileName = QStringLiteral("env");

static QString envValue(const char *name) {
    const char *raw = std::getenv(name);
    return raw ? QString::fromUtf8(raw).trimmed() : QString();
}

ProfileStore::ProfileStore()
    : settings_(std::make_unique<QSettings>("OpenS3", "OpenS3")) {}

ProfileStore::ProfileStore(const QString &iniPath)
    : settings_(std::make_unique<QSettings>(iniPath, QSettings::IniFormat)) {}

ProfileStore::~ProfileStore() = default;

QVector<ConnectionProfile> ProfileStore::load() const {
    QVector<ConnectionProfile> profiles;
    QSettings &s = *settings_;
    const int n = s.beginReadArray("profiles");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        ConnectionProfile p;
        p.name = s.value("name").toString().trimmed();
        opens3::ConnectionConfig &c = p.config;
        c.profile_name = p.name.toStdString();
        c.endpoint =
            opens3::normalizeEndpoint(s.value("url").toString().toStdString());
        c.region = s.value("region").toString().trimmed().toStdString();
        c.bucket = s.value("bucket_name").toString().trimmed().toStdString();
        c.access_key = s.value("access_key").toString().toStdString();
        c.secret_key = s.value("secret_key").toString().toStdString();
        c.verify_tls = !s.value("no_ssl_check", false).toBool();
        c.addressing_style = s.value("use_path", false).toBool()
                                 ? opens3::AddressingStyle::Path
                                 : opens3::AddressingStyle::Virtual;
        c.connect_timeout_sec = s.value("timeout", 3).toInt();
        c.retries = s.value("retries", 3).toInt();
        profiles.push_back(p);
    }
    s.endArray();
    qCDebug(osProfiles) << "loaded" << profiles.size() << "profiles";
    return profiles;
}

void ProfileStore::save(const QVector<ConnectionProfile> &profiles) {
    QSettings &s = *settings_;
    s.remove("profiles");
    s.beginWriteArray("profiles");
    for (int i = 0; i < profiles.size(); ++i) {
        s.setArrayIndex(i);
        const ConnectionProfile &p = profiles[i];
        const opens3::ConnectionConfig &c = p.config;
        s.setValue("name", p.name);
        s.setValue("url", QString::fromStdString(c.endpoint));
        s.setValue("region", QString::fromStdString(c.region));
        s.setValue("bucket_name", QString::fromStdString(c.bucket));
        s.setValue("access_key", QString::fromStdString(c.access_key));
        s.setValue("secret_key", QString::fromStdString(c.secret_key));
        s.setValue("no_ssl_check", !c.verify_tls);
        s.setValue("use_path",
                   c.addressing_style == opens3::AddressingStyle::Path);
        s.setValue("timeout", c.connect_timeout_sec);
        s.setValue("retries", c.retries);
    }
    s.endArray();
    s.sync();
    qCInfo(osProfiles) << "saved" << profiles.size() << "profiles";
}

std::optional<ConnectionProfile> ProfileStore::find(const QString &name) const {
    if (name == kEnvProfileName)
        return fromEnvironment();
    const QVector<ConnectionProfile> all = load();
    for (const ConnectionProfile &p : all) {
        if (p.name == name)
            return p;
    }
    qCWarning(osProfiles) << "profile not found:" << name;
    return std::nullopt;
}

std::optional<ConnectionProfile> ProfileStore::fromEnvironment() {
    const QString endpoint = envValue("OPEN_S3_ENDPOINT");
    if (endpoint.isEmpty())
        return std::nullopt;
    ConnectionProfile p;
    p.name = kEnvProfileName;
    opens3::ConnectionConfig &c = p.config;
    c.profile_name = kEnvProfileName.toStdString();
    c.endpoint = opens3::normalizeEndpoint(endpoint.toStdString());
    c.region = envValue("OPEN_S3_REGION").toStdString();
    c.access_key = envValue("OPEN_S3_ACCESS_KEY").toStdString();
    c.secret_key = envValue("OPEN_S3_SECRET_KEY").toStdString();
    c.bucket = envValue("OPEN_S3_BUCKET").toStdString();
    c.addressing_style = opens3::envFlagEnabled("OPEN_S3_PATH_STYLE")
                             ? opens3::AddressingStyle::Path
                             : opens3::AddressingStyle::Virtual;
    c.verify_tls = !opens3::envFlagEnabled("OPEN_S3_NO_SSL_CHECK");
    qCInfo(osProfiles) << "env profile" << QString::fromStdString(c.endpoint)
                       << "access key"
                       << QString::fromStdString(opens3::redactForLog(c.access_key));
    return p;
}

bool ProfileStore::validate(const opens3::ConnectionConfig &cfg, QString *why) {
    auto fail = [why](const QString &msg) {
        if (why)
            *why = msg;
        return false;
    };
    if (opens3::normalizeEndpoint(cfg.endpoint).empty())
        return fail(QStringLiteral("Endpoint URL is required"));
    if (cfg.access_key.empty())
        return fail(QStringLiteral("Access key is required"));
    if (cfg.secret_key.empty())
        return fail(QStringLiteral("Secret key is required"));
    return true;
}
