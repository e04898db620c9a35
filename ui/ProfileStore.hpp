// Connection profiles persisted with QSettings, plus the ad hoc "env"
// profile built from OPEN_S3_* variables.
#pragma once
#include <QString>
#include <QVector>
#include <memory>
#include <optional>
#include "opens3/S3Types.hpp"

class QSettings;

struct ConnectionProfile {
    QString name;
    opens3::ConnectionConfig config;
};

class ProfileStore {
public:
    // Name of the profile synthesized from the environment.
    static const QString kEnvProfileName;

    // Default store: QSettings("OpenS3", "OpenS3").
    ProfileStore();
    // Store backed by an INI file (tests, portable setups).
    explicit ProfileStore(const QString &iniPath);
    ~ProfileStore();

    QVector<ConnectionProfile> load() const;
    void save(const QVector<ConnectionProfile> &profiles);

    // Stored profile by name, or the env profile for kEnvProfileName.
    std::optional<ConnectionProfile> find(const QString &name) const;

    static std::optional<ConnectionProfile> fromEnvironment();

    // Endpoint, access key and secret key are mandatory.
    static bool validate(const opens3::ConnectionConfig &cfg, QString *why);

private:
    std::unique_ptr<QSettings> settings_;
};
