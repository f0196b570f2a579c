#include "server_config.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

namespace mcphub_server {

namespace {

bool readInt(const QJsonObject& obj, const QString& key, qint64 min, qint64 max,
             qint64& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const QJsonValue v = obj.value(key);
    const double d = v.toDouble();
    if (!v.isDouble() || d != static_cast<double>(static_cast<qint64>(d))) {
        error = QString("config field '%1' must be an integer").arg(key);
        return false;
    }
    const qint64 n = static_cast<qint64>(d);
    if (n < min || n > max) {
        error = QString("config field '%1' out of range").arg(key);
        return false;
    }
    out = n;
    return true;
}

bool readInt(const QJsonObject& obj, const QString& key, int min, int max, int& out,
             QString& error) {
    qint64 wide = out;
    if (!readInt(obj, key, static_cast<qint64>(min), static_cast<qint64>(max), wide, error)) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

bool readString(const QJsonObject& obj, const QString& key, bool allowEmpty, QString& out,
                QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isString()) {
        error = QString("config field '%1' must be a string").arg(key);
        return false;
    }
    const QString s = obj.value(key).toString();
    if (!allowEmpty && s.isEmpty()) {
        error = QString("config field '%1' cannot be empty").arg(key);
        return false;
    }
    out = s;
    return true;
}

} // namespace

ServerConfig ServerConfig::loadFromFile(const QString& filePath, QString& error) {
    ServerConfig cfg;
    error.clear();

    if (!QFileInfo::exists(filePath)) {
        return cfg;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open config file: " + filePath;
        return cfg;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "config.json parse error: " + parseErr.errorString();
        return cfg;
    }
    if (!doc.isObject()) {
        error = "config.json must contain a JSON object";
        return cfg;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {
        "port", "host", "logLevel", "projectsDir", "pythonCommand", "callTimeoutMs",
        "startupTimeoutMs", "shutdownGraceMs", "portRangeStart", "portRangeEnd",
        "logMaxBytes", "logMaxFiles"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in config.json: " + it.key();
            return cfg;
        }
    }

    const bool ok = readInt(obj, "port", 1, 65535, cfg.port, error)
                    && readString(obj, "host", false, cfg.host, error)
                    && readString(obj, "logLevel", false, cfg.logLevel, error)
                    && readString(obj, "projectsDir", false, cfg.projectsDir, error)
                    && readString(obj, "pythonCommand", false, cfg.pythonCommand, error)
                    && readInt(obj, "callTimeoutMs", 1, 3600 * 1000, cfg.callTimeoutMs, error)
                    && readInt(obj, "startupTimeoutMs", 1, 3600 * 1000, cfg.startupTimeoutMs, error)
                    && readInt(obj, "shutdownGraceMs", 0, 600 * 1000, cfg.shutdownGraceMs, error)
                    && readInt(obj, "portRangeStart", 1, 65535, cfg.portRangeStart, error)
                    && readInt(obj, "portRangeEnd", 1, 65535, cfg.portRangeEnd, error)
                    && readInt(obj, "logMaxBytes", qint64(1024), qint64(1) << 40, cfg.logMaxBytes,
                               error)
                    && readInt(obj, "logMaxFiles", 1, 100, cfg.logMaxFiles, error);
    if (!ok) {
        return cfg;
    }

    if (!isValidLogLevel(cfg.logLevel)) {
        error = "invalid config logLevel: " + cfg.logLevel;
        return cfg;
    }
    if (cfg.portRangeStart > cfg.portRangeEnd) {
        error = "config portRangeStart must not exceed portRangeEnd";
        return cfg;
    }
    return cfg;
}

void ServerConfig::applyArgs(const ServerArgs& args) {
    if (args.hasPort) {
        port = args.port;
    }
    if (args.hasHost) {
        host = args.host;
    }
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    }
    if (args.hasProjectsDir) {
        projectsDir = args.projectsDir;
    }
}

QString ServerConfig::resolvedProjectsDir(const QString& dataRoot) const {
    if (projectsDir.isEmpty()) {
        return QDir(dataRoot).absoluteFilePath("projects");
    }
    return QDir::cleanPath(QDir(dataRoot).absoluteFilePath(projectsDir));
}

} // namespace mcphub_server
