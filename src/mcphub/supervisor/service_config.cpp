#include "service_config.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSet>

namespace mcphub {

namespace {

bool isValidServiceId(const QString& id) {
    static const QRegularExpression re("^[A-Za-z0-9_.-]+$");
    return re.match(id).hasMatch();
}

} // namespace

ServiceConfig ServiceConfig::fromJson(const QString& id, const QJsonObject& obj,
                                      const QString& projectsRoot, QString& error) {
    ServiceConfig cfg;
    cfg.id = id;

    if (!isValidServiceId(id)) {
        error = "invalid service id: " + id;
        return cfg;
    }

    static const QSet<QString> known = {"enabled", "port", "transport", "project_dir", "host",
                                        "command", "args", "env", "description"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = QString("service '%1': unknown field '%2'").arg(id, it.key());
            return cfg;
        }
    }

    if (obj.contains("enabled")) {
        if (!obj.value("enabled").isBool()) {
            error = QString("service '%1': 'enabled' must be a boolean").arg(id);
            return cfg;
        }
        cfg.enabled = obj.value("enabled").toBool();
    }

    const QString transport = obj.value("transport").toString("stdio");
    if (!transportKindFromString(transport, cfg.transport)) {
        error = QString("service '%1': unknown transport '%2'").arg(id, transport);
        return cfg;
    }

    if (obj.contains("host")) {
        cfg.host = obj.value("host").toString();
        if (cfg.host.isEmpty()) {
            error = QString("service '%1': 'host' cannot be empty").arg(id);
            return cfg;
        }
    }

    if (obj.contains("port") && !obj.value("port").isNull()) {
        if (!obj.value("port").isDouble()) {
            error = QString("service '%1': 'port' must be an integer").arg(id);
            return cfg;
        }
        cfg.port = obj.value("port").toInt();
        if (cfg.port < 1 || cfg.port > 65535) {
            error = QString("service '%1': 'port' out of range").arg(id);
            return cfg;
        }
    }
    if (cfg.isNetwork() && !cfg.hasPort()) {
        error = QString("service '%1': transport '%2' requires a port")
                    .arg(id, transportKindToString(cfg.transport));
        return cfg;
    }

    const QString projectDir = obj.value("project_dir").toString();
    if (projectDir.isEmpty()) {
        error = QString("service '%1': 'project_dir' is required").arg(id);
        return cfg;
    }
    if (QFileInfo(projectDir).isRelative() && !projectsRoot.isEmpty()) {
        cfg.projectDir = QDir::cleanPath(QDir(projectsRoot).filePath(projectDir));
    } else {
        cfg.projectDir = QDir::cleanPath(projectDir);
    }

    if (obj.contains("command")) {
        if (!obj.value("command").isString() || obj.value("command").toString().isEmpty()) {
            error = QString("service '%1': 'command' must be a non-empty string").arg(id);
            return cfg;
        }
        cfg.command = obj.value("command").toString();
    }

    if (obj.contains("args")) {
        if (!obj.value("args").isArray()) {
            error = QString("service '%1': 'args' must be an array of strings").arg(id);
            return cfg;
        }
        for (const auto& a : obj.value("args").toArray()) {
            if (!a.isString()) {
                error = QString("service '%1': 'args' must be an array of strings").arg(id);
                return cfg;
            }
            cfg.args.append(a.toString());
        }
    }

    if (obj.contains("env")) {
        if (!obj.value("env").isObject()) {
            error = QString("service '%1': 'env' must be an object").arg(id);
            return cfg;
        }
        const QJsonObject env = obj.value("env").toObject();
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().isString()) {
                error = QString("service '%1': env '%2' must be a string").arg(id, it.key());
                return cfg;
            }
            cfg.env.insert(it.key(), it.value().toString());
        }
    }

    cfg.description = obj.value("description").toString();

    error.clear();
    return cfg;
}

QJsonObject ServiceConfig::toJson() const {
    QJsonObject obj;
    obj["enabled"] = enabled;
    obj["transport"] = transportKindToString(transport);
    obj["host"] = host;
    if (hasPort()) {
        obj["port"] = port;
    }
    obj["project_dir"] = projectDir;
    if (!command.isEmpty()) {
        obj["command"] = command;
        obj["args"] = QJsonArray::fromStringList(args);
    }
    if (!env.isEmpty()) {
        QJsonObject e;
        for (auto it = env.begin(); it != env.end(); ++it) {
            e[it.key()] = it.value();
        }
        obj["env"] = e;
    }
    if (!description.isEmpty()) {
        obj["description"] = description;
    }
    return obj;
}

LaunchSpec ServiceConfig::launchSpec(const QProcessEnvironment& base) const {
    LaunchSpec spec;
    spec.workingDirectory = projectDir;

    if (!command.isEmpty()) {
        spec.program = command;
        spec.arguments = args;
    } else {
        spec.program = QStringLiteral("uv");
        spec.arguments = {"run", "python", "server.py", "--transport",
                          transportKindToString(transport)};
        if (isNetwork()) {
            spec.arguments << "--host" << host << "--port" << QString::number(port);
        }
    }

    QProcessEnvironment env = base;
    const QString pythonPath = env.value("PYTHONPATH");
    env.insert("PYTHONPATH", pythonPath.isEmpty()
                                 ? projectDir
                                 : projectDir + QDir::listSeparator() + pythonPath);
    for (auto it = this->env.begin(); it != this->env.end(); ++it) {
        env.insert(it.key(), it.value());
    }
    spec.environment = env;
    return spec;
}

QUrl ServiceConfig::baseUrl() const {
    QUrl url;
    url.setScheme("http");
    url.setHost(host);
    url.setPort(port);
    return url;
}

QVector<ServiceConfig> ServiceTable::fromJson(const QJsonObject& root, const QString& projectsRoot,
                                              QString& error) {
    QVector<ServiceConfig> out;
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it.value().isObject()) {
            error = QString("service '%1' must be a JSON object").arg(it.key());
            return {};
        }
        ServiceConfig cfg = ServiceConfig::fromJson(it.key(), it.value().toObject(),
                                                    projectsRoot, error);
        if (!error.isEmpty()) {
            return {};
        }
        out.push_back(cfg);
    }

    // 启用的网络服务端口不能冲突
    QSet<int> usedPorts;
    for (const auto& cfg : out) {
        if (!cfg.enabled || !cfg.isNetwork()) {
            continue;
        }
        if (usedPorts.contains(cfg.port)) {
            error = QString("service '%1': port %2 already used by another service")
                        .arg(cfg.id).arg(cfg.port);
            return {};
        }
        usedPorts.insert(cfg.port);
    }

    error.clear();
    return out;
}

QVector<ServiceConfig> ServiceTable::loadFromFile(const QString& filePath,
                                                  const QString& projectsRoot, QString& error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open service table: " + filePath;
        return {};
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "service table parse error: " + parseErr.errorString();
        return {};
    }
    if (!doc.isObject()) {
        error = "service table must contain a JSON object";
        return {};
    }

    const QString root = projectsRoot.isEmpty() ? QFileInfo(filePath).absolutePath() : projectsRoot;
    return fromJson(doc.object(), root, error);
}

} // namespace mcphub
