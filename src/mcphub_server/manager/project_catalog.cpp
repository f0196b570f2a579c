#include "project_catalog.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

namespace mcphub_server {

ProjectCatalog::ProjectCatalog(const QString& projectsDir, const QString& pythonCommand)
    : m_projectsDir(QDir::cleanPath(QDir(projectsDir).absolutePath()))
    , m_pythonCommand(pythonCommand) {
}

bool ProjectCatalog::isValidProjectId(const QString& id) {
    static const QRegularExpression re("^[A-Za-z0-9_-]+$");
    return !id.isEmpty() && re.match(id).hasMatch();
}

QStringList ProjectCatalog::entryFileCandidates() {
    return {"server.py", "main.py", "app.py", "__main__.py"};
}

QString ProjectCatalog::projectDir(const QString& projectId) const {
    return QDir(m_projectsDir).filePath(projectId);
}

bool ProjectCatalog::exists(const QString& projectId) const {
    return isValidProjectId(projectId) && QFileInfo(projectDir(projectId)).isDir();
}

QStringList ProjectCatalog::listProjects() const {
    QStringList out;
    const QDir dir(m_projectsDir);
    if (!dir.exists()) {
        return out;
    }
    const auto entries = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& entry : entries) {
        if (isValidProjectId(entry)) {
            out.append(entry);
        }
    }
    return out;
}

QString ProjectCatalog::interpreterFor(const QString& dir) const {
#ifdef Q_OS_WIN
    const QString venvPython = QDir(dir).filePath(".venv/Scripts/python.exe");
#else
    const QString venvPython = QDir(dir).filePath(".venv/bin/python");
#endif
    if (QFileInfo(venvPython).isExecutable()) {
        return venvPython;
    }
    return m_pythonCommand;
}

bool ProjectCatalog::loadProjectFile(const QString& path, mcphub::ServiceConfig& out,
                                     QString& error) const {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open project file: " + path;
        return false;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "project.json must contain a JSON object";
        return false;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {"command", "args", "env", "description"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in project.json: " + it.key();
            return false;
        }
    }

    if (!obj.value("command").isString() || obj.value("command").toString().isEmpty()) {
        error = "project.json field 'command' must be a non-empty string";
        return false;
    }
    out.command = obj.value("command").toString();

    if (obj.contains("args")) {
        if (!obj.value("args").isArray()) {
            error = "project.json field 'args' must be an array";
            return false;
        }
        for (const QJsonValue& v : obj.value("args").toArray()) {
            if (!v.isString()) {
                error = "project.json field 'args' must contain strings";
                return false;
            }
            out.args.append(v.toString());
        }
    }

    if (obj.contains("env")) {
        if (!obj.value("env").isObject()) {
            error = "project.json field 'env' must be an object";
            return false;
        }
        const QJsonObject env = obj.value("env").toObject();
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().isString()) {
                error = "project.json env value for '" + it.key() + "' must be a string";
                return false;
            }
            out.env.insert(it.key(), it.value().toString());
        }
    }

    out.description = obj.value("description").toString();
    return true;
}

ProjectCatalog::ResolveError ProjectCatalog::resolve(const QString& projectId,
                                                     mcphub::ServiceConfig& out,
                                                     QString& error) const {
    if (!isValidProjectId(projectId)) {
        error = "invalid project id: " + projectId;
        return ResolveError::InvalidId;
    }
    if (!exists(projectId)) {
        error = "project not found: " + projectId;
        return ResolveError::NotFound;
    }

    mcphub::ServiceConfig cfg;
    cfg.id = projectId;
    cfg.transport = mcphub::TransportKind::Stdio;
    cfg.projectDir = projectDir(projectId);

    const QString projectFile = QDir(cfg.projectDir).filePath("project.json");
    if (QFileInfo::exists(projectFile)) {
        if (!loadProjectFile(projectFile, cfg, error)) {
            return ResolveError::Invalid;
        }
        out = cfg;
        return ResolveError::None;
    }

    for (const QString& candidate : entryFileCandidates()) {
        if (QFileInfo(QDir(cfg.projectDir).filePath(candidate)).isFile()) {
            cfg.command = interpreterFor(cfg.projectDir);
            cfg.args = {candidate};
            // 子进程输出不缓冲，stderr 能及时进入日志
            cfg.env.insert("PYTHONUNBUFFERED", "1");
            out = cfg;
            return ResolveError::None;
        }
    }

    error = QString("no entry file (%1) in project %2")
                .arg(entryFileCandidates().join(", "), projectId);
    return ResolveError::Invalid;
}

} // namespace mcphub_server
