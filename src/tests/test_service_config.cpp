#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "mcphub/supervisor/service_config.h"

using namespace mcphub;

namespace {

QJsonObject parse(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

// ============================================
// 单项解析
// ============================================

TEST(ServiceConfig, ParsesFullEntry) {
    QString error;
    const ServiceConfig cfg = ServiceConfig::fromJson("camera", parse(R"({
        "enabled": true,
        "port": 3001,
        "transport": "sse",
        "project_dir": "camera-mcp",
        "description": "Camera tools",
        "host": "0.0.0.0",
        "env": {"CAMERA_ID": "0"}
    })"), "/srv/projects", error);

    ASSERT_TRUE(error.isEmpty()) << qPrintable(error);
    EXPECT_EQ(cfg.id, "camera");
    EXPECT_EQ(cfg.transport, TransportKind::Sse);
    EXPECT_EQ(cfg.port, 3001);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.projectDir, "/srv/projects/camera-mcp");
    EXPECT_EQ(cfg.env.value("CAMERA_ID"), "0");
    EXPECT_TRUE(cfg.isNetwork());
}

TEST(ServiceConfig, StdioDefaultsNeedNoPort) {
    QString error;
    const ServiceConfig cfg =
        ServiceConfig::fromJson("mic", parse(R"({"project_dir": "/abs/mic"})"), "/root", error);
    ASSERT_TRUE(error.isEmpty()) << qPrintable(error);
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.transport, TransportKind::Stdio);
    EXPECT_EQ(cfg.projectDir, "/abs/mic");
    EXPECT_FALSE(cfg.hasPort());
}

TEST(ServiceConfig, StreamableHttpAlias) {
    QString error;
    const ServiceConfig cfg = ServiceConfig::fromJson(
        "s", parse(R"({"transport": "streamable-http", "port": 3100, "project_dir": "p"})"), "",
        error);
    ASSERT_TRUE(error.isEmpty());
    EXPECT_EQ(cfg.transport, TransportKind::Http);
}

TEST(ServiceConfig, Errors) {
    QString error;
    ServiceConfig::fromJson("a", parse(R"({"transport": "grpc", "project_dir": "p"})"), "", error);
    EXPECT_TRUE(error.contains("unknown transport"));

    ServiceConfig::fromJson("a", parse(R"({"transport": "http", "project_dir": "p"})"), "", error);
    EXPECT_TRUE(error.contains("requires a port"));

    ServiceConfig::fromJson("a", parse(R"({"port": 70000, "project_dir": "p"})"), "", error);
    EXPECT_TRUE(error.contains("out of range"));

    ServiceConfig::fromJson("a", parse(R"({"transport": "stdio"})"), "", error);
    EXPECT_TRUE(error.contains("project_dir"));

    ServiceConfig::fromJson("a", parse(R"({"project_dir": "p", "bogus": 1})"), "", error);
    EXPECT_TRUE(error.contains("unknown field"));

    ServiceConfig::fromJson("a", parse(R"({"project_dir": "p", "args": [1]})"), "", error);
    EXPECT_FALSE(error.isEmpty());

    ServiceConfig::fromJson("bad id", parse(R"({"project_dir": "p"})"), "", error);
    EXPECT_TRUE(error.contains("invalid service id"));
}

// ============================================
// 启动参数
// ============================================

TEST(ServiceConfig, DefaultLaunchCommandForNetwork) {
    ServiceConfig cfg;
    cfg.transport = TransportKind::Sse;
    cfg.host = "localhost";
    cfg.port = 3002;
    cfg.projectDir = "/p/speaker";

    const LaunchSpec spec = cfg.launchSpec(QProcessEnvironment());
    EXPECT_EQ(spec.program, "uv");
    EXPECT_EQ(spec.arguments, (QStringList{"run", "python", "server.py", "--transport", "sse",
                                           "--host", "localhost", "--port", "3002"}));
    EXPECT_EQ(spec.workingDirectory, "/p/speaker");
    EXPECT_EQ(spec.environment.value("PYTHONPATH"), "/p/speaker");
}

TEST(ServiceConfig, DefaultLaunchCommandForStdio) {
    ServiceConfig cfg;
    cfg.projectDir = "/p/mic";
    const LaunchSpec spec = cfg.launchSpec(QProcessEnvironment());
    EXPECT_EQ(spec.arguments,
              (QStringList{"run", "python", "server.py", "--transport", "stdio"}));
}

TEST(ServiceConfig, CustomCommandAndEnv) {
    ServiceConfig cfg;
    cfg.projectDir = "/p/x";
    cfg.command = "node";
    cfg.args = {"index.js"};
    cfg.env.insert("MODE", "debug");

    QProcessEnvironment base;
    base.insert("PYTHONPATH", "/lib");
    const LaunchSpec spec = cfg.launchSpec(base);
    EXPECT_EQ(spec.program, "node");
    EXPECT_EQ(spec.arguments, QStringList{"index.js"});
    EXPECT_EQ(spec.environment.value("MODE"), "debug");
    EXPECT_EQ(spec.environment.value("PYTHONPATH"), "/p/x" + QString(QDir::listSeparator()) + "/lib");
}

// ============================================
// 服务表
// ============================================

TEST(ServiceTable, LoadFromFile) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.filePath("mcp_config.json");
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(R"({
        "camera": {"enabled": true, "port": 3001, "transport": "sse", "project_dir": "camera-mcp"},
        "mic": {"enabled": false, "port": 3001, "transport": "sse", "project_dir": "mic-mcp"}
    })");
    f.close();

    QString error;
    const auto services = ServiceTable::loadFromFile(path, QString(), error);
    ASSERT_TRUE(error.isEmpty()) << qPrintable(error);
    ASSERT_EQ(services.size(), 2);
    // 相对路径相对服务表所在目录
    EXPECT_EQ(services[0].projectDir, QDir::cleanPath(tmp.path() + "/camera-mcp"));
}

TEST(ServiceTable, DuplicateEnabledPortsRejected) {
    QString error;
    const auto services = ServiceTable::fromJson(parse(R"({
        "a": {"port": 3001, "transport": "sse", "project_dir": "a"},
        "b": {"port": 3001, "transport": "http", "project_dir": "b"}
    })"), "/p", error);
    EXPECT_TRUE(services.isEmpty());
    EXPECT_TRUE(error.contains("already used"));
}

TEST(ServiceTable, NonObjectEntryRejected) {
    QString error;
    ServiceTable::fromJson(parse(R"({"a": 3})"), "/p", error);
    EXPECT_TRUE(error.contains("must be a JSON object"));
}

TEST(ServiceTable, MissingFileAndBadJson) {
    QString error;
    ServiceTable::loadFromFile("/nonexistent/mcp_config.json", QString(), error);
    EXPECT_TRUE(error.contains("cannot open"));

    QTemporaryDir tmp;
    const QString path = tmp.filePath("bad.json");
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("[1, 2");
    f.close();
    ServiceTable::loadFromFile(path, QString(), error);
    EXPECT_TRUE(error.contains("parse error"));
}
