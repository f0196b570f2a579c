#include <gtest/gtest.h>

#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QHttpServer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QTimer>
#include <QUrl>
#include <memory>

#include "helpers/test_utils.h"
#include "mcphub_server/http/api_router.h"
#include "mcphub_server/manager/debug_session_manager.h"
#include "mcphub_server/server_manager.h"

using namespace mcphub_server;
using namespace test_utils;

namespace {

bool sendRequest(const QString& method, const QUrl& url, const QByteArray& body, int& statusCode,
                 QByteArray& responseBody, QString& error, int timeoutMs = 10000) {
    QNetworkAccessManager manager;
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QNetworkReply* reply = nullptr;
    if (method == "GET") {
        reply = manager.get(req);
    } else if (method == "POST") {
        reply = manager.post(req, body);
    } else if (method == "DELETE") {
        reply = manager.sendCustomRequest(req, "DELETE", body);
    } else {
        error = "unsupported method";
        return false;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(timeoutMs);
    loop.exec();
    if (!timeout.isActive()) {
        reply->abort();
        error = "request timeout";
        reply->deleteLater();
        return false;
    }
    timeout.stop();

    statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    responseBody = reply->readAll();
    if (reply->error() != QNetworkReply::NoError && statusCode == 0) {
        error = reply->errorString();
        reply->deleteLater();
        return false;
    }

    reply->deleteLater();
    error.clear();
    return true;
}

QJsonObject parseObject(const QByteArray& body) {
    return QJsonDocument::fromJson(body).object();
}

} // namespace

class ApiRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_tmp.isValid());
        const QString root = m_tmp.path();
        addProject(root, "demo");
        addProject(root, "silent", {"--no-init"});
        addProject(root, "other");

        ServerConfig cfg;
        cfg.callTimeoutMs = 1500;
        cfg.startupTimeoutMs = 1500;
        cfg.shutdownGraceMs = 500;
        cfg.portRangeStart = 4100;
        cfg.portRangeEnd = 4102;
        m_manager = std::make_unique<ServerManager>(root, cfg);
        QString error;
        ASSERT_TRUE(m_manager->initialize(error)) << qPrintable(error);

        m_router = std::make_unique<ApiRouter>(m_manager.get());
        m_router->registerRoutes(m_server);

        if (!m_tcp.listen(QHostAddress::LocalHost, 0)) {
            GTEST_SKIP() << "Cannot listen in current environment";
        }
        if (!m_server.bind(&m_tcp)) {
            GTEST_SKIP() << "Cannot bind QHttpServer in current environment";
        }
        m_base = QString("http://127.0.0.1:%1").arg(m_tcp.serverPort());
    }

    void TearDown() override {
        if (m_manager) {
            m_manager->shutdown();
        }
    }

    static void addProject(const QString& root, const QString& id, const QStringList& args = {}) {
        const QString dir = root + "/projects/" + id;
        ASSERT_TRUE(QDir().mkpath(dir));
        QFile f(dir + "/project.json");
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write(QJsonDocument(QJsonObject{{"command", testBinaryPath("test_mcp_child")},
                                          {"args", QJsonArray::fromStringList(args)}})
                    .toJson());
    }

    QJsonObject call(const QString& method, const QString& path, int expectedStatus,
                     const QJsonObject& body = {}) {
        int status = 0;
        QByteArray response;
        QString error;
        const QByteArray payload =
            body.isEmpty() ? QByteArray() : QJsonDocument(body).toJson(QJsonDocument::Compact);
        EXPECT_TRUE(sendRequest(method, QUrl(m_base + path), payload, status, response, error))
            << qPrintable(error);
        EXPECT_EQ(status, expectedStatus) << method.toStdString() << " " << path.toStdString()
                                          << " -> " << response.toStdString();
        return parseObject(response);
    }

    QTemporaryDir m_tmp;
    std::unique_ptr<ServerManager> m_manager;
    std::unique_ptr<ApiRouter> m_router;
    QHttpServer m_server;
    QTcpServer m_tcp;
    QString m_base;
};

// ============================================
// 调试会话
// ============================================

TEST_F(ApiRouterTest, StartExecuteStop) {
    QJsonObject obj = call("POST", "/api/debug/demo/start", 200);
    EXPECT_EQ(obj.value("project_id").toString(), "demo");
    EXPECT_EQ(obj.value("tools").toArray().size(), 7);
    EXPECT_TRUE(m_manager->debugSessions()->hasActiveSession("demo"));

    obj = call("POST", "/api/debug/demo/execute", 200,
               QJsonObject{{"tool_name", "echo"}, {"parameters", QJsonObject{{"text", "hi"}}}});
    EXPECT_TRUE(obj.value("success").toBool());
    EXPECT_EQ(obj.value("result").toString(), "hi");
    EXPECT_TRUE(obj.contains("execution_time"));

    obj = call("GET", "/api/debug/demo/tools", 200);
    EXPECT_EQ(obj.value("tools").toArray().size(), 7);

    obj = call("GET", "/api/debug/demo/status", 200);
    EXPECT_TRUE(obj.value("active").toBool());
    EXPECT_EQ(obj.value("session").toObject().value("execution_count").toInt(), 1);

    call("POST", "/api/debug/demo/stop", 200);
    EXPECT_FALSE(m_manager->debugSessions()->hasActiveSession("demo"));

    // 再次停止仍然成功
    call("POST", "/api/debug/demo/stop", 200);
}

TEST_F(ApiRouterTest, SecondStartConflicts) {
    call("POST", "/api/debug/demo/start", 200);
    const QJsonObject obj = call("POST", "/api/debug/demo/start", 409);
    EXPECT_EQ(obj.value("errorKind").toString(), "SessionAlreadyActive");
}

TEST_F(ApiRouterTest, UnknownProjectIsNotFound) {
    QJsonObject obj = call("POST", "/api/debug/ghost/start", 404);
    EXPECT_EQ(obj.value("errorKind").toString(), "ProjectNotFound");
    call("POST", "/api/debug/ghost/stop", 404);
    call("GET", "/api/debug/ghost/status", 404);
}

TEST_F(ApiRouterTest, HandshakeTimeoutIsGatewayTimeout) {
    const QJsonObject obj = call("POST", "/api/debug/silent/start", 504);
    EXPECT_EQ(obj.value("errorKind").toString(), "Timeout");
    EXPECT_FALSE(m_manager->debugSessions()->hasActiveSession("silent"));
}

TEST_F(ApiRouterTest, FastExecuteIsNotHeldBehindSlowOne) {
    call("POST", "/api/debug/demo/start", 200);
    call("POST", "/api/debug/other/start", 200);

    QNetworkAccessManager nam;
    auto post = [&](const QString& id, int ms) {
        QNetworkRequest req(QUrl(m_base + "/api/debug/" + id + "/execute"));
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
        const QJsonObject body{{"tool_name", "sleep"}, {"parameters", QJsonObject{{"ms", ms}}}};
        return nam.post(req, QJsonDocument(body).toJson(QJsonDocument::Compact));
    };

    QElapsedTimer timer;
    timer.start();
    QStringList order;
    qint64 fastMs = -1;

    // 先到的请求较快；同步实现下它要等后到的慢请求返回
    QNetworkReply* fast = post("demo", 300);
    QObject::connect(fast, &QNetworkReply::finished, [&]() {
        fastMs = timer.elapsed();
        order.append("fast");
    });
    waitMs(50);
    QNetworkReply* slow = post("other", 1200);
    QObject::connect(slow, &QNetworkReply::finished, [&]() { order.append("slow"); });

    ASSERT_TRUE(waitUntil([&]() { return order.size() == 2; }, 5000));
    EXPECT_EQ(order, (QStringList{"fast", "slow"}));
    EXPECT_LT(fastMs, 1000);

    EXPECT_EQ(parseObject(fast->readAll()).value("result").toString(), "slept 300");
    EXPECT_EQ(parseObject(slow->readAll()).value("result").toString(), "slept 1200");
    fast->deleteLater();
    slow->deleteLater();
}

TEST_F(ApiRouterTest, PendingStartDoesNotBlockOtherRequests) {
    QNetworkAccessManager nam;
    QNetworkRequest req(QUrl(m_base + "/api/debug/silent/start"));
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    QNetworkReply* start = nam.post(req, QByteArray());
    bool startDone = false;
    QObject::connect(start, &QNetworkReply::finished, [&]() { startDone = true; });
    waitMs(200);

    // 握手挂起期间其他请求照常应答
    QElapsedTimer timer;
    timer.start();
    const QJsonObject status = call("GET", "/api/server/status", 200);
    EXPECT_LT(timer.elapsed(), 500);
    EXPECT_FALSE(startDone);
    EXPECT_FALSE(status.isEmpty());

    ASSERT_TRUE(waitUntil([&]() { return startDone; }, 5000));
    EXPECT_EQ(start->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt(), 504);
    start->deleteLater();
}

TEST_F(ApiRouterTest, ExecuteValidation) {
    QJsonObject obj = call("POST", "/api/debug/demo/execute", 409,
                           QJsonObject{{"tool_name", "echo"}});
    EXPECT_EQ(obj.value("errorKind").toString(), "NoActiveSession");

    call("POST", "/api/debug/demo/start", 200);

    obj = call("POST", "/api/debug/demo/execute", 400, QJsonObject{{"parameters", QJsonObject{}}});
    EXPECT_EQ(obj.value("error").toString(), "tool_name is required");

    call("POST", "/api/debug/demo/execute", 400,
         QJsonObject{{"tool_name", "echo"}, {"parameters", QJsonArray{1, 2}}});

    obj = call("POST", "/api/debug/demo/execute", 404, QJsonObject{{"tool_name", "nope"}});
    EXPECT_EQ(obj.value("errorKind").toString(), "UnknownTool");

    obj = call("POST", "/api/debug/demo/execute", 400,
               QJsonObject{{"tool_name", "echo"}, {"parameters", QJsonObject{}}});
    EXPECT_EQ(obj.value("errorKind").toString(), "InvalidArguments");
}

TEST_F(ApiRouterTest, ToolFailureIsReportedInBody) {
    call("POST", "/api/debug/demo/start", 200);
    const QJsonObject obj =
        call("POST", "/api/debug/demo/execute", 200, QJsonObject{{"tool_name", "fail"}});
    EXPECT_FALSE(obj.value("success").toBool());
    EXPECT_EQ(obj.value("errorKind").toString(), "ToolError");
}

TEST_F(ApiRouterTest, MalformedBodyIsBadRequest) {
    call("POST", "/api/debug/demo/start", 200);

    int status = 0;
    QByteArray response;
    QString error;
    ASSERT_TRUE(sendRequest("POST", QUrl(m_base + "/api/debug/demo/execute"), "{not json",
                            status, response, error))
        << qPrintable(error);
    EXPECT_EQ(status, 400);
}

TEST_F(ApiRouterTest, SessionListing) {
    QJsonObject obj = call("GET", "/api/debug/sessions", 200);
    EXPECT_TRUE(obj.value("sessions").toArray().isEmpty());

    call("POST", "/api/debug/demo/start", 200);
    obj = call("GET", "/api/debug/sessions", 200);
    const QJsonArray sessions = obj.value("sessions").toArray();
    ASSERT_EQ(sessions.size(), 1);
    EXPECT_EQ(sessions[0].toObject().value("project_id").toString(), "demo");
}

// ============================================
// 项目、端口与状态
// ============================================

TEST_F(ApiRouterTest, ProjectList) {
    call("POST", "/api/debug/demo/start", 200);

    const QJsonObject obj = call("GET", "/api/projects", 200);
    const QJsonArray projects = obj.value("projects").toArray();
    ASSERT_EQ(projects.size(), 3);

    QMap<QString, bool> active;
    for (const QJsonValue& v : projects) {
        const QJsonObject p = v.toObject();
        active[p.value("id").toString()] = p.value("debug_session_active").toBool();
    }
    EXPECT_TRUE(active.value("demo"));
    EXPECT_FALSE(active.value("silent"));
    EXPECT_FALSE(active.value("other"));
}

TEST_F(ApiRouterTest, PortClaimAndRelease) {
    QJsonObject obj = call("GET", "/api/ports", 200);
    EXPECT_EQ(obj.value("range_start").toInt(), 4100);
    EXPECT_EQ(obj.value("range_end").toInt(), 4102);
    EXPECT_EQ(obj.value("claimed").toInt(), 0);

    obj = call("POST", "/api/ports/claim", 200, QJsonObject{{"port", 4101}});
    EXPECT_EQ(obj.value("port").toInt(), 4101);
    call("POST", "/api/ports/claim", 409, QJsonObject{{"port", 4101}});
    call("POST", "/api/ports/claim", 400, QJsonObject{{"port", 5000}});
    call("POST", "/api/ports/claim", 400, QJsonObject{{"port", "4100"}});

    obj = call("POST", "/api/ports/claim", 200);
    EXPECT_EQ(obj.value("port").toInt(), 4100);
    obj = call("POST", "/api/ports/claim", 200);
    EXPECT_EQ(obj.value("port").toInt(), 4102);
    call("POST", "/api/ports/claim", 503);

    call("POST", "/api/ports/4101/release", 200);
    call("POST", "/api/ports/4101/release", 404);
    call("POST", "/api/ports/abc/release", 400);
    EXPECT_EQ(m_manager->portPool()->claimedCount(), 2);
}

TEST_F(ApiRouterTest, ServerStatus) {
    call("POST", "/api/debug/demo/start", 200);

    const QJsonObject obj = call("GET", "/api/server/status", 200);
    EXPECT_EQ(obj.value("status").toString(), "ok");
    EXPECT_EQ(obj.value("dataRoot").toString(), m_tmp.path());
    EXPECT_GE(obj.value("uptimeMs").toInteger(), 0);

    const QJsonObject counts = obj.value("counts").toObject();
    EXPECT_EQ(counts.value("projects").toInt(), 3);
    EXPECT_EQ(counts.value("sessions").toInt(), 1);
    EXPECT_EQ(counts.value("portsClaimed").toInt(), 0);

    const QJsonObject range = obj.value("portRange").toObject();
    EXPECT_EQ(range.value("start").toInt(), 4100);
    EXPECT_EQ(range.value("end").toInt(), 4102);
}

TEST_F(ApiRouterTest, UnknownRouteIsNotFound) {
    const QJsonObject obj = call("GET", "/api/nothing/here", 404);
    EXPECT_EQ(obj.value("error").toString(), "not found");
}

TEST_F(ApiRouterTest, ShutdownStopsSessions) {
    call("POST", "/api/debug/demo/start", 200);
    DebugSessionInfo info;
    ASSERT_TRUE(m_manager->debugSessions()->sessionInfo("demo", info));
    const qint64 pid = info.pid;
    ASSERT_GT(pid, 0);

    m_manager->shutdown();
    EXPECT_EQ(m_manager->debugSessions()->activeSessionCount(), 0);
    EXPECT_EQ(m_manager->debugSessions()->stoppingProcessCount(), 0);
    EXPECT_FALSE(mcphub::ProcessUtils::isProcessAlive(pid));
}
