#include <gtest/gtest.h>

#include <QElapsedTimer>
#include <QJsonArray>
#include <QSignalSpy>

#include "helpers/test_utils.h"
#include "mcphub/platform/process_utils.h"
#include "mcphub/protocol/jsonrpc_codec.h"
#include "mcphub/transport/stdio_transport.h"

using namespace mcphub;
using namespace test_utils;

namespace {

LaunchSpec childSpec(const QStringList& args = {}) {
    LaunchSpec spec;
    spec.program = testBinaryPath("test_mcp_child");
    spec.arguments = args;
    return spec;
}

} // namespace

TEST(StdioTransport, MissingExecutableIsUnavailable) {
    LaunchSpec spec;
    spec.program = "/nonexistent/mcp_server_binary";
    StdioTransport transport(spec);

    const TransportResult r = transport.connectToPeer();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, TransportErrorKind::Unavailable);
    EXPECT_FALSE(transport.isOpen());
}

TEST(StdioTransport, SendBeforeConnectIsClosed) {
    StdioTransport transport(childSpec());
    const TransportResult r = transport.send(makeRequest(1, "ping"));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, TransportErrorKind::Closed);
}

TEST(StdioTransport, RequestResponseRoundTrip) {
    StdioTransport transport(childSpec());
    ASSERT_TRUE(transport.connectToPeer().ok);
    EXPECT_TRUE(transport.isOpen());
    EXPECT_GT(transport.peerPid(), 0);

    QVector<QJsonObject> received;
    QObject::connect(&transport, &TransportClient::messageReceived,
                     [&received](const QJsonObject& msg) { received.append(msg); });

    ASSERT_TRUE(transport.send(makeRequest(1, "tools/list")).ok);
    ASSERT_TRUE(waitUntil([&]() { return !received.isEmpty(); }));

    EXPECT_EQ(received[0].value("id").toInt(), 1);
    EXPECT_GE(received[0].value("result").toObject().value("tools").toArray().size(), 7);
}

TEST(StdioTransport, GarbageLineIsViolationNotFatal) {
    StdioTransport transport(childSpec());
    ASSERT_TRUE(transport.connectToPeer().ok);

    QSignalSpy violations(&transport, &TransportClient::protocolViolation);
    QVector<QJsonObject> received;
    QObject::connect(&transport, &TransportClient::messageReceived,
                     [&received](const QJsonObject& msg) { received.append(msg); });

    transport.send(makeRequest(5, "tools/call", QJsonObject{{"name", "garbage"}}));
    ASSERT_TRUE(waitUntil([&]() { return !received.isEmpty(); }));

    EXPECT_EQ(violations.count(), 1);
    EXPECT_EQ(transport.protocolViolationCount(), 1);
    EXPECT_EQ(received[0].value("id").toInt(), 5);
    EXPECT_TRUE(transport.isOpen());
}

TEST(StdioTransport, ChildExitReportsFinishedOnce) {
    StdioTransport transport(childSpec({"--exit-after-ms=100", "--exit-code=7"}));
    ASSERT_TRUE(transport.connectToPeer().ok);

    QSignalSpy finished(&transport, &TransportClient::finished);
    ASSERT_TRUE(waitUntil([&]() { return finished.count() > 0; }));
    waitMs(100);

    ASSERT_EQ(finished.count(), 1);
    EXPECT_FALSE(finished.at(0).at(0).toBool());
    EXPECT_TRUE(finished.at(0).at(1).toString().contains("exitCode=7"));
    EXPECT_FALSE(transport.isOpen());
}

TEST(StdioTransport, CleanExitIsClean) {
    StdioTransport transport(childSpec({"--exit-after-ms=50"}));
    ASSERT_TRUE(transport.connectToPeer().ok);

    QSignalSpy finished(&transport, &TransportClient::finished);
    ASSERT_TRUE(waitUntil([&]() { return finished.count() > 0; }));
    EXPECT_TRUE(finished.at(0).at(0).toBool());
}

TEST(StdioTransport, CloseDoesNotReportFinishedAndReapsChild) {
    StdioTransport transport(childSpec(), 500);
    ASSERT_TRUE(transport.connectToPeer().ok);
    const qint64 pid = transport.peerPid();
    ASSERT_TRUE(ProcessUtils::isProcessAlive(pid));

    QSignalSpy finished(&transport, &TransportClient::finished);
    transport.close();
    transport.close();

    EXPECT_FALSE(transport.isOpen());
    EXPECT_TRUE(waitUntil([pid]() { return !ProcessUtils::isProcessAlive(pid); }, 3000));
    EXPECT_EQ(finished.count(), 0);
}

TEST(StdioTransport, CloseReturnsBeforeGraceAndKillsChildThatIgnoresTerm) {
    StdioTransport transport(childSpec({"--ignore-term"}), 800);
    ASSERT_TRUE(transport.connectToPeer().ok);
    const qint64 pid = transport.peerPid();

    QElapsedTimer timer;
    timer.start();
    transport.close();
    EXPECT_LT(timer.elapsed(), 400);

    waitMs(300);
    EXPECT_TRUE(ProcessUtils::isProcessAlive(pid));
    EXPECT_TRUE(waitUntil([pid]() { return !ProcessUtils::isProcessAlive(pid); }, 3000));
}

TEST(StdioTransport, DestroyingTransportStillReapsChild) {
    qint64 pid = 0;
    {
        StdioTransport transport(childSpec({"--ignore-term"}), 200);
        ASSERT_TRUE(transport.connectToPeer().ok);
        pid = transport.peerPid();
    }
    EXPECT_TRUE(waitUntil([pid]() { return !ProcessUtils::isProcessAlive(pid); }, 3000));
}

TEST(StdioTransport, StderrLinesAreSurfaced) {
    StdioTransport transport(childSpec({"--stderr=booting child"}));
    ASSERT_TRUE(transport.connectToPeer().ok);
    ASSERT_NE(transport.process(), nullptr);

    QStringList lines;
    QObject::connect(transport.process(), &ChildProcess::stderrLine,
                     [&lines](const QString& line) { lines.append(line); });
    ASSERT_TRUE(waitUntil([&]() {
        return !lines.isEmpty() || !transport.process()->recentStderr().isEmpty();
    }));

    const QStringList all = lines + transport.process()->recentStderr();
    EXPECT_TRUE(all.contains("booting child"));
}
