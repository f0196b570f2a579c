#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QTemporaryDir>
#include "mcphub_server/utils/server_logger.h"

using namespace mcphub_server;

namespace {

Q_LOGGING_CATEGORY(lcLoggerTest, "mcphub.test")

QStringList readLogLines(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    QStringList lines;
    while (!file.atEnd()) {
        QString line = QString::fromUtf8(file.readLine()).trimmed();
        if (!line.isEmpty()) lines.append(line);
    }
    return lines;
}

ServerLogger::Config fileOnly(const QString& dir, const QString& level) {
    ServerLogger::Config cfg;
    cfg.logLevel = level;
    cfg.logDir = dir;
    cfg.console = false;
    return cfg;
}

} // namespace

TEST(ServerLoggerTest, InfoLevelFiltersDebug) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    QString error;
    ASSERT_TRUE(ServerLogger::init(fileOnly(tmpDir.path(), "info"), error)) << qPrintable(error);
    qDebug("d");
    qInfo("i");
    qWarning("w");
    qCritical("e");
    ServerLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/server.log");
    EXPECT_EQ(lines.size(), 3);
    for (const auto& line : lines) {
        EXPECT_FALSE(line.contains("[D]"));
    }
}

TEST(ServerLoggerTest, WarnLevelFiltersDebugAndInfo) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    QString error;
    ASSERT_TRUE(ServerLogger::init(fileOnly(tmpDir.path(), "warn"), error)) << qPrintable(error);
    qDebug("d");
    qInfo("i");
    qWarning("w");
    qCritical("e");
    ServerLogger::shutdown();

    EXPECT_EQ(readLogLines(tmpDir.path() + "/server.log").size(), 2);
}

TEST(ServerLoggerTest, DebugLevelOutputsAll) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    QString error;
    ASSERT_TRUE(ServerLogger::init(fileOnly(tmpDir.path(), "debug"), error)) << qPrintable(error);
    qDebug("d");
    qInfo("i");
    qWarning("w");
    qCritical("e");
    ServerLogger::shutdown();

    EXPECT_EQ(readLogLines(tmpDir.path() + "/server.log").size(), 4);
}

TEST(ServerLoggerTest, LineFormatAndCategoryPrefix) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    QString error;
    ASSERT_TRUE(ServerLogger::init(fileOnly(tmpDir.path(), "info"), error));
    qCInfo(lcLoggerTest) << "session ready";
    ServerLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/server.log");
    ASSERT_EQ(lines.size(), 1);
    static const QRegularExpression re(
        R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z \[I\] \[mcphub\.test\] .*session ready)");
    EXPECT_TRUE(re.match(lines[0]).hasMatch()) << qPrintable(lines[0]);
}

TEST(ServerLoggerTest, HubFileName) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    ServerLogger::Config cfg = fileOnly(tmpDir.path() + "/logs", "info");
    cfg.fileName = "hub.log";
    QString error;
    ASSERT_TRUE(ServerLogger::init(cfg, error));
    qWarning("hub starting");
    ServerLogger::shutdown();

    EXPECT_TRUE(QFile::exists(tmpDir.path() + "/logs/hub.log"));
    EXPECT_FALSE(QFile::exists(tmpDir.path() + "/logs/server.log"));
}

TEST(ServerLoggerTest, SetLevelTakesEffect) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());

    QString error;
    ASSERT_TRUE(ServerLogger::init(fileOnly(tmpDir.path(), "error"), error));
    qInfo("hidden");
    ServerLogger::setLevel("info");
    qInfo("visible");
    ServerLogger::shutdown();

    const auto lines = readLogLines(tmpDir.path() + "/server.log");
    ASSERT_EQ(lines.size(), 1);
    EXPECT_TRUE(lines[0].contains("visible"));
}
