#pragma once

#include <QByteArray>
#include <QString>
#include <memory>
#include <spdlog/spdlog.h>

namespace mcphub_server {

/**
 * 单个服务子进程的输出日志（<logDir>/<serviceId>.log，滚动）
 *
 * stdout 按行缓冲；stderr 行加 "[stderr]" 前缀；监管事件加 "[hub]" 前缀。
 * stdio 服务的 stdout 是协议通道，不经过这里。
 */
class ChildLogWriter {
public:
    ChildLogWriter(const QString& serviceId, const QString& logPath,
                   qint64 maxBytes = 10 * 1024 * 1024, int maxFiles = 3);
    ~ChildLogWriter();

    ChildLogWriter(const ChildLogWriter&) = delete;
    ChildLogWriter& operator=(const ChildLogWriter&) = delete;

    void appendStdout(const QByteArray& data);
    void appendStderrLine(const QString& line);
    void appendEvent(const QString& message);

    bool isOpen() const { return m_logger != nullptr; }
    QString logPath() const { return m_logPath; }
    QString serviceId() const { return m_serviceId; }

private:
    void flushLines();

    std::shared_ptr<spdlog::logger> m_logger;
    QByteArray m_stdoutBuf;
    QString m_serviceId;
    QString m_logPath;

    static constexpr qint64 kMaxBufferBytes = 1 * 1024 * 1024;
};

} // namespace mcphub_server
