#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 传输方式
 */
enum class TransportKind {
    Stdio, // 子进程 stdin/stdout，按行分帧
    Sse,   // POST /sse，响应为 text/event-stream
    Http   // POST /mcp，响应体为单个 JSON
};

MCPHUB_API QString transportKindToString(TransportKind kind);
MCPHUB_API bool transportKindFromString(const QString& str, TransportKind& out);

/**
 * 传输层错误类型
 */
enum class TransportErrorKind {
    None,
    Unavailable, // 无法建立通道（可执行文件或端口不可达）
    Closed       // 通道已关闭
};

/**
 * connect/send 的结果
 */
struct TransportResult {
    bool ok = true;
    TransportErrorKind kind = TransportErrorKind::None;
    QString message;

    static TransportResult success() { return {}; }
    static TransportResult unavailable(const QString& msg) {
        return {false, TransportErrorKind::Unavailable, msg};
    }
    static TransportResult closed(const QString& msg) {
        return {false, TransportErrorKind::Closed, msg};
    }
};

/**
 * 与一个 MCP 对端交换 JSON-RPC 消息的通道
 *
 * 入站消息通过 messageReceived 逐条投递；通道结束时 finished 只发射一次，
 * clean 表示对端正常关闭（退出码 0）。close() 由宿主主动调用，不发射 finished。
 * 格式错误的帧只报告 protocolViolation，不会结束通道。
 */
class MCPHUB_API TransportClient : public QObject {
    Q_OBJECT
public:
    explicit TransportClient(QObject* parent = nullptr);
    ~TransportClient() override;

    virtual TransportKind kind() const = 0;

    /**
     * 建立通道：stdio 启动子进程并接管管道，sse/http 确认对端 /health 可达
     */
    virtual TransportResult connectToPeer() = 0;

    /**
     * 写出一条完整消息
     */
    virtual TransportResult send(const QJsonObject& message) = 0;

    /**
     * 释放管道、连接和子进程；可重复调用
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// 对端进程 pid，网络传输返回 0
    virtual qint64 peerPid() const { return 0; }

    int protocolViolationCount() const { return m_violations; }

signals:
    void messageReceived(const QJsonObject& message);
    void finished(bool clean, const QString& reason);
    void protocolViolation(const QString& detail);

protected:
    void reportViolation(const QString& detail);
    void reportFinished(bool clean, const QString& reason);
    void resetFinished() { m_finishedReported = false; }

private:
    int m_violations = 0;
    bool m_finishedReported = false;
};

} // namespace mcphub
