#pragma once

#include <memory>

#include "mcphub/process/child_process.h"
#include "mcphub/protocol/jsonl_parser.h"
#include "transport_client.h"

namespace mcphub {

/**
 * stdio 传输：拥有一个子进程，stdout 每行一个 JSON 对象，stderr 作为日志行
 */
class MCPHUB_API StdioTransport : public TransportClient {
    Q_OBJECT
public:
    explicit StdioTransport(const LaunchSpec& spec,
                            int graceMs = ChildProcess::kDefaultGraceMs,
                            QObject* parent = nullptr);
    ~StdioTransport() override;

    TransportKind kind() const override { return TransportKind::Stdio; }
    TransportResult connectToPeer() override;
    TransportResult send(const QJsonObject& message) override;
    void close() override;
    bool isOpen() const override;
    qint64 peerPid() const override;

    ChildProcess* process() const { return m_child.get(); }

private:
    void onStdoutData(const QByteArray& data);
    void onChildExited(int exitCode, QProcess::ExitStatus status);

    LaunchSpec m_spec;
    int m_graceMs;
    std::unique_ptr<ChildProcess> m_child;
    JsonlParser m_parser;
    bool m_closing = false;
};

} // namespace mcphub
