#include "stdio_transport.h"

#include "mcphub/protocol/jsonrpc_codec.h"

namespace mcphub {

StdioTransport::StdioTransport(const LaunchSpec& spec, int graceMs, QObject* parent)
    : TransportClient(parent)
    , m_spec(spec)
    , m_graceMs(graceMs) {
}

StdioTransport::~StdioTransport() {
    close();
    // 仍在宽限期内的子进程交给它自己收尾
    ChildProcess::retire(std::move(m_child), m_graceMs);
}

TransportResult StdioTransport::connectToPeer() {
    if (isOpen()) {
        return TransportResult::success();
    }

    ChildProcess::retire(std::move(m_child), m_graceMs);
    m_child = std::make_unique<ChildProcess>();
    m_parser.clear();
    m_closing = false;
    resetFinished();

    connect(m_child.get(), &ChildProcess::stdoutData, this, &StdioTransport::onStdoutData);
    connect(m_child.get(), &ChildProcess::exited, this, &StdioTransport::onChildExited);

    QString error;
    if (!m_child->start(m_spec, error)) {
        m_child.reset();
        return TransportResult::unavailable(error);
    }
    return TransportResult::success();
}

TransportResult StdioTransport::send(const QJsonObject& message) {
    if (!isOpen()) {
        return TransportResult::closed("stdio channel is closed");
    }
    const QByteArray line = serializeLine(message);
    if (m_child->write(line) != line.size()) {
        return TransportResult::closed("failed to write to child stdin: " + m_child->exitContext());
    }
    return TransportResult::success();
}

void StdioTransport::close() {
    if (!m_child || m_closing) {
        return;
    }
    m_closing = true;
    // 宿主主动关闭不上报 finished；子进程异步退出
    m_child->disconnect(this);
    m_child->stop(m_graceMs);
}

bool StdioTransport::isOpen() const {
    return m_child && !m_closing && m_child->isRunning();
}

qint64 StdioTransport::peerPid() const {
    return m_child ? m_child->pid() : 0;
}

void StdioTransport::onStdoutData(const QByteArray& data) {
    if (!m_parser.append(data)) {
        reportViolation(QString("stdout line exceeds %1 bytes, line discarded")
                            .arg(JsonlParser::kDefaultMaxBufferBytes));
    }

    QByteArray line;
    while (m_parser.tryReadLine(line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        QJsonObject obj;
        QString error;
        if (!parseObjectLine(line, obj, error)) {
            reportViolation(error + ", raw=" + QString::fromUtf8(line.left(200)));
            continue;
        }
        emit messageReceived(obj);
    }
}

void StdioTransport::onChildExited(int exitCode, QProcess::ExitStatus status) {
    if (m_closing) {
        return;
    }
    const bool clean = status == QProcess::NormalExit && exitCode == 0;
    QString reason = m_child->exitContext();
    const QStringList tail = m_child->recentStderr();
    if (!clean && !tail.isEmpty()) {
        reason += ", stderr=" + tail.last();
    }
    reportFinished(clean, reason);
}

} // namespace mcphub
