#include "child_log_writer.h"

#include <spdlog/sinks/rotating_file_sink.h>

namespace mcphub_server {

ChildLogWriter::ChildLogWriter(const QString& serviceId, const QString& logPath,
                               qint64 maxBytes, int maxFiles)
    : m_serviceId(serviceId)
    , m_logPath(logPath) {
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.toStdString(), static_cast<size_t>(maxBytes), static_cast<size_t>(maxFiles));

        m_logger = std::make_shared<spdlog::logger>("child_" + serviceId.toStdString() + "_"
                                                        + logPath.toStdString(),
                                                    sink);
        m_logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ | %v", spdlog::pattern_time_type::utc);
        m_logger->set_level(spdlog::level::trace);
        m_logger->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        qWarning("ChildLogWriter: cannot open %s for %s: %s", qPrintable(logPath),
                 qPrintable(serviceId), ex.what());
        m_logger.reset();
    }
}

ChildLogWriter::~ChildLogWriter() {
    if (!m_logger) {
        return;
    }
    if (!m_stdoutBuf.isEmpty()) {
        m_logger->info("{}", m_stdoutBuf.toStdString());
    }
    m_logger->flush();
}

void ChildLogWriter::flushLines() {
    int nl = m_stdoutBuf.indexOf('\n');
    while (nl >= 0) {
        QByteArray line = m_stdoutBuf.left(nl);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        m_logger->info("{}", line.toStdString());
        m_stdoutBuf.remove(0, nl + 1);
        nl = m_stdoutBuf.indexOf('\n');
    }
}

void ChildLogWriter::appendStdout(const QByteArray& data) {
    if (!m_logger) {
        return;
    }
    m_stdoutBuf.append(data);
    flushLines();
    // 超长无换行输出直接落盘
    if (m_stdoutBuf.size() > kMaxBufferBytes) {
        m_logger->info("{}", m_stdoutBuf.toStdString());
        m_stdoutBuf.clear();
    }
}

void ChildLogWriter::appendStderrLine(const QString& line) {
    if (m_logger) {
        m_logger->info("[stderr] {}", line.toStdString());
    }
}

void ChildLogWriter::appendEvent(const QString& message) {
    if (m_logger) {
        m_logger->info("[hub] {}", message.toStdString());
    }
}

} // namespace mcphub_server
