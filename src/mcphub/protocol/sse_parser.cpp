#include "sse_parser.h"

namespace mcphub {

QVector<SseEvent> SseParser::feed(const QByteArray& chunk) {
    QVector<SseEvent> out;
    m_buffer.append(chunk);
    while (true) {
        const qsizetype nl = m_buffer.indexOf('\n');
        if (nl < 0) {
            break;
        }
        QByteArray line = m_buffer.left(nl);
        m_buffer.remove(0, nl + 1);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        processLine(line, out);
    }
    return out;
}

QVector<SseEvent> SseParser::finish() {
    QVector<SseEvent> out;
    if (!m_buffer.isEmpty()) {
        QByteArray line = m_buffer;
        m_buffer.clear();
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        processLine(line, out);
    }
    dispatch(out);
    return out;
}

void SseParser::clear() {
    m_buffer.clear();
    m_current = SseEvent{};
    m_hasData = false;
}

void SseParser::processLine(const QByteArray& line, QVector<SseEvent>& out) {
    if (line.isEmpty()) {
        dispatch(out);
        return;
    }
    if (line.startsWith(':')) {
        return;
    }

    const qsizetype colon = line.indexOf(':');
    const QByteArray field = colon < 0 ? line : line.left(colon);
    QByteArray value = colon < 0 ? QByteArray() : line.mid(colon + 1);
    if (value.startsWith(' ')) {
        value.remove(0, 1);
    }

    if (field == "data") {
        if (m_hasData) {
            m_current.data.append('\n');
        }
        m_current.data.append(value);
        m_hasData = true;
    } else if (field == "event") {
        m_current.event = QString::fromUtf8(value);
    } else if (field == "id") {
        m_current.id = QString::fromUtf8(value);
    }
    // retry 与未知字段忽略
}

void SseParser::dispatch(QVector<SseEvent>& out) {
    if (m_hasData) {
        if (m_current.event.isEmpty()) {
            m_current.event = QStringLiteral("message");
        }
        out.push_back(m_current);
    }
    m_current = SseEvent{};
    m_hasData = false;
}

} // namespace mcphub
