#include "jsonl_parser.h"

namespace mcphub {

bool JsonlParser::append(const QByteArray& data) {
    if (m_discarding) {
        const qsizetype nl = data.indexOf('\n');
        if (nl < 0) {
            return true;
        }
        m_discarding = false;
        m_buffer.append(data.constData() + nl + 1, data.size() - nl - 1);
    } else {
        m_buffer.append(data);
    }
    if (m_buffer.size() <= m_maxBufferBytes) {
        return true;
    }
    // 只有尚未出现换行的尾部才算超限
    const qsizetype lastNl = m_buffer.lastIndexOf('\n');
    if (lastNl >= 0 && m_buffer.size() - lastNl - 1 <= m_maxBufferBytes) {
        return true;
    }
    m_buffer.truncate(lastNl + 1);
    m_discarding = true;
    return false;
}

bool JsonlParser::tryReadLine(QByteArray& outLine) {
    const qsizetype idx = m_buffer.indexOf('\n');
    if (idx < 0) {
        return false;
    }
    outLine = m_buffer.left(idx);
    m_buffer.remove(0, idx + 1);
    if (outLine.endsWith('\r')) {
        outLine.chop(1);
    }
    return true;
}

void JsonlParser::clear() {
    m_buffer.clear();
    m_discarding = false;
}

} // namespace mcphub
