#pragma once

#include <QByteArray>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * JSONL 流式分行器
 * 处理字节流中的行分割，支持半行缓冲与缓冲上限
 */
class MCPHUB_API JsonlParser {
public:
    explicit JsonlParser(qint64 maxBufferBytes = kDefaultMaxBufferBytes)
        : m_maxBufferBytes(maxBufferBytes) {}

    /**
     * 追加数据到缓冲区
     * 最后一个换行之后的未完成行超过上限时，只丢弃该行（直到它的换行为止），
     * 之前的完整行仍可读取
     * @return 未超限返回 true；本次发生丢弃返回 false
     */
    bool append(const QByteArray& data);

    /**
     * 尝试读取一行（不含 \n，去掉行尾 \r）
     * @return 成功读取返回 true，无完整行返回 false
     */
    bool tryReadLine(QByteArray& outLine);

    void clear();
    int bufferSize() const { return static_cast<int>(m_buffer.size()); }

    static constexpr qint64 kDefaultMaxBufferBytes = 8 * 1024 * 1024; // 8MB

private:
    QByteArray m_buffer;
    qint64 m_maxBufferBytes;
    bool m_discarding = false; // 正在跳过超限行的剩余部分
};

} // namespace mcphub
