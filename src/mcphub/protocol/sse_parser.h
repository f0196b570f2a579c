#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * text/event-stream 帧
 */
struct SseEvent {
    QString event;   // "event:" 字段，缺省为 "message"
    QByteArray data; // 多个 "data:" 行以 \n 拼接
    QString id;
};

/**
 * 增量事件流解析器
 * 按空行切帧，忽略注释行（以 ':' 开头）
 */
class MCPHUB_API SseParser {
public:
    /**
     * 追加字节并取出所有已完整的帧
     */
    QVector<SseEvent> feed(const QByteArray& chunk);

    /**
     * 流结束时取出未以空行收尾的最后一帧
     */
    QVector<SseEvent> finish();

    void clear();

private:
    void processLine(const QByteArray& line, QVector<SseEvent>& out);
    void dispatch(QVector<SseEvent>& out);

    QByteArray m_buffer;
    SseEvent m_current;
    bool m_hasData = false;
};

} // namespace mcphub
