#pragma once

#include <QJsonValue>
#include <QString>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * tools/call 结果的文本形式
 */
struct ToolResultText {
    bool isError = false; // result.isError == true
    QString text;         // content 中 text 项按行拼接
    QJsonValue raw;       // 原始 result
};

/**
 * 展平 tools/call 的 result
 * {content:[{type:"text",text}]} 取 text；无文本内容时返回 structuredContent
 * 或整个 result 的紧凑 JSON
 */
MCPHUB_API ToolResultText flattenToolResult(const QJsonValue& result);

} // namespace mcphub
