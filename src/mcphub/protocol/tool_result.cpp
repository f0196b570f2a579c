#include "tool_result.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace mcphub {

namespace {

QString compactJson(const QJsonValue& value) {
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isString()) {
        return value.toString();
    }
    return value.toVariant().toString();
}

} // namespace

ToolResultText flattenToolResult(const QJsonValue& result) {
    ToolResultText out;
    out.raw = result;

    if (!result.isObject()) {
        out.text = compactJson(result);
        return out;
    }

    const QJsonObject obj = result.toObject();
    out.isError = obj.value("isError").toBool(false);

    QStringList parts;
    for (const auto& item : obj.value("content").toArray()) {
        const QJsonObject content = item.toObject();
        if (content.value("type").toString() == QLatin1String("text")) {
            parts.append(content.value("text").toString());
        }
    }

    if (!parts.isEmpty()) {
        out.text = parts.join('\n');
    } else if (obj.contains("structuredContent")) {
        out.text = compactJson(obj.value("structuredContent"));
    } else {
        out.text = compactJson(obj);
    }
    return out;
}

} // namespace mcphub
