#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include <optional>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 参数 schema 节点类型
 */
enum class SchemaType {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
    Null,
    Any // 未声明 type、组合 schema（anyOf/oneOf/allOf）或无法识别
};

MCPHUB_API QString schemaTypeToString(SchemaType type);
MCPHUB_API SchemaType schemaTypeFromString(const QString& str);

struct SchemaNode;

/**
 * Object 节点的具名属性
 */
struct SchemaProperty {
    QString name;
    std::shared_ptr<SchemaNode> schema;
};

/**
 * 工具 inputSchema 的递归表示（JSON Schema 子集）
 */
struct MCPHUB_API SchemaNode {
    SchemaType type = SchemaType::Any;
    bool nullable = false;                 // "type": ["x", "null"]
    QString description;
    QJsonArray enumValues;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<int> minLength;
    std::optional<int> maxLength;
    std::optional<int> minItems;
    std::optional<int> maxItems;
    QVector<SchemaProperty> properties;    // Object
    QStringList required;                  // Object
    bool additionalProperties = true;      // Object
    std::shared_ptr<SchemaNode> items;     // Array

    const SchemaNode* property(const QString& name) const;

    QJsonObject toJson() const;
    static SchemaNode fromJson(const QJsonObject& obj);
};

/**
 * tools/list 返回的工具描述
 */
struct MCPHUB_API ToolDescriptor {
    QString name;
    QString description;
    SchemaNode inputSchema;
    QJsonObject rawInputSchema; // 子进程原样返回的 schema，转发给调用方

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& obj, ToolDescriptor& out, QString& error);
};

/**
 * 解析 tools/list 的 result：{"tools":[...]}
 * 工具名重复视为错误
 */
MCPHUB_API bool parseToolList(const QJsonValue& result, QVector<ToolDescriptor>& out,
                              QString& error);

MCPHUB_API QJsonArray toolListToJson(const QVector<ToolDescriptor>& tools);

} // namespace mcphub
