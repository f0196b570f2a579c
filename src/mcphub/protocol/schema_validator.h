#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "mcphub/mcphub_export.h"
#include "tool_schema.h"

namespace mcphub {

/**
 * 校验结果
 */
struct ValidationResult {
    bool valid = true;
    QString errorPath;     // 出错位置，如 "items[2].name"
    QString errorMessage;

    static ValidationResult ok() { return {true, {}, {}}; }

    static ValidationResult fail(const QString& path, const QString& msg) {
        return {false, path, msg};
    }

    QString toString() const {
        if (valid)
            return "OK";
        if (errorPath.isEmpty())
            return errorMessage;
        return QString("%1: %2").arg(errorPath, errorMessage);
    }
};

/**
 * 工具参数结构校验器
 * 只检查类型、必填、枚举和范围，不做默认值填充
 */
class MCPHUB_API SchemaValidator {
public:
    /**
     * 校验 tools/call 的 arguments
     * 顶层 schema 未声明属性时接受任意对象
     */
    static ValidationResult validateArguments(const QJsonObject& arguments,
                                              const SchemaNode& schema);

    /**
     * 递归校验单个值
     */
    static ValidationResult validateValue(const QJsonValue& value, const SchemaNode& schema,
                                          const QString& path);

private:
    static ValidationResult checkType(const QJsonValue& value, const SchemaNode& schema);
    static ValidationResult checkConstraints(const QJsonValue& value, const SchemaNode& schema,
                                             const QString& path);
    static ValidationResult validateObject(const QJsonObject& obj, const SchemaNode& schema,
                                           const QString& path);
    static ValidationResult validateArray(const QJsonArray& arr, const SchemaNode& schema,
                                          const QString& path);
};

} // namespace mcphub
