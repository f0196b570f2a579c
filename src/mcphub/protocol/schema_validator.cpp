#include "schema_validator.h"

#include <QSet>
#include <cmath>

namespace mcphub {

namespace {

QString joinPath(const QString& parent, const QString& key) {
    return parent.isEmpty() ? key : parent + "." + key;
}

} // namespace

ValidationResult SchemaValidator::checkType(const QJsonValue& value, const SchemaNode& schema) {
    if (value.isNull() && (schema.nullable || schema.type == SchemaType::Null)) {
        return ValidationResult::ok();
    }

    switch (schema.type) {
    case SchemaType::String:
        if (!value.isString())
            return ValidationResult::fail("", "expected string");
        break;
    case SchemaType::Number:
        if (!value.isDouble())
            return ValidationResult::fail("", "expected number");
        break;
    case SchemaType::Integer:
        if (!value.isDouble())
            return ValidationResult::fail("", "expected integer");
        {
            const double d = value.toDouble();
            if (std::floor(d) != d)
                return ValidationResult::fail("", "expected integer, got decimal");
        }
        break;
    case SchemaType::Boolean:
        if (!value.isBool())
            return ValidationResult::fail("", "expected boolean");
        break;
    case SchemaType::Array:
        if (!value.isArray())
            return ValidationResult::fail("", "expected array");
        break;
    case SchemaType::Object:
        if (!value.isObject())
            return ValidationResult::fail("", "expected object");
        break;
    case SchemaType::Null:
        if (!value.isNull())
            return ValidationResult::fail("", "expected null");
        break;
    case SchemaType::Any:
        break;
    }
    return ValidationResult::ok();
}

ValidationResult SchemaValidator::checkConstraints(const QJsonValue& value,
                                                   const SchemaNode& schema,
                                                   const QString& path) {
    // 枚举
    if (!schema.enumValues.isEmpty() && !schema.enumValues.contains(value)) {
        return ValidationResult::fail(path, "value is not one of the allowed enum values");
    }

    // 数值范围
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (schema.minimum && d < *schema.minimum)
            return ValidationResult::fail(path, QString("value %1 < minimum %2").arg(d).arg(*schema.minimum));
        if (schema.maximum && d > *schema.maximum)
            return ValidationResult::fail(path, QString("value %1 > maximum %2").arg(d).arg(*schema.maximum));
    }

    // 字符串长度
    if (value.isString()) {
        const int len = static_cast<int>(value.toString().length());
        if (schema.minLength && len < *schema.minLength)
            return ValidationResult::fail(path, "string too short");
        if (schema.maxLength && len > *schema.maxLength)
            return ValidationResult::fail(path, "string too long");
    }

    // 数组长度
    if (value.isArray()) {
        const int size = static_cast<int>(value.toArray().size());
        if (schema.minItems && size < *schema.minItems)
            return ValidationResult::fail(path, "array too short");
        if (schema.maxItems && size > *schema.maxItems)
            return ValidationResult::fail(path, "array too long");
    }

    return ValidationResult::ok();
}

ValidationResult SchemaValidator::validateValue(const QJsonValue& value, const SchemaNode& schema,
                                                const QString& path) {
    auto typeResult = checkType(value, schema);
    if (!typeResult.valid) {
        typeResult.errorPath = path;
        return typeResult;
    }
    if (value.isNull()) {
        return ValidationResult::ok();
    }

    auto constraintResult = checkConstraints(value, schema, path);
    if (!constraintResult.valid) {
        return constraintResult;
    }

    if (schema.type == SchemaType::Object) {
        return validateObject(value.toObject(), schema, path);
    }
    if (schema.type == SchemaType::Array && schema.items) {
        return validateArray(value.toArray(), schema, path);
    }
    return ValidationResult::ok();
}

ValidationResult SchemaValidator::validateObject(const QJsonObject& obj, const SchemaNode& schema,
                                                 const QString& path) {
    // 必填
    for (const auto& key : schema.required) {
        if (!obj.contains(key)) {
            return ValidationResult::fail(joinPath(path, key), "required field missing");
        }
    }

    // 已声明的属性
    for (const auto& prop : schema.properties) {
        if (!prop.schema || !obj.contains(prop.name)) {
            continue;
        }
        auto result = validateValue(obj.value(prop.name), *prop.schema, joinPath(path, prop.name));
        if (!result.valid) {
            return result;
        }
    }

    // 未声明的属性
    if (!schema.additionalProperties) {
        QSet<QString> known;
        for (const auto& prop : schema.properties) {
            known.insert(prop.name);
        }
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (!known.contains(it.key())) {
                return ValidationResult::fail(joinPath(path, it.key()), "unknown field");
            }
        }
    }

    return ValidationResult::ok();
}

ValidationResult SchemaValidator::validateArray(const QJsonArray& arr, const SchemaNode& schema,
                                                const QString& path) {
    for (int i = 0; i < arr.size(); ++i) {
        auto result = validateValue(arr[i], *schema.items, QString("%1[%2]").arg(path).arg(i));
        if (!result.valid) {
            return result;
        }
    }
    return ValidationResult::ok();
}

ValidationResult SchemaValidator::validateArguments(const QJsonObject& arguments,
                                                    const SchemaNode& schema) {
    if (schema.type != SchemaType::Object && schema.type != SchemaType::Any) {
        return ValidationResult::fail("", "tool inputSchema is not an object schema");
    }
    if (schema.type == SchemaType::Any) {
        return ValidationResult::ok();
    }
    return validateObject(arguments, schema, QString());
}

} // namespace mcphub
