#include "tool_schema.h"

#include <QSet>

namespace mcphub {

QString schemaTypeToString(SchemaType type) {
    switch (type) {
    case SchemaType::String:  return "string";
    case SchemaType::Number:  return "number";
    case SchemaType::Integer: return "integer";
    case SchemaType::Boolean: return "boolean";
    case SchemaType::Array:   return "array";
    case SchemaType::Object:  return "object";
    case SchemaType::Null:    return "null";
    case SchemaType::Any:     return "any";
    }
    return "any";
}

SchemaType schemaTypeFromString(const QString& str) {
    const QString s = str.toLower();
    if (s == "string")  return SchemaType::String;
    if (s == "number")  return SchemaType::Number;
    if (s == "integer") return SchemaType::Integer;
    if (s == "boolean") return SchemaType::Boolean;
    if (s == "array")   return SchemaType::Array;
    if (s == "object")  return SchemaType::Object;
    if (s == "null")    return SchemaType::Null;
    return SchemaType::Any;
}

namespace {

std::optional<double> optionalDouble(const QJsonObject& obj, const char* key) {
    if (obj.value(key).isDouble()) {
        return obj.value(key).toDouble();
    }
    return std::nullopt;
}

std::optional<int> optionalInt(const QJsonObject& obj, const char* key) {
    if (obj.value(key).isDouble()) {
        return obj.value(key).toInt();
    }
    return std::nullopt;
}

} // namespace

const SchemaNode* SchemaNode::property(const QString& name) const {
    for (const auto& p : properties) {
        if (p.name == name) {
            return p.schema.get();
        }
    }
    return nullptr;
}

SchemaNode SchemaNode::fromJson(const QJsonObject& obj) {
    SchemaNode node;
    node.description = obj.value("description").toString();

    // type 可以是字符串或字符串数组（["string", "null"]）
    const QJsonValue typeVal = obj.value("type");
    if (typeVal.isString()) {
        node.type = schemaTypeFromString(typeVal.toString());
    } else if (typeVal.isArray()) {
        QVector<SchemaType> types;
        for (const auto& t : typeVal.toArray()) {
            const SchemaType st = schemaTypeFromString(t.toString());
            if (st == SchemaType::Null) {
                node.nullable = true;
            } else {
                types.push_back(st);
            }
        }
        node.type = types.size() == 1 ? types.front() : SchemaType::Any;
    } else if (obj.contains("properties")) {
        node.type = SchemaType::Object;
    }

    node.enumValues = obj.value("enum").toArray();
    node.minimum = optionalDouble(obj, "minimum");
    node.maximum = optionalDouble(obj, "maximum");
    node.minLength = optionalInt(obj, "minLength");
    node.maxLength = optionalInt(obj, "maxLength");
    node.minItems = optionalInt(obj, "minItems");
    node.maxItems = optionalInt(obj, "maxItems");

    if (node.type == SchemaType::Object) {
        const QJsonObject props = obj.value("properties").toObject();
        for (auto it = props.begin(); it != props.end(); ++it) {
            SchemaProperty p;
            p.name = it.key();
            p.schema = std::make_shared<SchemaNode>(SchemaNode::fromJson(it.value().toObject()));
            node.properties.push_back(std::move(p));
        }
        for (const auto& r : obj.value("required").toArray()) {
            if (r.isString()) {
                node.required.append(r.toString());
            }
        }
        // 只有显式 false 才关闭，schema 对象形式视为允许
        if (obj.value("additionalProperties").isBool()) {
            node.additionalProperties = obj.value("additionalProperties").toBool();
        }
    }

    if (node.type == SchemaType::Array && obj.value("items").isObject()) {
        node.items = std::make_shared<SchemaNode>(SchemaNode::fromJson(obj.value("items").toObject()));
    }

    return node;
}

QJsonObject SchemaNode::toJson() const {
    QJsonObject obj;
    if (type != SchemaType::Any) {
        if (nullable) {
            obj["type"] = QJsonArray{schemaTypeToString(type), "null"};
        } else {
            obj["type"] = schemaTypeToString(type);
        }
    }
    if (!description.isEmpty()) obj["description"] = description;
    if (!enumValues.isEmpty()) obj["enum"] = enumValues;
    if (minimum) obj["minimum"] = *minimum;
    if (maximum) obj["maximum"] = *maximum;
    if (minLength) obj["minLength"] = *minLength;
    if (maxLength) obj["maxLength"] = *maxLength;
    if (minItems) obj["minItems"] = *minItems;
    if (maxItems) obj["maxItems"] = *maxItems;

    if (type == SchemaType::Object) {
        QJsonObject props;
        for (const auto& p : properties) {
            props[p.name] = p.schema ? p.schema->toJson() : QJsonObject();
        }
        obj["properties"] = props;
        if (!required.isEmpty()) {
            obj["required"] = QJsonArray::fromStringList(required);
        }
        if (!additionalProperties) {
            obj["additionalProperties"] = false;
        }
    }
    if (type == SchemaType::Array && items) {
        obj["items"] = items->toJson();
    }
    return obj;
}

QJsonObject ToolDescriptor::toJson() const {
    return QJsonObject{
        {"name", name},
        {"description", description},
        {"inputSchema", rawInputSchema.isEmpty() ? inputSchema.toJson() : rawInputSchema},
    };
}

bool ToolDescriptor::fromJson(const QJsonObject& obj, ToolDescriptor& out, QString& error) {
    if (!obj.value("name").isString() || obj.value("name").toString().isEmpty()) {
        error = "tool entry is missing a name";
        return false;
    }
    out.name = obj.value("name").toString();
    out.description = obj.value("description").toString();

    const QJsonValue schema = obj.value("inputSchema");
    if (!schema.isUndefined() && !schema.isNull() && !schema.isObject()) {
        error = QString("tool '%1': inputSchema must be an object").arg(out.name);
        return false;
    }
    out.rawInputSchema = schema.toObject();
    out.inputSchema = SchemaNode::fromJson(out.rawInputSchema);
    error.clear();
    return true;
}

bool parseToolList(const QJsonValue& result, QVector<ToolDescriptor>& out, QString& error) {
    out.clear();
    if (!result.isObject()) {
        error = "tools/list result must be an object";
        return false;
    }
    const QJsonValue tools = result.toObject().value("tools");
    if (!tools.isArray()) {
        error = "tools/list result has no tools array";
        return false;
    }

    QSet<QString> seen;
    for (const auto& v : tools.toArray()) {
        if (!v.isObject()) {
            error = "tools/list entry must be an object";
            return false;
        }
        ToolDescriptor desc;
        if (!ToolDescriptor::fromJson(v.toObject(), desc, error)) {
            return false;
        }
        if (seen.contains(desc.name)) {
            error = "duplicate tool name: " + desc.name;
            return false;
        }
        seen.insert(desc.name);
        out.push_back(std::move(desc));
    }
    error.clear();
    return true;
}

QJsonArray toolListToJson(const QVector<ToolDescriptor>& tools) {
    QJsonArray arr;
    for (const auto& t : tools) {
        arr.append(t.toJson());
    }
    return arr;
}

} // namespace mcphub
