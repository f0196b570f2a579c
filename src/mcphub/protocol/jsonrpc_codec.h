#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "jsonrpc_types.h"
#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 构造请求对象 {"jsonrpc":"2.0","id":id,"method":method,"params":params}
 * params 为空对象时仍然写出，MCP 服务端普遍要求该字段存在
 */
MCPHUB_API QJsonObject makeRequest(qint64 id, const QString& method,
                                   const QJsonObject& params = {});

/**
 * 构造通知对象（无 id）
 */
MCPHUB_API QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

/**
 * 构造成功响应
 */
MCPHUB_API QJsonObject makeResult(const QJsonValue& id, const QJsonValue& result);

/**
 * 构造错误响应
 */
MCPHUB_API QJsonObject makeError(const QJsonValue& id, const RpcError& error);

/**
 * 序列化为单行紧凑 JSON（以 \n 结尾）
 */
MCPHUB_API QByteArray serializeLine(const QJsonObject& message);

/**
 * 按 JSON-RPC 2.0 规则对对象分类
 * 无法识别时 kind 为 Invalid，reason 给出原因
 */
MCPHUB_API RpcMessage classifyMessage(const QJsonObject& obj, QString* reason = nullptr);

/**
 * 解析一行文本为 JSON 对象
 * @param line JSON 行（不含 \n）
 * @param out 输出对象
 * @param error 失败原因
 * @return 解析成功且为对象时返回 true
 */
MCPHUB_API bool parseObjectLine(const QByteArray& line, QJsonObject& out, QString& error);

} // namespace mcphub
