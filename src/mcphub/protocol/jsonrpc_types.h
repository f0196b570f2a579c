#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace mcphub {

/// 客户端声明的 MCP 协议版本
inline constexpr char kProtocolVersion[] = "2024-11-05";

/**
 * JSON-RPC 2.0 标准错误码
 */
namespace RpcErrorCode {
inline constexpr int ParseError = -32700;
inline constexpr int InvalidRequest = -32600;
inline constexpr int MethodNotFound = -32601;
inline constexpr int InvalidParams = -32602;
inline constexpr int InternalError = -32603;
} // namespace RpcErrorCode

/**
 * 消息分类
 */
enum class RpcMessageKind {
    Request,      // 含 id 与 method
    Notification, // 含 method，无 id
    Response,     // 含 id 与 result/error
    Invalid       // 不符合 JSON-RPC 2.0
};

/**
 * 远端错误对象 {code, message, data?}
 */
struct RpcError {
    int code = 0;
    QString message;
    QJsonValue data;

    QJsonObject toJson() const;
    static RpcError fromJson(const QJsonObject& obj);
};

/**
 * 解析后的 JSON-RPC 消息
 */
struct RpcMessage {
    RpcMessageKind kind = RpcMessageKind::Invalid;
    QJsonValue id;        // 请求/响应 id（Notification 为 Undefined）
    QString method;       // Request / Notification
    QJsonValue params;    // Request / Notification
    QJsonValue result;    // 成功响应
    bool isError = false; // 响应是否携带 error
    RpcError error;       // 错误响应

    /// 数值 id；非数值或缺失时返回 -1
    qint64 numericId() const;
};

} // namespace mcphub
