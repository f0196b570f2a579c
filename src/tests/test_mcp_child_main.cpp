// Scriptable MCP child used by supervisor, session and debug-surface tests.
// Tools: echo, add, sleep, notify, crash, garbage, fail.
// Switches: --hold=<n> --exit-code=<n> --exit-after-ms=<n> --ignore-term --no-init
//           --stderr=<text> --transport=<stdio|http|sse> --host=<addr> --port=<n>
#include <QCoreApplication>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMap>
#include <QPointer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <QVector>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

struct Options {
    int hold = 0;
    int exitCode = 0;
    bool hasExitCode = false;
    int exitAfterMs = -1;
    bool ignoreTerm = false;
    bool noInit = false;
    QString stderrText;
    QString transport = "stdio";
    QString host = "127.0.0.1";
    int port = 0;
};

// --key=value 与 --key value 两种写法都接受（默认启动命令使用后者）
Options parseOptions(const QStringList& args) {
    Options o;
    for (int i = 1; i < args.size(); ++i) {
        QString key = args[i];
        QString value;
        const int eq = key.indexOf('=');
        if (eq > 0) {
            value = key.mid(eq + 1);
            key = key.left(eq);
        } else if (key != "--ignore-term" && key != "--no-init" && i + 1 < args.size()) {
            value = args[++i];
        }

        if (key == "--hold") {
            o.hold = value.toInt();
        } else if (key == "--exit-code") {
            o.exitCode = value.toInt();
            o.hasExitCode = true;
        } else if (key == "--exit-after-ms") {
            o.exitAfterMs = value.toInt();
        } else if (key == "--ignore-term") {
            o.ignoreTerm = true;
        } else if (key == "--no-init") {
            o.noInit = true;
        } else if (key == "--stderr") {
            o.stderrText = value;
        } else if (key == "--transport") {
            o.transport = value;
        } else if (key == "--host") {
            o.host = value;
        } else if (key == "--port") {
            o.port = value.toInt();
        }
    }
    return o;
}

QJsonObject makeResult(const QJsonValue& id, const QJsonValue& result) {
    return QJsonObject{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

QJsonObject makeError(const QJsonValue& id, int code, const QString& message) {
    return QJsonObject{{"jsonrpc", "2.0"},
                       {"id", id},
                       {"error", QJsonObject{{"code", code}, {"message", message}}}};
}

QJsonObject textContent(const QString& text, bool isError = false) {
    return QJsonObject{
        {"content", QJsonArray{QJsonObject{{"type", "text"}, {"text", text}}}},
        {"isError", isError},
    };
}

QJsonObject objectSchema(const QJsonObject& properties, const QStringList& required = {}) {
    QJsonObject schema{{"type", "object"}, {"properties", properties}};
    if (!required.isEmpty()) {
        schema["required"] = QJsonArray::fromStringList(required);
    }
    return schema;
}

QJsonArray toolList() {
    auto tool = [](const QString& name, const QString& description, const QJsonObject& schema) {
        return QJsonObject{{"name", name}, {"description", description}, {"inputSchema", schema}};
    };
    return QJsonArray{
        tool("echo", "Echo the given text",
             objectSchema({{"text", QJsonObject{{"type", "string"}}}}, {"text"})),
        tool("add", "Add two numbers",
             objectSchema({{"a", QJsonObject{{"type", "number"}}},
                           {"b", QJsonObject{{"type", "number"}}}},
                          {"a", "b"})),
        tool("sleep", "Answer after ms milliseconds",
             objectSchema({{"ms", QJsonObject{{"type", "integer"}, {"minimum", 0}}}}, {"ms"})),
        tool("notify", "Send a notification before answering",
             objectSchema({{"message", QJsonObject{{"type", "string"}}}})),
        tool("crash", "Exit without answering",
             objectSchema({{"code", QJsonObject{{"type", "integer"}}}})),
        tool("garbage", "Write a non-JSON line before answering", objectSchema({})),
        tool("fail", "Return an isError result", objectSchema({})),
    };
}

/// msg 为待发消息；final 表示这是该请求的最终响应
using Emit = std::function<void(const QJsonObject& msg, bool final)>;

class McpChild {
public:
    explicit McpChild(const Options& options) : m_opt(options) {}

    std::function<void(const QByteArray&)> rawWriter;

    void handle(const QJsonObject& msg, const Emit& sink) {
        const QString method = msg.value("method").toString();
        const QJsonValue id = msg.value("id");
        const bool isRequest = msg.contains("id") && !id.isNull();
        if (method.isEmpty() || !isRequest) {
            // 宿主的响应或通知
            return;
        }

        if (method == "initialize") {
            if (m_opt.noInit) {
                return;
            }
            const QString version = msg.value("params").toObject().value("protocolVersion")
                                        .toString("2024-11-05");
            sink(makeResult(id, QJsonObject{
                                    {"protocolVersion", version},
                                    {"capabilities", QJsonObject{{"tools", QJsonObject{}}}},
                                    {"serverInfo", QJsonObject{{"name", "test-mcp-child"},
                                                               {"version", "0.1.0"}}},
                                }),
                 true);
        } else if (method == "tools/list") {
            sink(makeResult(id, QJsonObject{{"tools", toolList()}}), true);
        } else if (method == "tools/call") {
            handleCall(id, msg.value("params").toObject(), sink);
        } else if (method == "ping") {
            sink(makeResult(id, QJsonObject{}), true);
        } else {
            sink(makeError(id, -32601, "Method not found: " + method), true);
        }
    }

private:
    void handleCall(const QJsonValue& id, const QJsonObject& params, const Emit& sink) {
        const QString name = params.value("name").toString();
        const QJsonObject args = params.value("arguments").toObject();

        if (name == "echo") {
            reply(makeResult(id, textContent(args.value("text").toString())), sink);
        } else if (name == "add") {
            const double sum = args.value("a").toDouble() + args.value("b").toDouble();
            reply(makeResult(id, textContent(QString::number(sum))), sink);
        } else if (name == "sleep") {
            const int ms = args.value("ms").toInt();
            QTimer::singleShot(ms, qApp, [this, id, ms, sink]() {
                reply(makeResult(id, textContent(QString("slept %1").arg(ms))), sink);
            });
        } else if (name == "notify") {
            const QString message = args.value("message").toString("hello");
            sink(QJsonObject{{"jsonrpc", "2.0"},
                             {"method", "notifications/message"},
                             {"params", QJsonObject{{"level", "info"}, {"data", message}}}},
                 false);
            reply(makeResult(id, textContent("notified")), sink);
        } else if (name == "crash") {
            std::fflush(stdout);
            std::_Exit(args.value("code").toInt(3));
        } else if (name == "garbage") {
            if (rawWriter) {
                rawWriter("this is not json");
            }
            reply(makeResult(id, textContent("after garbage")), sink);
        } else if (name == "fail") {
            reply(makeResult(id, textContent("tool failed", true)), sink);
        } else {
            reply(makeError(id, -32602, "Unknown tool: " + name), sink);
        }
    }

    // --hold=n：攒满 n 个 tools/call 响应后倒序发出
    void reply(const QJsonObject& response, const Emit& sink) {
        if (m_opt.hold <= 0) {
            sink(response, true);
            return;
        }
        m_held.append({response, sink});
        if (m_held.size() < m_opt.hold) {
            return;
        }
        m_opt.hold = 0;
        const auto held = m_held;
        m_held.clear();
        for (int i = held.size() - 1; i >= 0; --i) {
            held[i].second(held[i].first, true);
        }
    }

    Options m_opt;
    QVector<QPair<QJsonObject, Emit>> m_held;
};

void writeStdoutLine(const QByteArray& line) {
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

QByteArray compact(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

// ── http / sse ─────────────────────────────────────────────────────

class NetworkFront {
public:
    NetworkFront(McpChild* child, bool sse) : m_child(child), m_sse(sse) {
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() {
            while (QTcpSocket* sock = m_server.nextPendingConnection()) {
                QObject::connect(sock, &QTcpSocket::readyRead, [this, sock]() { onData(sock); });
                QObject::connect(sock, &QTcpSocket::disconnected, sock, [this, sock]() {
                    m_buffers.remove(sock);
                    sock->deleteLater();
                });
            }
        });
    }

    bool listen(const QString& host, int port) {
        return m_server.listen(QHostAddress(host), static_cast<quint16>(port));
    }

private:
    void onData(QTcpSocket* sock) {
        QByteArray& buf = m_buffers[sock];
        buf.append(sock->readAll());
        const int headerEnd = buf.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        const QList<QByteArray> requestLine = buf.left(buf.indexOf("\r\n")).split(' ');
        if (requestLine.size() < 2) {
            respond(sock, 400, "text/plain", "bad request");
            return;
        }
        int contentLength = 0;
        for (const QByteArray& line : buf.left(headerEnd).split('\n')) {
            const QByteArray trimmed = line.trimmed();
            if (trimmed.toLower().startsWith("content-length:")) {
                contentLength = trimmed.mid(15).trimmed().toInt();
            }
        }
        if (buf.size() < headerEnd + 4 + contentLength) {
            return;
        }

        const QByteArray method = requestLine[0];
        const QByteArray path = requestLine[1];
        const QByteArray body = buf.mid(headerEnd + 4, contentLength);
        m_buffers.remove(sock);

        if (method == "GET" && path == "/health") {
            respond(sock, 200, "application/json", "{\"status\":\"ok\"}");
            return;
        }
        const QByteArray expected = m_sse ? "/sse" : "/mcp";
        if (method != "POST" || path != expected) {
            respond(sock, 404, "text/plain", "not found");
            return;
        }

        const QJsonDocument doc = QJsonDocument::fromJson(body);
        if (!doc.isObject()) {
            respond(sock, 400, "text/plain", "body must be a JSON object");
            return;
        }
        const QJsonObject msg = doc.object();
        if (!msg.contains("id")) {
            respond(sock, 202, "text/plain", QByteArray());
            return;
        }

        QPointer<QTcpSocket> guard(sock);
        if (m_sse) {
            sock->write("HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n"
                        "Cache-Control: no-cache\r\nConnection: close\r\n\r\n");
            sock->flush();
            m_child->handle(msg, [guard](const QJsonObject& out, bool final) {
                if (!guard) {
                    return;
                }
                guard->write("event: message\ndata: " + compact(out) + "\n\n");
                guard->flush();
                if (final) {
                    guard->disconnectFromHost();
                }
            });
        } else {
            m_child->handle(msg, [this, guard](const QJsonObject& out, bool final) {
                if (guard && final) {
                    respond(guard, 200, "application/json", compact(out));
                }
            });
        }
    }

    void respond(QTcpSocket* sock, int status, const QByteArray& contentType,
                 const QByteArray& body) {
        QByteArray out = "HTTP/1.1 " + QByteArray::number(status) + " OK\r\n";
        out += "Content-Type: " + contentType + "\r\n";
        out += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += body;
        sock->write(out);
        sock->flush();
        sock->disconnectFromHost();
    }

    McpChild* m_child;
    bool m_sse;
    QTcpServer m_server;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    const Options opt = parseOptions(app.arguments());

    if (opt.ignoreTerm) {
        std::signal(SIGTERM, SIG_IGN);
    }
    if (!opt.stderrText.isEmpty()) {
        std::fprintf(stderr, "%s\n", qUtf8Printable(opt.stderrText));
        std::fflush(stderr);
    }
    if (opt.hasExitCode && opt.exitAfterMs < 0) {
        return opt.exitCode;
    }
    if (opt.exitAfterMs >= 0) {
        const int code = opt.exitCode;
        QTimer::singleShot(opt.exitAfterMs, &app, [code]() { QCoreApplication::exit(code); });
    }

    McpChild child(opt);

    std::unique_ptr<NetworkFront> front;
    if (opt.transport == "http" || opt.transport == "sse") {
        front = std::make_unique<NetworkFront>(&child, opt.transport == "sse");
        if (!front->listen(opt.host, opt.port)) {
            std::fprintf(stderr, "cannot listen on %s:%d\n", qUtf8Printable(opt.host), opt.port);
            return 4;
        }
    } else {
        child.rawWriter = writeStdoutLine;
        const Emit toStdout = [](const QJsonObject& msg, bool) { writeStdoutLine(compact(msg)); };

        // 读线程只负责取行，处理全部回到主线程
        std::thread([&child, toStdout, ignoreTerm = opt.ignoreTerm, code = opt.exitCode]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                const QByteArray bytes = QByteArray::fromStdString(line).trimmed();
                if (bytes.isEmpty()) {
                    continue;
                }
                QMetaObject::invokeMethod(
                    qApp,
                    [&child, toStdout, bytes]() {
                        const QJsonDocument doc = QJsonDocument::fromJson(bytes);
                        if (doc.isObject()) {
                            child.handle(doc.object(), toStdout);
                        }
                    },
                    Qt::QueuedConnection);
            }
            if (!ignoreTerm) {
                QMetaObject::invokeMethod(
                    qApp, [code]() { QCoreApplication::exit(code); }, Qt::QueuedConnection);
            }
        }).detach();
    }

    const int rc = app.exec();
    // 读线程可能仍阻塞在 stdin 上，跳过静态析构直接退出
    std::fflush(stdout);
    std::fflush(stderr);
    std::_Exit(rc);
}
