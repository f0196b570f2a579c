#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace mcphub_server {

/**
 * 服务端事件：session.started / session.stopped / session.failed / session.notification
 */
struct ServerEvent {
    QString type;
    QString projectId;  // 空表示全局事件
    QJsonObject data;
    QDateTime timestamp;

    QJsonObject toJson() const;
};

/**
 * 进程内事件总线
 * 发布方不关心订阅方；WebSocket 连接按 projectId 过滤后放入各自的发送队列
 */
class EventBus : public QObject {
    Q_OBJECT
public:
    explicit EventBus(QObject* parent = nullptr);

    void publish(const QString& type, const QString& projectId, const QJsonObject& data = {});

    qint64 publishedCount() const { return m_published; }

signals:
    void eventPublished(const mcphub_server::ServerEvent& event);

private:
    qint64 m_published = 0;
};

} // namespace mcphub_server

Q_DECLARE_METATYPE(mcphub_server::ServerEvent)
