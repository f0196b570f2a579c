#include "event_bus.h"

namespace mcphub_server {

QJsonObject ServerEvent::toJson() const {
    QJsonObject obj;
    obj["type"] = type;
    if (!projectId.isEmpty()) {
        obj["projectId"] = projectId;
    }
    obj["data"] = data;
    obj["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    return obj;
}

EventBus::EventBus(QObject* parent)
    : QObject(parent) {
    qRegisterMetaType<mcphub_server::ServerEvent>();
}

void EventBus::publish(const QString& type, const QString& projectId, const QJsonObject& data) {
    ServerEvent event;
    event.type = type;
    event.projectId = projectId;
    event.data = data;
    event.timestamp = QDateTime::currentDateTimeUtc();
    ++m_published;
    emit eventPublished(event);
}

} // namespace mcphub_server
