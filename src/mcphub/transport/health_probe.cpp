#include "health_probe.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace mcphub {

HealthProbe::HealthProbe(const QUrl& baseUrl, QObject* parent)
    : QObject(parent)
    , m_baseUrl(baseUrl)
    , m_manager(new QNetworkAccessManager(this)) {
    m_pollTimer.setSingleShot(true);
    connect(&m_pollTimer, &QTimer::timeout, this, &HealthProbe::attempt);
}

QUrl HealthProbe::healthUrl() const {
    QUrl url = m_baseUrl;
    url.setPath("/health");
    return url;
}

bool HealthProbe::evaluate(QNetworkReply* reply, QString& error) {
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() == QNetworkReply::NoError && status >= 200 && status < 300) {
        error.clear();
        return true;
    }
    if (reply->error() == QNetworkReply::OperationCanceledError ||
        reply->error() == QNetworkReply::TimeoutError) {
        error = "health check timed out";
    } else if (reply->error() != QNetworkReply::NoError) {
        error = reply->errorString();
    } else {
        error = QString("health check returned HTTP %1").arg(status);
    }
    return false;
}

bool HealthProbe::check(int timeoutMs, QString& error) {
    QNetworkRequest request(healthUrl());
    request.setTransferTimeout(timeoutMs);
    QNetworkReply* reply = m_manager->get(request);

    QEventLoop loop;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const bool ok = evaluate(reply, error);
    reply->deleteLater();
    return ok;
}

void HealthProbe::startPolling(int totalTimeoutMs, int intervalMs) {
    cancel();
    m_totalMs = totalTimeoutMs;
    m_intervalMs = qMax(0, intervalMs);
    m_lastError.clear();
    m_polling = true;
    m_elapsed.start();
    // 首次探测也放到事件循环里，结果信号不会在调用返回前发出
    m_pollTimer.start(0);
}

void HealthProbe::cancel() {
    m_polling = false;
    m_pollTimer.stop();
    if (m_reply) {
        QNetworkReply* reply = m_reply;
        m_reply = nullptr;
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void HealthProbe::attempt() {
    if (!m_polling) {
        return;
    }
    const qint64 remaining = m_totalMs - m_elapsed.elapsed();
    if (remaining <= 0) {
        m_polling = false;
        emit failed(QString("service not healthy after %1 ms: %2").arg(m_totalMs).arg(m_lastError));
        return;
    }

    QNetworkRequest request(healthUrl());
    request.setTransferTimeout(static_cast<int>(qMin<qint64>(kAttemptTimeoutMs, remaining)));
    m_reply = m_manager->get(request);
    connect(m_reply, &QNetworkReply::finished, this, &HealthProbe::onAttemptFinished);
}

void HealthProbe::onAttemptFinished() {
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    if (!reply) {
        return;
    }
    reply->deleteLater();
    if (!m_polling) {
        return;
    }

    if (evaluate(reply, m_lastError)) {
        m_polling = false;
        emit healthy();
        return;
    }
    m_pollTimer.start(m_intervalMs);
}

} // namespace mcphub
