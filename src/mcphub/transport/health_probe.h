#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <QUrl>

#include "mcphub/mcphub_export.h"

class QNetworkAccessManager;
class QNetworkReply;

namespace mcphub {

/**
 * GET http://host:port/health 探活
 */
class MCPHUB_API HealthProbe : public QObject {
    Q_OBJECT
public:
    explicit HealthProbe(const QUrl& baseUrl, QObject* parent = nullptr);

    /**
     * 单次探测，阻塞在局部事件循环中
     * @return 对端返回 2xx 时为 true
     */
    bool check(int timeoutMs, QString& error);

    /**
     * 异步轮询直到成功或总时长用尽，结果通过 healthy() / failed() 报告一次
     * @param totalTimeoutMs 总时长
     * @param intervalMs 两次探测之间的间隔
     */
    void startPolling(int totalTimeoutMs, int intervalMs);

    /// 停止轮询，之后不再发出任何结果信号
    void cancel();

    bool isPolling() const { return m_polling; }
    QUrl healthUrl() const;

    static constexpr int kAttemptTimeoutMs = 1000;

signals:
    void healthy();
    void failed(const QString& error);

private:
    void attempt();
    void onAttemptFinished();
    static bool evaluate(QNetworkReply* reply, QString& error);

    QUrl m_baseUrl;
    QNetworkAccessManager* m_manager;

    QNetworkReply* m_reply = nullptr;
    QTimer m_pollTimer;
    QElapsedTimer m_elapsed;
    int m_totalMs = 0;
    int m_intervalMs = 0;
    bool m_polling = false;
    QString m_lastError;
};

} // namespace mcphub
