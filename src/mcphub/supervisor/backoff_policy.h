#pragma once

#include <QJsonObject>
#include <QString>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 崩溃重启退避策略
 *
 * 第 n 次连续失败后等待 min(baseMs * 2^(n-1), capMs)，即第一次重试等待 baseMs。
 * maxRetries 为 -1 表示不限次数；0 表示从不重启。
 * 一次运行持续 stableResetMs 以上视为稳定，连续失败计数清零。
 */
struct MCPHUB_API BackoffPolicy {
    int baseMs = 1000;
    int capMs = 60000;
    int maxRetries = -1;
    int stableResetMs = 60000;

    int delayForFailure(int consecutiveFailures) const;
    bool allowsRetry(int consecutiveFailures) const;

    QJsonObject toJson() const;
};

} // namespace mcphub
