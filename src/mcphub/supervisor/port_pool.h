#pragma once

#include <QMutex>
#include <QSet>
#include <functional>

#include "mcphub/mcphub_export.h"

namespace mcphub {

/**
 * 部署端口池
 * claim 为原子的“检查并占用”，同一端口不会被两个调用方同时拿到
 */
class MCPHUB_API PortPool {
public:
    using AvailabilityProbe = std::function<bool(int port)>;

    PortPool(int firstPort = 3000, int lastPort = 3999);

    /**
     * 占用指定端口
     * @return 端口在范围内且未被占用时返回 true
     */
    bool claim(int port);

    /**
     * 占用范围内第一个空闲端口
     * @return 端口号；无可用端口返回 -1
     */
    int claimAny();

    /**
     * 释放端口；未占用时返回 false
     */
    bool release(int port);

    bool isClaimed(int port) const;
    int claimedCount() const;
    int firstPort() const { return m_first; }
    int lastPort() const { return m_last; }

    /**
     * 设置可用性探测（默认尝试在本机监听该端口）
     * 传入空函数则只按占用表判断
     */
    void setAvailabilityProbe(AvailabilityProbe probe);

    static bool isPortBindable(int port);

private:
    int m_first;
    int m_last;
    mutable QMutex m_mutex;
    QSet<int> m_claimed;
    AvailabilityProbe m_probe;
};

} // namespace mcphub
