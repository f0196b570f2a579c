#include "port_pool.h"

#include <QHostAddress>
#include <QMutexLocker>
#include <QTcpServer>

namespace mcphub {

PortPool::PortPool(int firstPort, int lastPort)
    : m_first(firstPort)
    , m_last(lastPort)
    , m_probe(&PortPool::isPortBindable) {
}

bool PortPool::claim(int port) {
    QMutexLocker lock(&m_mutex);
    if (port < m_first || port > m_last || m_claimed.contains(port)) {
        return false;
    }
    m_claimed.insert(port);
    return true;
}

int PortPool::claimAny() {
    QMutexLocker lock(&m_mutex);
    for (int port = m_first; port <= m_last; ++port) {
        if (m_claimed.contains(port)) {
            continue;
        }
        if (m_probe && !m_probe(port)) {
            continue;
        }
        m_claimed.insert(port);
        return port;
    }
    return -1;
}

bool PortPool::release(int port) {
    QMutexLocker lock(&m_mutex);
    return m_claimed.remove(port);
}

bool PortPool::isClaimed(int port) const {
    QMutexLocker lock(&m_mutex);
    return m_claimed.contains(port);
}

int PortPool::claimedCount() const {
    QMutexLocker lock(&m_mutex);
    return static_cast<int>(m_claimed.size());
}

void PortPool::setAvailabilityProbe(AvailabilityProbe probe) {
    QMutexLocker lock(&m_mutex);
    m_probe = std::move(probe);
}

bool PortPool::isPortBindable(int port) {
    QTcpServer server;
    const bool ok = server.listen(QHostAddress::LocalHost, static_cast<quint16>(port));
    server.close();
    return ok;
}

} // namespace mcphub
