#include "watchdog.h"
#include "log.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>

namespace shadelock {

/* ───────────────────────── SystemdNotifySink ───────────────────────── */

SystemdNotifySink::SystemdNotifySink(const QByteArray &socketPath)
    : m_socketPath(socketPath)
{
}

std::unique_ptr<SystemdNotifySink> SystemdNotifySink::fromEnvironment()
{
    QByteArray path = qgetenv("NOTIFY_SOCKET");
    if (path.isEmpty())
        return nullptr;
    return std::unique_ptr<SystemdNotifySink>(new SystemdNotifySink(path));
}

bool SystemdNotifySink::notify(const QByteArray &message)
{
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (m_socketPath.size() >= int(sizeof(addr.sun_path))) {
        qCWarning(lcWatchdog) << "notify socket path too long";
        return false;
    }
    memcpy(addr.sun_path, m_socketPath.constData(), size_t(m_socketPath.size()));
    if (addr.sun_path[0] == '@')
        addr.sun_path[0] = '\0';

    int fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        qCWarning(lcWatchdog) << "socket:" << strerror(errno);
        return false;
    }

    socklen_t len = socklen_t(offsetof(struct sockaddr_un, sun_path) + size_t(m_socketPath.size()));
    ssize_t sent = sendto(fd, message.constData(), size_t(message.size()), MSG_NOSIGNAL,
                          reinterpret_cast<struct sockaddr *>(&addr), len);
    int err = errno;
    close(fd);

    if (sent != ssize_t(message.size())) {
        qCWarning(lcWatchdog) << "sendto" << m_socketPath << ":" << strerror(err);
        return false;
    }
    return true;
}

/* ───────────────────────── Watchdog ───────────────────────── */

Watchdog::Watchdog(std::shared_ptr<NotifySink> sink, qint64 timeoutMsec, QObject *parent)
    : QObject(parent),
      m_sink(std::move(sink)),
      m_timeoutMsec(timeoutMsec)
{
    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setInterval(intervalFor(timeoutMsec));
    connect(&m_timer, &QTimer::timeout, this, &Watchdog::ping);
}

int Watchdog::intervalFor(qint64 timeoutMsec)
{
    if (timeoutMsec <= 0)
        return 0;
    qint64 interval = timeoutMsec / 3;
    return int(qMax<qint64>(1, interval));
}

void Watchdog::ping()
{
    ++m_pings;
    if (m_sink && !m_sink->notify("WATCHDOG=1"))
        qCWarning(lcWatchdog) << "heartbeat not delivered";
}

void Watchdog::onStateChanged(LockState state)
{
    switch (state) {
    case LockState::Capturing:
        break;

    case LockState::Rendering:
    case LockState::Authenticating:
        if (!m_ready) {
            m_ready = true;
            if (m_sink && !m_sink->notify("READY=1"))
                qCWarning(lcWatchdog) << "readiness not delivered";
        }
        if (m_timeoutMsec > 0 && !m_timer.isActive()) {
            qCDebug(lcWatchdog) << "heartbeat every" << m_timer.interval() << "ms";
            ping();
            m_timer.start();
        }
        break;

    case LockState::Unlocking:
        m_timer.stop();
        if (m_sink && !m_sink->notify("STOPPING=1"))
            qCWarning(lcWatchdog) << "stop notification not delivered";
        break;
    }
}

} // namespace shadelock
