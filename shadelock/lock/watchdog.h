#ifndef SHADELOCK_WATCHDOG_H
#define SHADELOCK_WATCHDOG_H

#include "lock-session.h"

#include <QByteArray>
#include <QObject>
#include <QTimer>

#include <memory>

namespace shadelock {

// Where service-manager notifications go.
class NotifySink {
public:
    virtual ~NotifySink() = default;
    virtual bool notify(const QByteArray &message) = 0;
};

// Datagrams to $NOTIFY_SOCKET, the protocol systemd's Type=notify services use.
class SystemdNotifySink : public NotifySink {
public:
    explicit SystemdNotifySink(const QByteArray &socketPath);

    // nullptr when the process was not started with a notify socket.
    static std::unique_ptr<SystemdNotifySink> fromEnvironment();

    bool notify(const QByteArray &message) override;

private:
    QByteArray m_socketPath;
};

// Heartbeat for the external watchdog. Runs on the GUI event loop, so a stuck
// frame loop stops the pings as well.
class Watchdog : public QObject {
    Q_OBJECT

public:
    Watchdog(std::shared_ptr<NotifySink> sink, qint64 timeoutMsec, QObject *parent = nullptr);

    // Always strictly below half the timeout.
    static int intervalFor(qint64 timeoutMsec);

    int intervalMsec() const { return m_timer.interval(); }
    bool isPinging() const { return m_timer.isActive(); }
    quint64 pings() const { return m_pings; }

public slots:
    void onStateChanged(shadelock::LockState state);

private:
    void ping();

    std::shared_ptr<NotifySink> m_sink;
    qint64 m_timeoutMsec;
    QTimer m_timer;
    bool m_ready = false;
    quint64 m_pings = 0;
};

} // namespace shadelock

#endif // SHADELOCK_WATCHDOG_H
