#ifndef SHADELOCK_AUTH_GATEWAY_H
#define SHADELOCK_AUTH_GATEWAY_H

#include "config.h"

#include <QByteArray>
#include <QMetaType>
#include <QObject>

#include <memory>

class QTimer;

namespace shadelock {

enum class AuthResult {
    Success,
    Failure,   // credential rejected
    Error      // the verification mechanism itself failed
};

const char *authResultName(AuthResult result);

// The external credential check. verify() blocks and is called from a worker
// thread, one call at a time.
class CredentialVerifier {
public:
    virtual ~CredentialVerifier() = default;
    virtual AuthResult verify(const QByteArray &credential) = 0;
};

// Runs credential checks off the GUI thread and reports each outcome as a
// signal. Only one check is with the verifier at any time; a submission made
// while another is waiting replaces the waiting one. Credentials are moved
// from slot to slot and never copied.
class AuthGateway : public QObject {
    Q_OBJECT

public:
    AuthGateway(std::shared_ptr<CredentialVerifier> verifier, const BackoffPolicy &policy,
                QObject *parent = nullptr);
    ~AuthGateway() override;

    // Takes over the credential and returns the attempt id, or 0 once the
    // gateway has been cancelled. The bytes are wiped once they are done with.
    quint64 submit(QByteArray credential);

    // Forgets every pending attempt. Outcomes still in flight are dropped.
    void cancelAll();

    int consecutiveFailures() const { return m_consecutiveFailures; }
    int nextDelayMsec() const { return m_policy.delayFor(m_consecutiveFailures); }
    quint64 latestAttempt() const { return m_latest; }
    bool isBusy() const { return m_inFlight != 0 || m_waiting != 0 || m_delayed != 0; }

signals:
    void attemptDelayed(quint64 id, int delayMsec);
    void attemptDispatched(quint64 id);
    void attemptResolved(quint64 id, shadelock::AuthResult result);

private:
    void forward(quint64 id);
    void dispatch(quint64 id, QByteArray credential);
    void finished(quint64 id, AuthResult result);

    std::shared_ptr<CredentialVerifier> m_verifier;
    BackoffPolicy m_policy;

    quint64 m_nextId = 1;
    quint64 m_latest = 0;
    quint64 m_inFlight = 0;

    quint64 m_delayed = 0;
    QByteArray m_delayedCredential;
    QTimer *m_delayTimer = nullptr;

    quint64 m_waiting = 0;
    QByteArray m_waitingCredential;

    int m_consecutiveFailures = 0;
    bool m_cancelled = false;
};

} // namespace shadelock

Q_DECLARE_METATYPE(shadelock::AuthResult)

#endif // SHADELOCK_AUTH_GATEWAY_H
