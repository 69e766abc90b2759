#include "auth-gateway.h"
#include "credential-buffer.h"
#include "log.h"

#include <QFutureWatcher>
#include <QTimer>
#include <QtConcurrent>

#include <utility>

namespace shadelock {

const char *authResultName(AuthResult result)
{
    switch (result) {
    case AuthResult::Success: return "success";
    case AuthResult::Failure: return "failure";
    case AuthResult::Error:   return "error";
    }
    return "unknown";
}

AuthGateway::AuthGateway(std::shared_ptr<CredentialVerifier> verifier,
                         const BackoffPolicy &policy, QObject *parent)
    : QObject(parent),
      m_verifier(std::move(verifier)),
      m_policy(policy)
{
    qRegisterMetaType<shadelock::AuthResult>("shadelock::AuthResult");

    m_delayTimer = new QTimer(this);
    m_delayTimer->setSingleShot(true);
    connect(m_delayTimer, &QTimer::timeout, this, [this]() {
        if (m_delayed)
            forward(m_delayed);
    });
}

AuthGateway::~AuthGateway()
{
    cancelAll();
}

quint64 AuthGateway::submit(QByteArray credential)
{
    if (m_cancelled) {
        qCWarning(lcAuth) << "submission after cancellation ignored";
        wipeCredential(credential);
        return 0;
    }

    const quint64 id = m_nextId++;
    m_latest = id;

    if (m_delayed) {
        qCDebug(lcAuth) << "attempt" << m_delayed << "superseded before dispatch";
        m_delayTimer->stop();
        wipeCredential(m_delayedCredential);
        m_delayed = 0;
    }
    if (m_waiting) {
        qCDebug(lcAuth) << "attempt" << m_waiting << "superseded while queued";
        wipeCredential(m_waitingCredential);
        m_waiting = 0;
    }

    const int delay = nextDelayMsec();
    if (delay > 0) {
        qCInfo(lcAuth) << "attempt" << id << "held back" << delay << "ms after"
                       << m_consecutiveFailures << "failures";
        m_delayed = id;
        m_delayedCredential = std::move(credential);
        m_delayTimer->start(delay);
        emit attemptDelayed(id, delay);
        return id;
    }

    m_delayed = id;
    m_delayedCredential = std::move(credential);
    forward(id);
    return id;
}

void AuthGateway::forward(quint64 id)
{
    QByteArray credential(std::move(m_delayedCredential));
    m_delayed = 0;

    if (m_inFlight) {
        m_waiting = id;
        m_waitingCredential = std::move(credential);
        return;
    }
    dispatch(id, std::move(credential));
}

void AuthGateway::dispatch(quint64 id, QByteArray credential)
{
    m_inFlight = id;
    emit attemptDispatched(id);
    qCDebug(lcAuth) << "attempt" << id << "dispatched";

    std::shared_ptr<CredentialVerifier> verifier = m_verifier;
    auto *watcher = new QFutureWatcher<AuthResult>(this);
    connect(watcher, &QFutureWatcher<AuthResult>::finished, this, [this, watcher, id]() {
        AuthResult result = watcher->result();
        watcher->deleteLater();
        finished(id, result);
    });

    // The worker holds the only array and wipes it when the check returns.
    auto secret = std::make_shared<QByteArray>(std::move(credential));
    watcher->setFuture(QtConcurrent::run([verifier, secret]() {
        AuthResult result = verifier ? verifier->verify(*secret) : AuthResult::Error;
        wipeCredential(*secret);
        return result;
    }));
}

void AuthGateway::finished(quint64 id, AuthResult result)
{
    m_inFlight = 0;
    if (m_cancelled)
        return;

    if (result == AuthResult::Success) {
        if (id == m_latest)
            m_consecutiveFailures = 0;
    } else {
        ++m_consecutiveFailures;
    }

    qCInfo(lcAuth) << "attempt" << id << "resolved:" << authResultName(result);
    emit attemptResolved(id, result);

    if (m_waiting && !m_cancelled) {
        quint64 next = m_waiting;
        QByteArray credential(std::move(m_waitingCredential));
        m_waiting = 0;
        dispatch(next, std::move(credential));
    }
}

void AuthGateway::cancelAll()
{
    if (m_cancelled)
        return;
    m_cancelled = true;

    m_delayTimer->stop();
    wipeCredential(m_delayedCredential);
    wipeCredential(m_waitingCredential);
    m_delayed = 0;
    m_waiting = 0;
    qCDebug(lcAuth) << "pending attempts cancelled";
}

} // namespace shadelock
