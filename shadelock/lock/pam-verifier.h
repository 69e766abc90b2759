#ifndef SHADELOCK_PAM_VERIFIER_H
#define SHADELOCK_PAM_VERIFIER_H

#include "auth-gateway.h"

#include <QString>

namespace shadelock {

// Checks the password of the user running the locker through Linux-PAM.
class PamVerifier : public CredentialVerifier {
public:
    PamVerifier(const QString &service, const QString &user);

    // Login name of the real uid, empty if it has no passwd entry.
    static QString currentUser();

    AuthResult verify(const QByteArray &credential) override;

    // Rejections map to Failure, everything else that is not success to Error.
    static AuthResult classify(int pamStatus);

private:
    QByteArray m_service;
    QByteArray m_user;
};

// Development backend: every credential is accepted.
class NullVerifier : public CredentialVerifier {
public:
    AuthResult verify(const QByteArray &credential) override;
};

} // namespace shadelock

#endif // SHADELOCK_PAM_VERIFIER_H
