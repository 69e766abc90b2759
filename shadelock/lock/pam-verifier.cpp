#include "pam-verifier.h"
#include "log.h"

#include <security/pam_appl.h>

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>

namespace shadelock {

namespace {

struct ConversationData {
    const QByteArray *password;
};

int conversation(int numMsg, const struct pam_message **msg, struct pam_response **resp,
                 void *appdata)
{
    if (!msg || !resp || numMsg <= 0)
        return PAM_CONV_ERR;

    auto *responses = static_cast<struct pam_response *>(
        calloc(size_t(numMsg), sizeof(struct pam_response)));
    if (!responses)
        return PAM_BUF_ERR;

    const auto *data = static_cast<const ConversationData *>(appdata);
    for (int i = 0; i < numMsg; ++i) {
        switch (msg[i]->msg_style) {
        case PAM_PROMPT_ECHO_OFF:
        case PAM_PROMPT_ECHO_ON:
            responses[i].resp = strdup(data && data->password ? data->password->constData() : "");
            if (!responses[i].resp) {
                for (int j = 0; j < i; ++j)
                    free(responses[j].resp);
                free(responses);
                return PAM_BUF_ERR;
            }
            break;
        case PAM_ERROR_MSG:
        case PAM_TEXT_INFO:
            responses[i].resp = nullptr;
            break;
        default:
            for (int j = 0; j < i; ++j)
                free(responses[j].resp);
            free(responses);
            return PAM_CONV_ERR;
        }
        responses[i].resp_retcode = 0;
    }

    *resp = responses;
    return PAM_SUCCESS;
}

} // namespace

PamVerifier::PamVerifier(const QString &service, const QString &user)
    : m_service(service.toUtf8()),
      m_user(user.toUtf8())
{
}

QString PamVerifier::currentUser()
{
    struct passwd *pw = getpwuid(getuid());
    if (!pw || !pw->pw_name)
        return QString();
    return QString::fromUtf8(pw->pw_name);
}

AuthResult PamVerifier::classify(int pamStatus)
{
    switch (pamStatus) {
    case PAM_SUCCESS:
        return AuthResult::Success;
    case PAM_AUTH_ERR:
    case PAM_USER_UNKNOWN:
    case PAM_MAXTRIES:
    case PAM_PERM_DENIED:
    case PAM_ACCT_EXPIRED:
    case PAM_NEW_AUTHTOK_REQD:
        return AuthResult::Failure;
    default:
        return AuthResult::Error;
    }
}

AuthResult PamVerifier::verify(const QByteArray &credential)
{
    if (m_user.isEmpty()) {
        qCWarning(lcAuth) << "no user to authenticate";
        return AuthResult::Error;
    }

    ConversationData data{&credential};
    struct pam_conv conv = {conversation, &data};
    pam_handle_t *pamh = nullptr;

    int ret = pam_start(m_service.constData(), m_user.constData(), &conv, &pamh);
    if (ret != PAM_SUCCESS) {
        qCWarning(lcAuth) << "pam_start(" << m_service << ") failed:" << ret;
        return AuthResult::Error;
    }

    ret = pam_authenticate(pamh, 0);
    if (ret == PAM_SUCCESS)
        ret = pam_acct_mgmt(pamh, 0);
    if (ret != PAM_SUCCESS)
        qCDebug(lcAuth) << "pam:" << pam_strerror(pamh, ret);

    pam_end(pamh, ret);
    return classify(ret);
}

AuthResult NullVerifier::verify(const QByteArray &credential)
{
    Q_UNUSED(credential);
    qCWarning(lcAuth) << "null authentication backend: accepting credential";
    return AuthResult::Success;
}

} // namespace shadelock
