#include "credential-buffer.h"
#include "log.h"

#include <QStringView>

#include <cstring>

namespace shadelock {

CredentialBuffer::CredentialBuffer()
    : m_data(Capacity, QChar(0))
{
}

CredentialBuffer::~CredentialBuffer()
{
    clear();
}

bool CredentialBuffer::push(const QString &text)
{
    for (const QChar c : text) {
        if (!c.isPrint())
            continue;
        if (m_length >= Capacity) {
            qCWarning(lcAuth) << "credential buffer full, dropping input";
            return false;
        }
        m_data[m_length++] = c;
    }
    return true;
}

bool CredentialBuffer::pop()
{
    if (m_length == 0)
        return false;
    m_data[--m_length] = QChar(0);
    return true;
}

void CredentialBuffer::clear()
{
    m_data.fill(QChar(0));
    m_length = 0;
}

QByteArray CredentialBuffer::take()
{
    QByteArray out = QStringView(m_data.constData(), m_length).toUtf8();
    clear();
    return out;
}

void wipeCredential(QByteArray &bytes)
{
    if (!bytes.isEmpty())
        memset(bytes.data(), 0, size_t(bytes.size()));
    bytes.clear();
}

} // namespace shadelock
