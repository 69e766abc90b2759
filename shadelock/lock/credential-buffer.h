#ifndef SHADELOCK_CREDENTIAL_BUFFER_H
#define SHADELOCK_CREDENTIAL_BUFFER_H

#include <QByteArray>
#include <QString>

namespace shadelock {

// Holds what the user has typed so far. Contents are overwritten, not just
// dropped, whenever they are cleared.
class CredentialBuffer {
public:
    static constexpr int Capacity = 256;

    CredentialBuffer();
    ~CredentialBuffer();

    CredentialBuffer(const CredentialBuffer &) = delete;
    CredentialBuffer &operator=(const CredentialBuffer &) = delete;

    bool push(const QString &text);
    bool pop();
    void clear();

    // UTF-8 copy of the contents; the buffer is wiped afterwards. The result
    // shares its bytes with nothing, so the receiver can wipe it in place.
    QByteArray take();

    int size() const { return m_length; }
    bool isEmpty() const { return m_length == 0; }

private:
    QString m_data;
    int m_length = 0;
};

// Overwrites the bytes and empties the array. Only reaches the real buffer
// when bytes is its sole owner; credentials are moved, never copied, for that.
void wipeCredential(QByteArray &bytes);

} // namespace shadelock

#endif // SHADELOCK_CREDENTIAL_BUFFER_H
