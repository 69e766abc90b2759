#ifndef SHADELOCK_LOCK_HOST_H
#define SHADELOCK_LOCK_HOST_H

#include "qt-screen-capturer.h"
#include "../lock/credential-buffer.h"
#include "../lock/lock-session.h"
#include "../lock/output-registry.h"

#include <QHash>
#include <QObject>

#include <memory>

class QKeyEvent;
class QScreen;

namespace shadelock {

// Binds the session to the desktop: one GlOutputWindow per QScreen, screen
// hot-plug forwarded as output events, key input collected into the
// credential buffer.
class LockHost : public QObject {
    Q_OBJECT

public:
    explicit LockHost(QObject *parent = nullptr);
    ~LockHost() override;

    OutputRegistry &outputs() { return m_outputs; }
    ScreenCapturer &capturer() { return m_capturer; }

    // Registers every screen present now and follows hot-plug from here on.
    // Call before LockSession::engage().
    void attach(LockSession *session);

    static OutputTransform transformFor(const QScreen *screen);
    static OutputGeometry geometryFor(const QScreen *screen);

private slots:
    void onScreenAdded(QScreen *screen);
    void onScreenRemoved(QScreen *screen);

private:
    std::unique_ptr<PresentationSurface> createSurface(OutputId id, const OutputGeometry &geometry,
                                                       QString *errorString);
    void handleKey(QKeyEvent *e);
    void screenChanged(QScreen *screen);
    QScreen *screenFor(OutputId id) const;

    QHash<QScreen *, OutputId> m_ids;
    OutputId m_nextId = 1;

    OutputRegistry m_outputs;
    QtScreenCapturer m_capturer;
    CredentialBuffer m_credential;
    LockSession *m_session = nullptr;
};

} // namespace shadelock

#endif // SHADELOCK_LOCK_HOST_H
