#ifndef SHADELOCK_LOCK_SESSION_H
#define SHADELOCK_LOCK_SESSION_H

#include "auth-gateway.h"
#include "effect-catalog.h"
#include "output-registry.h"
#include "render-pipeline.h"
#include "screenshot.h"

#include <QElapsedTimer>
#include <QMetaType>
#include <QObject>

namespace shadelock {

enum class LockState {
    Capturing,
    Rendering,
    Authenticating,
    Unlocking
};

const char *lockStateName(LockState state);

// The one authority over the locked state. Created by main() before anything
// is shown and destroyed after unlock; every collaborator is handed in, none
// is reached through a global.
//
// All methods run on the GUI thread. Authentication outcomes arrive as queued
// signals, so a frame never waits on a credential check.
class LockSession : public QObject {
    Q_OBJECT

public:
    LockSession(const EffectCatalog &catalog,
                OutputRegistry &outputs,
                RenderPipeline &pipeline,
                AuthGateway &gateway,
                ScreenCapturer &capturer,
                QObject *parent = nullptr);
    ~LockSession() override;

    // Picks the effect, captures every registered output and starts the
    // frame loop. Returning false is a fatal startup error: nothing has been
    // shown and the process must exit.
    bool engage(const SelectionPolicy &policy, QString *errorString = nullptr);

    void outputAttached(OutputId id, const QString &name, const OutputGeometry &geometry);
    void outputDetached(OutputId id);
    void outputGeometryChanged(OutputId id, const OutputGeometry &geometry);

    // Frame callback of one output. Reads only the bound effect and the clock.
    PresentResult renderOutput(OutputId id);

    // User activity: outputs parked on a settled frame draw again.
    void wake();

    // Takes over the credential; it is handed on to the gateway, never copied.
    void submitCredential(QByteArray credential);

    LockState state() const { return m_state; }
    bool isDegraded() const { return m_degraded; }
    const QColor &fallbackColor() const { return m_pipeline.fallbackColor(); }
    EffectProgramPtr effect() const { return m_effect; }
    quint64 currentAttempt() const { return m_currentAttempt; }
    double elapsedSeconds() const;

signals:
    void stateChanged(shadelock::LockState state);
    void authenticationRejected();
    void unlocked();

private slots:
    void onAttemptResolved(quint64 id, shadelock::AuthResult result);

private:
    void setState(LockState state);
    void installScreenshot(Output &output, bool capture);
    void refreshDegraded();
    void requestFrames();
    void beginUnlock();

    const EffectCatalog &m_catalog;
    OutputRegistry &m_outputs;
    RenderPipeline &m_pipeline;
    AuthGateway &m_gateway;
    ScreenCapturer &m_capturer;

    LockState m_state = LockState::Capturing;
    EffectProgramPtr m_effect;
    QElapsedTimer m_clock;
    quint64 m_currentAttempt = 0;
    bool m_degraded = false;
};

} // namespace shadelock

Q_DECLARE_METATYPE(shadelock::LockState)

#endif // SHADELOCK_LOCK_SESSION_H
