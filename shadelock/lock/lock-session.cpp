#include "lock-session.h"
#include "credential-buffer.h"
#include "log.h"

#include <utility>

namespace shadelock {

const char *lockStateName(LockState state)
{
    switch (state) {
    case LockState::Capturing:      return "capturing";
    case LockState::Rendering:      return "rendering";
    case LockState::Authenticating: return "authenticating";
    case LockState::Unlocking:      return "unlocking";
    }
    return "unknown";
}

LockSession::LockSession(const EffectCatalog &catalog,
                         OutputRegistry &outputs,
                         RenderPipeline &pipeline,
                         AuthGateway &gateway,
                         ScreenCapturer &capturer,
                         QObject *parent)
    : QObject(parent),
      m_catalog(catalog),
      m_outputs(outputs),
      m_pipeline(pipeline),
      m_gateway(gateway),
      m_capturer(capturer)
{
    qRegisterMetaType<shadelock::LockState>("shadelock::LockState");

    // Queued on purpose: outcomes are messages into this object's event
    // queue, never handled inside whatever emitted them.
    connect(&m_gateway, &AuthGateway::attemptResolved,
            this, &LockSession::onAttemptResolved, Qt::QueuedConnection);
}

LockSession::~LockSession()
{
    m_gateway.cancelAll();
}

double LockSession::elapsedSeconds() const
{
    if (!m_clock.isValid())
        return 0.0;
    return m_clock.nsecsElapsed() / 1e9;
}

void LockSession::setState(LockState state)
{
    if (m_state == state)
        return;
    qCInfo(lcSession) << "state" << lockStateName(m_state) << "->" << lockStateName(state);
    m_state = state;
    emit stateChanged(state);

    // The icon shows whether a check is running.
    if (m_state == LockState::Rendering || m_state == LockState::Authenticating)
        requestFrames();
}

bool LockSession::engage(const SelectionPolicy &policy, QString *errorString)
{
    if (m_state != LockState::Capturing || m_effect) {
        if (errorString)
            *errorString = "session already engaged";
        return false;
    }

    QString error;
    m_effect = m_catalog.select(policy, &error);
    if (!m_effect) {
        if (errorString)
            *errorString = error;
        qCCritical(lcSession) << "cannot select an effect:" << error;
        return false;
    }
    qCInfo(lcSession) << "effect" << m_effect->name() << "bound for this session, fade ceiling"
                      << m_effect->parameters().fadeCeilingSeconds << "s";

    if (m_outputs.isEmpty()) {
        if (errorString)
            *errorString = "no usable output";
        qCCritical(lcSession) << "no output could be set up";
        m_effect.reset();
        return false;
    }

    for (OutputId id : m_outputs.ids()) {
        if (Output *output = m_outputs.find(id))
            installScreenshot(*output, true);
    }

    m_clock.start();
    setState(LockState::Rendering);
    return true;
}

void LockSession::installScreenshot(Output &output, bool capture)
{
    const QSize size = output.geometry().size;

    if (capture) {
        CaptureResult result = m_capturer.capture(output.id());
        if (result.ok && !result.buffer.image.isNull()) {
            if (result.buffer.yInvert != output.geometry().yInvert) {
                OutputGeometry geometry = output.geometry();
                geometry.yInvert = result.buffer.yInvert;
                m_outputs.updateGeometry(output.id(), geometry);
            }
            output.setScreenshot(normalizeScreenshot(result.buffer.image, size), false);
            return;
        }
        qCWarning(lcSession) << "capture failed on" << output.name() << ":"
                             << (result.errorString.isEmpty() ? "empty frame" : result.errorString)
                             << ", using fallback";
    }

    output.setScreenshot(fallbackScreenshot(size, m_pipeline.fallbackColor()), true);
}

void LockSession::requestFrames()
{
    for (OutputId id : m_outputs.ids()) {
        Output *output = m_outputs.find(id);
        if (output && output->surface()) {
            output->setIdle(false);
            output->surface()->requestFrame();
        }
    }
}

void LockSession::wake()
{
    if (m_state != LockState::Rendering && m_state != LockState::Authenticating)
        return;
    requestFrames();
}

void LockSession::outputAttached(OutputId id, const QString &name, const OutputGeometry &geometry)
{
    if (m_state == LockState::Unlocking)
        return;

    QString error;
    Output *output = m_outputs.add(id, name, geometry, &error);
    if (!output) {
        qCWarning(lcSession) << "output" << name << "not covered:" << error;
        return;
    }

    // Before engage() the capture happens there. Afterwards the desktop
    // behind a new display is never grabbed; it starts from the fallback.
    if (m_state == LockState::Capturing)
        return;

    installScreenshot(*output, false);
    refreshDegraded();
    output->surface()->requestFrame();
}

void LockSession::outputDetached(OutputId id)
{
    if (!m_outputs.remove(id))
        return;
    if (m_state == LockState::Rendering || m_state == LockState::Authenticating)
        refreshDegraded();
}

void LockSession::outputGeometryChanged(OutputId id, const OutputGeometry &geometry)
{
    if (m_state == LockState::Unlocking)
        return;

    Output *output = m_outputs.find(id);
    if (!output)
        return;

    const bool wasDegraded = output->isDegraded();
    m_outputs.updateGeometry(id, geometry);
    if (wasDegraded)
        refreshDegraded();

    if (m_state != LockState::Capturing && output->surface()) {
        output->setIdle(false);
        output->surface()->requestFrame();
    }
}

PresentResult LockSession::renderOutput(OutputId id)
{
    if (m_state != LockState::Rendering && m_state != LockState::Authenticating)
        return PresentResult::Skipped;

    Output *output = m_outputs.find(id);
    if (!output || !m_effect)
        return PresentResult::Skipped;

    FrameParameters frame = frameParameters(m_effect->parameters(), elapsedSeconds());
    frame.iconOpacity = m_state == LockState::Authenticating ? 0.5f : 1.0f;
    const EffectProgram *effect = m_degraded ? nullptr : m_effect.get();

    const bool wasDegraded = output->isDegraded();
    PresentResult result = m_pipeline.draw(*output, effect, frame);
    if (output->isDegraded() != wasDegraded)
        refreshDegraded();
    return result;
}

void LockSession::refreshDegraded()
{
    const bool allLost = !m_outputs.isEmpty() && m_outputs.healthyCount() == 0;
    if (allLost == m_degraded)
        return;

    m_degraded = allLost;
    if (!m_degraded) {
        qCInfo(lcSession) << "an output recovered, effect rendering resumes";
        requestFrames();
        return;
    }

    qCCritical(lcSession) << "every output failed to render, presenting fallback colour only";
    if (m_state == LockState::Authenticating) {
        m_currentAttempt = 0;
        setState(LockState::Rendering);
    }
    requestFrames();
}

void LockSession::submitCredential(QByteArray credential)
{
    if (m_state != LockState::Rendering && m_state != LockState::Authenticating) {
        qCDebug(lcSession) << "credential ignored in state" << lockStateName(m_state);
        wipeCredential(credential);
        return;
    }
    if (credential.isEmpty())
        return;

    const quint64 id = m_gateway.submit(std::move(credential));
    if (id == 0)
        return;

    if (m_currentAttempt)
        qCDebug(lcSession) << "attempt" << m_currentAttempt << "superseded by" << id;
    m_currentAttempt = id;
    setState(LockState::Authenticating);
}

void LockSession::onAttemptResolved(quint64 id, AuthResult result)
{
    if (m_state != LockState::Authenticating || id != m_currentAttempt) {
        qCDebug(lcSession) << "discarding outcome of superseded attempt" << id;
        return;
    }
    m_currentAttempt = 0;

    if (result == AuthResult::Success) {
        beginUnlock();
        return;
    }

    setState(LockState::Rendering);
    emit authenticationRejected();
}

void LockSession::beginUnlock()
{
    // From here renderOutput() refuses to draw, so no frame can land
    // half-way through teardown.
    setState(LockState::Unlocking);
    m_gateway.cancelAll();

    const int count = m_outputs.size();
    m_outputs.clear();
    qCInfo(lcSession) << "unlocked after" << elapsedSeconds() << "s," << count << "outputs torn down";
    emit unlocked();
}

} // namespace shadelock
