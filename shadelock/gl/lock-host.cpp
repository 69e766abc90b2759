#include "lock-host.h"
#include "gl-output-window.h"
#include "../lock/log.h"

#include <QGuiApplication>
#include <QKeyEvent>
#include <QScreen>

namespace shadelock {

LockHost::LockHost(QObject *parent)
    : QObject(parent),
      m_outputs([this](OutputId id, const OutputGeometry &geometry, QString *errorString) {
          return createSurface(id, geometry, errorString);
      }),
      m_capturer([this](OutputId id) { return screenFor(id); })
{
}

LockHost::~LockHost()
{
    m_credential.clear();
}

OutputTransform LockHost::transformFor(const QScreen *screen)
{
    // Qt reports rotation only; reflected panels show up as Normal.
    switch (screen->angleBetween(screen->nativeOrientation(), screen->orientation())) {
    case 90:  return OutputTransform::Rotate90;
    case 180: return OutputTransform::Rotate180;
    case 270: return OutputTransform::Rotate270;
    default:  return OutputTransform::Normal;
    }
}

OutputGeometry LockHost::geometryFor(const QScreen *screen)
{
    OutputGeometry geometry;
    geometry.size = screen->geometry().size() * screen->devicePixelRatio();
    geometry.transform = transformFor(screen);
    geometry.yInvert = false;
    return geometry;
}

QScreen *LockHost::screenFor(OutputId id) const
{
    for (auto it = m_ids.constBegin(); it != m_ids.constEnd(); ++it) {
        if (it.value() == id)
            return it.key();
    }
    return nullptr;
}

std::unique_ptr<PresentationSurface> LockHost::createSurface(OutputId id, const OutputGeometry &geometry,
                                                             QString *errorString)
{
    QScreen *screen = screenFor(id);
    if (!screen || geometry.size.isEmpty()) {
        if (errorString)
            *errorString = QStringLiteral("screen is gone or has no area");
        return nullptr;
    }

    std::unique_ptr<GlOutputWindow> window(new GlOutputWindow(id, screen));
    window->setFrameCallback([this](OutputId output) {
        return m_session ? m_session->renderOutput(output) : PresentResult::Skipped;
    });
    if (m_session)
        window->setFallbackColor(m_session->fallbackColor());
    window->setKeyCallback([this](QKeyEvent *e) { handleKey(e); });
    return std::move(window);
}

void LockHost::attach(LockSession *session)
{
    m_session = session;

    connect(qGuiApp, &QGuiApplication::screenAdded, this, &LockHost::onScreenAdded);
    connect(qGuiApp, &QGuiApplication::screenRemoved, this, &LockHost::onScreenRemoved);
    connect(session, &LockSession::unlocked, this, [this]() { m_credential.clear(); });

    const QList<QScreen *> screens = QGuiApplication::screens();
    for (QScreen *screen : screens)
        onScreenAdded(screen);
}

void LockHost::onScreenAdded(QScreen *screen)
{
    if (!m_session || m_ids.contains(screen))
        return;

    const OutputId id = m_nextId++;
    m_ids.insert(screen, id);

    screen->setOrientationUpdateMask(Qt::PortraitOrientation | Qt::LandscapeOrientation
                                     | Qt::InvertedPortraitOrientation
                                     | Qt::InvertedLandscapeOrientation);
    connect(screen, &QScreen::geometryChanged, this, [this, screen]() { screenChanged(screen); });
    connect(screen, &QScreen::orientationChanged, this, [this, screen]() { screenChanged(screen); });

    qCInfo(lcOutputs) << "screen" << screen->name() << "is output" << id << screen->geometry();
    m_session->outputAttached(id, screen->name(), geometryFor(screen));
}

void LockHost::onScreenRemoved(QScreen *screen)
{
    auto it = m_ids.find(screen);
    if (it == m_ids.end())
        return;

    const OutputId id = it.value();
    m_ids.erase(it);
    disconnect(screen, nullptr, this, nullptr);

    qCInfo(lcOutputs) << "screen" << screen->name() << "(output" << id << ") removed";
    if (m_session)
        m_session->outputDetached(id);
}

void LockHost::screenChanged(QScreen *screen)
{
    auto it = m_ids.constFind(screen);
    if (it == m_ids.constEnd() || !m_session)
        return;

    if (Output *output = m_outputs.find(it.value())) {
        if (auto *window = dynamic_cast<GlOutputWindow *>(output->surface()))
            window->setGeometry(screen->geometry());
    }
    m_session->outputGeometryChanged(it.value(), geometryFor(screen));
}

void LockHost::handleKey(QKeyEvent *e)
{
    if (!m_session)
        return;
    m_session->wake();

    switch (e->key()) {
    case Qt::Key_Backspace:
        m_credential.pop();
        return;
    case Qt::Key_Escape:
        m_credential.clear();
        return;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        m_session->submitCredential(m_credential.take());
        return;
    default:
        if (!e->text().isEmpty())
            m_credential.push(e->text());
        return;
    }
}

} // namespace shadelock
