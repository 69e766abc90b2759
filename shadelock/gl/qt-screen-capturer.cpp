#include "qt-screen-capturer.h"
#include "../lock/log.h"

#include <QPixmap>
#include <QScreen>

namespace shadelock {

CaptureResult QtScreenCapturer::capture(OutputId id)
{
    CaptureResult result;

    QScreen *screen = m_lookup ? m_lookup(id) : nullptr;
    if (!screen) {
        result.errorString = QStringLiteral("output %1 has no screen").arg(id);
        return result;
    }

    // Window id 0 grabs the whole screen on platforms that allow it.
    QPixmap pixmap = screen->grabWindow(0);
    if (pixmap.isNull()) {
        result.errorString = QStringLiteral("the platform refused to capture %1").arg(screen->name());
        return result;
    }

    result.buffer.image = pixmap.toImage();
    result.buffer.yInvert = false;
    result.ok = !result.buffer.image.isNull();
    if (!result.ok)
        result.errorString = QStringLiteral("captured frame of %1 could not be read").arg(screen->name());
    else
        qCDebug(lcOutputs) << "captured" << screen->name() << result.buffer.image.size();
    return result;
}

} // namespace shadelock
