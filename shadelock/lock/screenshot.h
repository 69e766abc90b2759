#ifndef SHADELOCK_SCREENSHOT_H
#define SHADELOCK_SCREENSHOT_H

#include "output-registry.h"

#include <QColor>
#include <QImage>
#include <QSize>
#include <QString>

namespace shadelock {

// A frame handed over by whatever grabbed the screen.
struct CapturedBuffer {
    QImage image;
    bool yInvert = false;    // rows arrive bottom-up
};

struct CaptureResult {
    bool ok = false;
    CapturedBuffer buffer;
    QString errorString;
};

class ScreenCapturer {
public:
    virtual ~ScreenCapturer() = default;

    // Must return promptly; a capture that cannot complete reports failure.
    virtual CaptureResult capture(OutputId id) = 0;
};

// Converts a captured frame into the opaque RGBX8888 layout the surfaces upload.
// A size mismatch is resolved by clipping to the top-left corner and padding
// with opaque black, never by failing.
QImage normalizeScreenshot(const QImage &captured, const QSize &outputSize);

// Solid stand-in used when a capture fails.
QImage fallbackScreenshot(const QSize &size, const QColor &color);

// Reads the lock icon drawn over every output, as RGBA8888 with straight alpha.
bool loadIcon(const QString &path, QImage *icon, QString *errorString = nullptr);

} // namespace shadelock

#endif // SHADELOCK_SCREENSHOT_H
