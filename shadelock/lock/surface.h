#ifndef SHADELOCK_SURFACE_H
#define SHADELOCK_SURFACE_H

#include <QColor>
#include <QImage>
#include <QRect>
#include <QSize>
#include <QString>
#include <QVariant>
#include <QVector>

namespace shadelock {

class EffectProgram;

enum class PresentStatus {
    Presented,
    SurfaceLost
};

struct UniformValue {
    QString name;
    QVariant value;    // float, QVector2D or QMatrix4x4
};

// Everything a surface needs to produce one frame. SolidColor frames never
// touch the effect program or the screenshot.
struct DrawCommand {
    enum Mode { Effect, SolidColor };

    Mode mode = SolidColor;
    const EffectProgram *effect = nullptr;
    QVector<UniformValue> uniforms;
    QString sampler;
    QColor color = QColor(0, 0, 0);

    // Lock icon blended over either mode. iconRect is in device pixels with
    // the origin at the top-left of the output.
    bool icon = false;
    QRect iconRect;
    float iconOpacity = 1.0f;
};

// One presentable target per physical display. Implementations are owned by
// their Output and only ever driven from that output's render path.
class PresentationSurface {
public:
    virtual ~PresentationSurface() = default;

    // Hands over the session screenshot. Implementations may defer the GPU
    // upload until the next present().
    virtual bool uploadTexture(const QImage &image) = 0;

    // Hands over the lock icon, same rules as uploadTexture().
    virtual bool uploadIcon(const QImage &icon) = 0;

    virtual PresentStatus present(const DrawCommand &command) = 0;

    // Throws away and reallocates the presentable resources. The screenshot
    // and the icon must be uploaded again afterwards.
    virtual bool recreate(const QSize &size) = 0;

    // Asks for the next vsync-paced frame.
    virtual void requestFrame() = 0;

    // Stops presenting and frees GPU resources right away.
    virtual void release() = 0;
};

} // namespace shadelock

#endif // SHADELOCK_SURFACE_H
