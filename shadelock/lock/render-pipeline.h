#ifndef SHADELOCK_RENDER_PIPELINE_H
#define SHADELOCK_RENDER_PIPELINE_H

#include "effect-catalog.h"
#include "output-registry.h"
#include "surface.h"

#include <QColor>
#include <QImage>
#include <QRect>

namespace shadelock {

// Immutable per-frame snapshot taken from the session at call time.
struct FrameParameters {
    double elapsedSeconds = 0.0;
    float fadeAmount = 0.0f;
    bool pastFadeCeiling = false;
    float iconOpacity = 1.0f;
};

// Fade starts at 0 with the undistorted screenshot and reaches 1 at the
// effect's fade ceiling; from then on only the opaque colour is shown.
FrameParameters frameParameters(const EffectParameters &parameters, double elapsedSeconds);

enum class PresentResult {
    Presented,
    Recovered,   // surface was lost, recreated, and the retry went through
    Degraded,    // retry failed too; the output sits out until its geometry changes
    Skipped
};

// Centres the icon at its own pixel size, shrunk to fit outputs smaller
// than the icon.
QRect iconPlacement(const QSize &outputSize, const QSize &iconSize);

class RenderPipeline {
public:
    explicit RenderPipeline(const QColor &fallbackColor = QColor(0, 0, 0),
                            const QImage &icon = QImage());

    const QColor &fallbackColor() const { return m_fallbackColor; }
    const QImage &icon() const { return m_icon; }

    // Binds exactly the inputs the effect's contract declares.
    DrawCommand buildCommand(const Output &output, const EffectProgram &effect,
                             const FrameParameters &frame) const;
    DrawCommand fallbackCommand() const;

    // Draws one frame on output. A null effect means the session has lost
    // every output and only the fallback colour is presented. After a solid
    // colour frame the output goes idle instead of asking for another one.
    PresentResult draw(Output &output, const EffectProgram *effect, const FrameParameters &frame);

private:
    bool prepareTexture(Output &output);
    void addIcon(Output &output, DrawCommand *cmd, const FrameParameters &frame);
    PresentResult presented(Output &output, const DrawCommand &cmd, PresentResult result);

    QColor m_fallbackColor;
    QImage m_icon;
};

} // namespace shadelock

#endif // SHADELOCK_RENDER_PIPELINE_H
