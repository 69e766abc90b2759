#include "render-pipeline.h"
#include "log.h"

#include <QMatrix4x4>
#include <QVector2D>

#include <algorithm>
#include <cmath>

namespace shadelock {

FrameParameters frameParameters(const EffectParameters &parameters, double elapsedSeconds)
{
    FrameParameters f;
    f.elapsedSeconds = std::max(0.0, elapsedSeconds);

    const double ceiling = parameters.fadeCeilingSeconds;
    if (ceiling <= 0.0 || f.elapsedSeconds >= ceiling) {
        f.fadeAmount = 1.0f;
        f.pastFadeCeiling = true;
        return f;
    }

    const double progress = f.elapsedSeconds / ceiling;
    f.fadeAmount = float(std::pow(progress, parameters.fadeExponent));
    return f;
}

QRect iconPlacement(const QSize &outputSize, const QSize &iconSize)
{
    if (outputSize.isEmpty() || iconSize.isEmpty())
        return QRect();

    QSize size = iconSize;
    if (size.width() > outputSize.width() || size.height() > outputSize.height())
        size = size.scaled(outputSize, Qt::KeepAspectRatio);

    return QRect(QPoint((outputSize.width() - size.width()) / 2,
                        (outputSize.height() - size.height()) / 2),
                 size);
}

RenderPipeline::RenderPipeline(const QColor &fallbackColor, const QImage &icon)
    : m_fallbackColor(fallbackColor)
{
    m_fallbackColor.setAlpha(255);
    if (!icon.isNull())
        m_icon = icon.convertToFormat(QImage::Format_RGBA8888);
}

DrawCommand RenderPipeline::buildCommand(const Output &output, const EffectProgram &effect,
                                         const FrameParameters &frame) const
{
    const UniformContract &contract = effect.contract();

    DrawCommand cmd;
    cmd.mode = DrawCommand::Effect;
    cmd.effect = &effect;
    cmd.color = m_fallbackColor;
    cmd.sampler = contract.sampler;

    if (contract.time)
        cmd.uniforms.append({QStringLiteral("iTime"), QVariant(float(frame.elapsedSeconds))});
    if (contract.fadeAmount)
        cmd.uniforms.append({QStringLiteral("iFadeAmount"), QVariant(frame.fadeAmount)});

    switch (contract.geometry) {
    case GeometryInput::Transform:
        cmd.uniforms.append({QStringLiteral("iTransform"), QVariant::fromValue(output.transform())});
        break;
    case GeometryInput::Resolution:
        cmd.uniforms.append({QStringLiteral("iResolution"),
                             QVariant::fromValue(QVector2D(output.geometry().size.width(),
                                                           output.geometry().size.height()))});
        break;
    case GeometryInput::None:
        break;
    }
    return cmd;
}

DrawCommand RenderPipeline::fallbackCommand() const
{
    DrawCommand cmd;
    cmd.mode = DrawCommand::SolidColor;
    cmd.color = m_fallbackColor;
    return cmd;
}

bool RenderPipeline::prepareTexture(Output &output)
{
    if (output.textureUploaded())
        return true;
    if (!output.surface()->uploadTexture(output.screenshot())) {
        qCWarning(lcRender) << "texture upload failed on" << output.name();
        return false;
    }
    output.setTextureUploaded(true);
    return true;
}

void RenderPipeline::addIcon(Output &output, DrawCommand *cmd, const FrameParameters &frame)
{
    if (m_icon.isNull())
        return;

    if (!output.iconUploaded()) {
        if (!output.surface()->uploadIcon(m_icon)) {
            qCWarning(lcRender) << "icon upload failed on" << output.name() << ", drawing without it";
            return;
        }
        output.setIconUploaded(true);
    }

    cmd->iconRect = iconPlacement(output.geometry().size, m_icon.size());
    cmd->icon = !cmd->iconRect.isEmpty();
    cmd->iconOpacity = frame.iconOpacity;
}

PresentResult RenderPipeline::presented(Output &output, const DrawCommand &cmd, PresentResult result)
{
    output.countFrame();
    if (cmd.mode == DrawCommand::SolidColor) {
        if (!output.isIdle())
            qCDebug(lcRender) << "output" << output.name() << "settled, frame loop parked";
        output.setIdle(true);
    } else {
        output.setIdle(false);
        output.surface()->requestFrame();
    }
    return result;
}

PresentResult RenderPipeline::draw(Output &output, const EffectProgram *effect,
                                   const FrameParameters &frame)
{
    PresentationSurface *surface = output.surface();
    if (!surface)
        return PresentResult::Skipped;

    const bool useEffect = effect && !frame.pastFadeCeiling && output.hasScreenshot();
    if (useEffect && output.isDegraded())
        return PresentResult::Skipped;

    DrawCommand cmd = useEffect ? buildCommand(output, *effect, frame) : fallbackCommand();
    addIcon(output, &cmd, frame);

    PresentStatus status = PresentStatus::SurfaceLost;
    if (!useEffect || prepareTexture(output))
        status = surface->present(cmd);

    if (status == PresentStatus::Presented)
        return presented(output, cmd, PresentResult::Presented);

    qCWarning(lcRender) << "surface lost on" << output.name() << ", recreating";
    output.setTextureUploaded(false);
    output.setIconUploaded(false);
    if (surface->recreate(output.geometry().size)) {
        cmd.icon = false;
        addIcon(output, &cmd, frame);
        if (!useEffect || prepareTexture(output))
            status = surface->present(cmd);
    }

    if (status == PresentStatus::Presented)
        return presented(output, cmd, PresentResult::Recovered);

    if (!output.isDegraded())
        qCWarning(lcRender) << "output" << output.name() << "degraded until its geometry changes";
    output.setDegraded(true);
    return PresentResult::Degraded;
}

} // namespace shadelock
