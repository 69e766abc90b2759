#include "output-registry.h"
#include "log.h"

#include <utility>

namespace shadelock {

bool operator==(const OutputGeometry &a, const OutputGeometry &b)
{
    return a.size == b.size && a.transform == b.transform && a.yInvert == b.yInvert;
}

QMatrix4x4 transformMatrix(const OutputGeometry &geometry)
{
    float quarterTurns = 0.0f;
    bool flipped = false;

    switch (geometry.transform) {
    case OutputTransform::Normal:     quarterTurns = 0; break;
    case OutputTransform::Rotate90:   quarterTurns = 1; break;
    case OutputTransform::Rotate180:  quarterTurns = 2; break;
    case OutputTransform::Rotate270:  quarterTurns = 3; break;
    case OutputTransform::Flipped:    quarterTurns = 0; flipped = true; break;
    case OutputTransform::Flipped90:  quarterTurns = 1; flipped = true; break;
    case OutputTransform::Flipped180: quarterTurns = 2; flipped = true; break;
    case OutputTransform::Flipped270: quarterTurns = 3; flipped = true; break;
    }

    const bool mirror = flipped != geometry.yInvert;

    QMatrix4x4 m;
    m.translate(0.5f, 0.5f);
    m.rotate(90.0f * quarterTurns, 0.0f, 0.0f, 1.0f);
    m.scale(mirror ? -1.0f : 1.0f, 1.0f);
    m.translate(-0.5f, -0.5f);
    return m;
}

/* ───────────────────────── Output ───────────────────────── */

Output::Output(OutputId id, const QString &name, const OutputGeometry &geometry,
               std::unique_ptr<PresentationSurface> surface)
    : m_id(id),
      m_name(name),
      m_geometry(geometry),
      m_transform(transformMatrix(geometry)),
      m_surface(std::move(surface))
{
}

Output::~Output()
{
    if (m_surface)
        m_surface->release();
}

void Output::setGeometry(const OutputGeometry &geometry)
{
    m_geometry = geometry;
    m_transform = transformMatrix(geometry);
    if (m_degraded) {
        qCInfo(lcOutputs) << "output" << m_name << "geometry changed, leaving degraded mode";
        m_degraded = false;
    }
}

bool Output::setScreenshot(const QImage &image, bool fallback)
{
    if (hasScreenshot())
        return false;
    m_screenshot = image;
    m_fallback = fallback;
    m_textureUploaded = false;
    return true;
}

/* ───────────────────────── OutputRegistry ───────────────────────── */

OutputRegistry::OutputRegistry(SurfaceFactory factory)
    : m_factory(std::move(factory))
{
}

OutputRegistry::~OutputRegistry()
{
    clear();
}

Output *OutputRegistry::add(OutputId id, const QString &name, const OutputGeometry &geometry,
                            QString *errorString)
{
    if (m_outputs.count(id)) {
        if (errorString)
            *errorString = QString("output %1 already registered").arg(id);
        return nullptr;
    }

    QString error;
    std::unique_ptr<PresentationSurface> surface = m_factory ? m_factory(id, geometry, &error) : nullptr;
    if (!surface) {
        if (errorString)
            *errorString = error.isEmpty() ? QString("no presentation surface for %1").arg(name) : error;
        qCWarning(lcOutputs) << "cannot add output" << name << ":" << (error.isEmpty() ? "no surface" : error);
        return nullptr;
    }

    std::unique_ptr<Output> output(new Output(id, name, geometry, std::move(surface)));
    Output *raw = output.get();
    m_outputs.emplace(id, std::move(output));

    qCInfo(lcOutputs) << "added output" << name << "id" << id << geometry.size;
    return raw;
}

bool OutputRegistry::remove(OutputId id)
{
    auto it = m_outputs.find(id);
    if (it == m_outputs.end())
        return false;

    // Unlink first so nothing can look the output up while its surface goes away.
    std::unique_ptr<Output> output = std::move(it->second);
    m_outputs.erase(it);

    qCInfo(lcOutputs) << "removed output" << output->name() << "id" << id;
    output.reset();
    return true;
}

bool OutputRegistry::updateGeometry(OutputId id, const OutputGeometry &geometry)
{
    Output *output = find(id);
    if (!output)
        return false;
    if (output->geometry() == geometry && !output->isDegraded())
        return true;

    qCDebug(lcOutputs) << "output" << output->name() << "geometry" << geometry.size
                       << "transform" << int(geometry.transform);
    output->setGeometry(geometry);
    return true;
}

void OutputRegistry::clear()
{
    while (!m_outputs.empty())
        remove(m_outputs.begin()->first);
}

Output *OutputRegistry::find(OutputId id) const
{
    auto it = m_outputs.find(id);
    return it == m_outputs.end() ? nullptr : it->second.get();
}

QVector<OutputId> OutputRegistry::ids() const
{
    QVector<OutputId> out;
    out.reserve(int(m_outputs.size()));
    for (const auto &entry : m_outputs)
        out.append(entry.first);
    return out;
}

int OutputRegistry::healthyCount() const
{
    int n = 0;
    for (const auto &entry : m_outputs)
        if (!entry.second->isDegraded())
            ++n;
    return n;
}

} // namespace shadelock
