#ifndef SHADELOCK_OUTPUT_REGISTRY_H
#define SHADELOCK_OUTPUT_REGISTRY_H

#include "surface.h"

#include <QImage>
#include <QMatrix4x4>
#include <QSize>
#include <QString>
#include <QVector>

#include <functional>
#include <map>
#include <memory>

namespace shadelock {

using OutputId = quint32;

enum class OutputTransform {
    Normal,
    Rotate90,
    Rotate180,
    Rotate270,
    Flipped,
    Flipped90,
    Flipped180,
    Flipped270
};

struct OutputGeometry {
    QSize size;
    OutputTransform transform = OutputTransform::Normal;
    bool yInvert = false;
};

bool operator==(const OutputGeometry &a, const OutputGeometry &b);
inline bool operator!=(const OutputGeometry &a, const OutputGeometry &b) { return !(a == b); }

// Maps [0,1]^2 texture space around its centre according to the display
// transform, so effects always see the screenshot upright.
QMatrix4x4 transformMatrix(const OutputGeometry &geometry);

class Output {
public:
    Output(OutputId id, const QString &name, const OutputGeometry &geometry,
           std::unique_ptr<PresentationSurface> surface);
    ~Output();

    Output(const Output &) = delete;
    Output &operator=(const Output &) = delete;

    OutputId id() const { return m_id; }
    const QString &name() const { return m_name; }
    const OutputGeometry &geometry() const { return m_geometry; }
    const QMatrix4x4 &transform() const { return m_transform; }
    PresentationSurface *surface() const { return m_surface.get(); }

    // Recomputes the transform for the next frame and gives a degraded output
    // another chance.
    void setGeometry(const OutputGeometry &geometry);

    // The screenshot is set once per session. Returns false if one is
    // already in place.
    bool setScreenshot(const QImage &image, bool fallback);
    const QImage &screenshot() const { return m_screenshot; }
    bool hasScreenshot() const { return !m_screenshot.isNull(); }
    bool screenshotIsFallback() const { return m_fallback; }

    bool textureUploaded() const { return m_textureUploaded; }
    void setTextureUploaded(bool uploaded) { m_textureUploaded = uploaded; }
    bool iconUploaded() const { return m_iconUploaded; }
    void setIconUploaded(bool uploaded) { m_iconUploaded = uploaded; }

    // Set once the output shows a frame that will not change; no further
    // frame is requested until something wakes it.
    bool isIdle() const { return m_idle; }
    void setIdle(bool idle) { m_idle = idle; }

    bool isDegraded() const { return m_degraded; }
    void setDegraded(bool degraded) { m_degraded = degraded; }

    quint64 framesPresented() const { return m_frames; }
    void countFrame() { ++m_frames; }

private:
    const OutputId m_id;
    const QString m_name;
    OutputGeometry m_geometry;
    QMatrix4x4 m_transform;
    std::unique_ptr<PresentationSurface> m_surface;

    QImage m_screenshot;
    bool m_fallback = false;
    bool m_textureUploaded = false;
    bool m_iconUploaded = false;
    bool m_idle = false;
    bool m_degraded = false;
    quint64 m_frames = 0;
};

// Arena of live outputs keyed by a stable id. Lookups always go through the
// id, so a render pass never holds on to an output across a removal.
// GUI-thread only.
class OutputRegistry {
public:
    using SurfaceFactory = std::function<std::unique_ptr<PresentationSurface>(
        OutputId, const OutputGeometry &, QString *errorString)>;

    explicit OutputRegistry(SurfaceFactory factory);
    ~OutputRegistry();

    // Fails when the id is taken or no surface could be allocated.
    Output *add(OutputId id, const QString &name, const OutputGeometry &geometry,
                QString *errorString = nullptr);
    bool remove(OutputId id);
    bool updateGeometry(OutputId id, const OutputGeometry &geometry);
    void clear();

    Output *find(OutputId id) const;
    QVector<OutputId> ids() const;
    int size() const { return int(m_outputs.size()); }
    bool isEmpty() const { return m_outputs.empty(); }
    int healthyCount() const;

private:
    SurfaceFactory m_factory;
    std::map<OutputId, std::unique_ptr<Output>> m_outputs;
};

} // namespace shadelock

#endif // SHADELOCK_OUTPUT_REGISTRY_H
