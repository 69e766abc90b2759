#ifndef SHADELOCK_GL_OUTPUT_WINDOW_H
#define SHADELOCK_GL_OUTPUT_WINDOW_H

#include "../lock/output-registry.h"
#include "../lock/render-pipeline.h"
#include "../lock/surface.h"

#include <QColor>
#include <QOpenGLShaderProgram>
#include <QOpenGLTexture>
#include <QOpenGLVertexArrayObject>
#include <QOpenGLWindow>

#include <functional>
#include <memory>

class QKeyEvent;
class QScreen;

namespace shadelock {

// Fullscreen, undecorated window covering one screen. Frames are pulled by
// paintGL and paced by the swap interval; the session draws through the
// PresentationSurface half. A frame the session does not draw is cleared to
// the fallback colour, so an exposed window never shows stale contents.
class GlOutputWindow : public QOpenGLWindow, public PresentationSurface {
    Q_OBJECT

public:
    GlOutputWindow(OutputId id, QScreen *screen);
    ~GlOutputWindow() override;

    OutputId outputId() const { return m_id; }

    void setFrameCallback(const std::function<PresentResult(OutputId)> &cb) { m_frameCallback = cb; }
    void setKeyCallback(const std::function<void(QKeyEvent *)> &cb) { m_keyCallback = cb; }
    void setFallbackColor(const QColor &color) { m_fallbackColor = color; }

    bool uploadTexture(const QImage &image) override;
    bool uploadIcon(const QImage &icon) override;
    PresentStatus present(const DrawCommand &command) override;
    bool recreate(const QSize &size) override;
    void requestFrame() override;
    void release() override;

protected:
    void initializeGL() override;
    void paintGL() override;

    bool event(QEvent *e) override;
    void keyPressEvent(QKeyEvent *e) override;
    void keyReleaseEvent(QKeyEvent *e) override;

private:
    bool flushTexture();
    bool flushIcon();
    void drawIcon(const DrawCommand &command);
    void clearTo(const QColor &color);
    void destroyResources();
    PresentStatus checkError();

    const OutputId m_id;
    std::function<PresentResult(OutputId)> m_frameCallback;
    std::function<void(QKeyEvent *)> m_keyCallback;
    QColor m_fallbackColor = QColor(0, 0, 0);

    QImage m_pendingImage;
    std::unique_ptr<QOpenGLTexture> m_texture;
    QImage m_pendingIcon;
    std::unique_ptr<QOpenGLTexture> m_iconTexture;
    std::unique_ptr<QOpenGLShaderProgram> m_iconProgram;
    QOpenGLVertexArrayObject m_vao;
    bool m_released = false;
};

// Window-manager escape chords: Alt+F4, Ctrl/Meta+W/Q, Alt+Tab, Ctrl+Alt+Del.
// A bare Escape is not one; it clears the typed credential.
bool isEscapeChord(const QKeyEvent *e);

} // namespace shadelock

#endif // SHADELOCK_GL_OUTPUT_WINDOW_H
