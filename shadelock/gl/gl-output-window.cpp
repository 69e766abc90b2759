#include "gl-output-window.h"
#include "gl-shader-compiler.h"
#include "../lock/effect-catalog.h"
#include "../lock/log.h"

#include <QKeyEvent>
#include <QMatrix4x4>
#include <QOpenGLContext>
#include <QOpenGLFunctions>
#include <QScreen>
#include <QVector2D>

#ifndef GL_CONTEXT_LOST
#define GL_CONTEXT_LOST 0x0507
#endif

namespace shadelock {

// Textured quad spanning iRect (left, bottom, right, top in clip space).
static const char ICON_VERTEX[] =
    "#version 330 core\n"
    "uniform vec4 iRect;\n"
    "out vec2 vTexCoord;\n"
    "void main() {\n"
    "    vec2 corner = vec2(float(gl_VertexID & 1), float((gl_VertexID >> 1) & 1));\n"
    "    vTexCoord = vec2(corner.x, 1.0 - corner.y);\n"
    "    gl_Position = vec4(mix(iRect.xy, iRect.zw, corner), 0.0, 1.0);\n"
    "}\n";

static const char ICON_FRAGMENT[] =
    "#version 330 core\n"
    "uniform sampler2D iIcon;\n"
    "uniform float iOpacity;\n"
    "in vec2 vTexCoord;\n"
    "out vec4 fragColor;\n"
    "void main() {\n"
    "    vec4 c = texture(iIcon, vTexCoord);\n"
    "    fragColor = vec4(c.rgb, c.a * iOpacity);\n"
    "}\n";

bool isEscapeChord(const QKeyEvent *e)
{
    return (e->key() == Qt::Key_F4 && (e->modifiers() & Qt::AltModifier)) ||
           ((e->key() == Qt::Key_W || e->key() == Qt::Key_Q) &&
            (e->modifiers() & (Qt::MetaModifier | Qt::ControlModifier))) ||
           (e->key() == Qt::Key_Tab && (e->modifiers() & Qt::AltModifier)) ||
           ((e->key() == Qt::Key_Delete) &&
            (e->modifiers() & Qt::ControlModifier) && (e->modifiers() & Qt::AltModifier));
}

GlOutputWindow::GlOutputWindow(OutputId id, QScreen *screen)
    : QOpenGLWindow(QOpenGLWindow::NoPartialUpdate)
    , m_id(id)
{
    setFlags(Qt::FramelessWindowHint
             | Qt::WindowStaysOnTopHint
             | Qt::BypassWindowManagerHint);
    setScreen(screen);
    setGeometry(screen->geometry());
    setCursor(Qt::BlankCursor);
    setTitle(QStringLiteral("shadelock"));
}

GlOutputWindow::~GlOutputWindow()
{
    release();
}

/* ───────────────────────── PresentationSurface ───────────────────────── */

bool GlOutputWindow::uploadTexture(const QImage &image)
{
    if (m_released || image.isNull())
        return false;

    // The context is only guaranteed current inside paintGL.
    m_pendingImage = image;
    return true;
}

bool GlOutputWindow::uploadIcon(const QImage &icon)
{
    if (m_released || icon.isNull())
        return false;
    m_pendingIcon = icon;
    return true;
}

bool GlOutputWindow::flushIcon()
{
    if (!m_pendingIcon.isNull()) {
        m_iconTexture.reset(new QOpenGLTexture(m_pendingIcon, QOpenGLTexture::DontGenerateMipMaps));
        if (!m_iconTexture->isCreated()) {
            m_iconTexture.reset();
            return false;
        }
        m_iconTexture->setMinMagFilters(QOpenGLTexture::Nearest, QOpenGLTexture::Nearest);
        m_iconTexture->setWrapMode(QOpenGLTexture::ClampToEdge);
        m_pendingIcon = QImage();
    }
    if (!m_iconTexture)
        return false;

    if (!m_iconProgram) {
        std::unique_ptr<QOpenGLShaderProgram> program(new QOpenGLShaderProgram);
        if (!program->addShaderFromSourceCode(QOpenGLShader::Vertex, ICON_VERTEX)
            || !program->addShaderFromSourceCode(QOpenGLShader::Fragment, ICON_FRAGMENT)
            || !program->link()) {
            qCWarning(lcRender) << "icon program failed on output" << m_id << ":"
                                << program->log().trimmed();
            return false;
        }
        m_iconProgram = std::move(program);
    }
    return true;
}

void GlOutputWindow::drawIcon(const DrawCommand &command)
{
    if (!command.icon || command.iconRect.isEmpty())
        return;
    if (!flushIcon()) {
        qCWarning(lcRender) << "drawing output" << m_id << "without the icon";
        return;
    }

    QOpenGLFunctions *f = context()->functions();
    const qreal dpr = devicePixelRatio();
    const float w = float(width() * dpr);
    const float h = float(height() * dpr);
    const QRect &r = command.iconRect;

    m_iconProgram->bind();
    m_iconTexture->bind(0);
    m_iconProgram->setUniformValue("iIcon", 0);
    m_iconProgram->setUniformValue("iOpacity", command.iconOpacity);
    m_iconProgram->setUniformValue("iRect",
                                   2.0f * r.left() / w - 1.0f,
                                   1.0f - 2.0f * (r.top() + r.height()) / h,
                                   2.0f * (r.left() + r.width()) / w - 1.0f,
                                   1.0f - 2.0f * r.top() / h);

    f->glEnable(GL_BLEND);
    f->glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    m_vao.bind();
    f->glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    m_vao.release();
    f->glDisable(GL_BLEND);

    m_iconTexture->release(0);
    m_iconProgram->release();
}

void GlOutputWindow::clearTo(const QColor &color)
{
    QOpenGLFunctions *f = context()->functions();
    f->glClearColor(float(color.redF()), float(color.greenF()), float(color.blueF()), 1.0f);
    f->glClear(GL_COLOR_BUFFER_BIT);
}

bool GlOutputWindow::flushTexture()
{
    if (m_pendingImage.isNull())
        return bool(m_texture);

    m_texture.reset(new QOpenGLTexture(m_pendingImage, QOpenGLTexture::DontGenerateMipMaps));
    if (!m_texture->isCreated()) {
        m_texture.reset();
        return false;
    }
    m_texture->setMinMagFilters(QOpenGLTexture::Linear, QOpenGLTexture::Linear);
    m_texture->setWrapMode(QOpenGLTexture::MirroredRepeat);
    m_pendingImage = QImage();
    return true;
}

PresentStatus GlOutputWindow::present(const DrawCommand &command)
{
    QOpenGLContext *ctx = context();
    if (m_released || !ctx || !ctx->isValid() || QOpenGLContext::currentContext() != ctx)
        return PresentStatus::SurfaceLost;

    QOpenGLFunctions *f = ctx->functions();
    const qreal dpr = devicePixelRatio();
    f->glViewport(0, 0, int(width() * dpr), int(height() * dpr));
    if (!m_vao.isCreated() && !m_vao.create())
        return PresentStatus::SurfaceLost;

    if (command.mode == DrawCommand::SolidColor || !command.effect) {
        clearTo(command.color);
        drawIcon(command);
        return checkError();
    }

    auto *compiled = dynamic_cast<GlCompiledProgram *>(command.effect->program());
    if (!compiled) {
        qCCritical(lcRender) << "effect" << command.effect->name() << "has no GL program";
        return PresentStatus::SurfaceLost;
    }
    if (!flushTexture())
        return PresentStatus::SurfaceLost;

    QOpenGLShaderProgram *program = compiled->program();
    if (!program->bind())
        return PresentStatus::SurfaceLost;

    m_texture->bind(0);
    const QByteArray samplerName = command.sampler.toUtf8();
    program->setUniformValue(samplerName.constData(), 0);

    for (const UniformValue &u : command.uniforms) {
        const QByteArray name = u.name.toUtf8();
        const int type = u.value.userType();
        if (type == qMetaTypeId<QMatrix4x4>())
            program->setUniformValue(name.constData(), u.value.value<QMatrix4x4>());
        else if (type == qMetaTypeId<QVector2D>())
            program->setUniformValue(name.constData(), u.value.value<QVector2D>());
        else
            program->setUniformValue(name.constData(), u.value.toFloat());
    }

    m_vao.bind();
    f->glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    m_vao.release();

    m_texture->release(0);
    program->release();

    drawIcon(command);
    return checkError();
}

PresentStatus GlOutputWindow::checkError()
{
    QOpenGLFunctions *f = context()->functions();
    GLenum err = f->glGetError();
    if (err == GL_NO_ERROR)
        return PresentStatus::Presented;

    // Drain the queue so the retry starts clean.
    int drained = 0;
    while (f->glGetError() != GL_NO_ERROR && ++drained < 16) {}

    if (err == GL_CONTEXT_LOST || err == GL_OUT_OF_MEMORY)
        qCWarning(lcRender) << "GL context lost on output" << m_id;
    else
        qCWarning(lcRender) << "GL error" << QString::number(err, 16) << "on output" << m_id;
    return PresentStatus::SurfaceLost;
}

bool GlOutputWindow::recreate(const QSize &size)
{
    if (m_released)
        return false;

    QOpenGLContext *ctx = context();
    if (!ctx)
        return false;

    destroyResources();

    if (!ctx->isValid() && !ctx->create()) {
        qCWarning(lcRender) << "could not recreate GL context on output" << m_id;
        return false;
    }
    if (!ctx->makeCurrent(this))
        return false;

    if (size.isValid() && size != this->size() * devicePixelRatio())
        qCDebug(lcRender) << "output" << m_id << "now" << size;
    return true;
}

void GlOutputWindow::requestFrame()
{
    if (m_released)
        return;

    if (!isVisible()) {
        showFullScreen();
        raise();
        requestActivate();
        setKeyboardGrabEnabled(true);
        setMouseGrabEnabled(true);
    }
    update();
}

void GlOutputWindow::release()
{
    if (m_released)
        return;
    m_released = true;

    if (context() && context()->isValid()) {
        makeCurrent();
        destroyResources();
        doneCurrent();
    }
    setKeyboardGrabEnabled(false);
    setMouseGrabEnabled(false);
    hide();
    destroy();
}

void GlOutputWindow::destroyResources()
{
    m_texture.reset();
    m_iconTexture.reset();
    m_iconProgram.reset();
    if (m_vao.isCreated())
        m_vao.destroy();
}

/* ───────────────────────── QOpenGLWindow ───────────────────────── */

void GlOutputWindow::initializeGL()
{
    qCDebug(lcRender) << "output" << m_id << "GL context ready on" << screen()->name();
}

void GlOutputWindow::paintGL()
{
    if (m_released || !m_frameCallback)
        return;

    const PresentResult result = m_frameCallback(m_id);
    if (result == PresentResult::Skipped || result == PresentResult::Degraded)
        clearTo(m_fallbackColor);
}

bool GlOutputWindow::event(QEvent *e)
{
    if (e->type() == QEvent::Close) {
        e->ignore();
        return true;
    }
    return QOpenGLWindow::event(e);
}

void GlOutputWindow::keyPressEvent(QKeyEvent *e)
{
    if (isEscapeChord(e)) {
        e->ignore();
        return;
    }
    if (m_keyCallback)
        m_keyCallback(e);
    e->accept();
}

void GlOutputWindow::keyReleaseEvent(QKeyEvent *e)
{
    e->accept();
}

} // namespace shadelock
