#include "gl-shader-compiler.h"
#include "../lock/log.h"

#include <QOpenGLContext>

namespace shadelock {

GlShaderCompiler::GlShaderCompiler() = default;

GlShaderCompiler::~GlShaderCompiler()
{
    m_surface.destroy();
}

bool GlShaderCompiler::initialize(QString *errorString)
{
    m_context = QOpenGLContext::globalShareContext();
    if (!m_context || !m_context->isValid()) {
        if (errorString)
            *errorString = QStringLiteral("no shared OpenGL context available");
        return false;
    }

    m_surface.setFormat(m_context->format());
    m_surface.create();
    if (!m_surface.isValid()) {
        if (errorString)
            *errorString = QStringLiteral("could not create an offscreen surface");
        return false;
    }

    const QSurfaceFormat fmt = m_context->format();
    qCInfo(lcEffects) << "compiling against OpenGL" << fmt.majorVersion() << "." << fmt.minorVersion()
                      << (fmt.profile() == QSurfaceFormat::CoreProfile ? "core" : "compat");
    return true;
}

std::shared_ptr<CompiledProgram> GlShaderCompiler::compile(const QString &name,
                                                           const QByteArray &vertexSource,
                                                           const QByteArray &fragmentSource,
                                                           QString *log)
{
    if (!m_context || !m_context->makeCurrent(&m_surface)) {
        if (log)
            *log = QStringLiteral("shared OpenGL context is not usable");
        return nullptr;
    }

    std::unique_ptr<QOpenGLShaderProgram> program(new QOpenGLShaderProgram);
    bool ok = program->addShaderFromSourceCode(QOpenGLShader::Vertex, vertexSource)
           && program->addShaderFromSourceCode(QOpenGLShader::Fragment, fragmentSource)
           && program->link();
    if (!ok && log)
        *log = program->log().trimmed();

    if (ok)
        qCDebug(lcEffects) << "linked" << name << "program" << program->programId();

    m_context->doneCurrent();

    if (!ok)
        return nullptr;
    return std::make_shared<GlCompiledProgram>(std::move(program));
}

} // namespace shadelock
