#ifndef SHADELOCK_GL_SHADER_COMPILER_H
#define SHADELOCK_GL_SHADER_COMPILER_H

#include "../lock/effect-catalog.h"

#include <QOffscreenSurface>
#include <QOpenGLShaderProgram>

#include <memory>

namespace shadelock {

class GlCompiledProgram : public CompiledProgram {
public:
    explicit GlCompiledProgram(std::unique_ptr<QOpenGLShaderProgram> program)
        : m_program(std::move(program)) {}

    QOpenGLShaderProgram *program() const { return m_program.get(); }

private:
    std::unique_ptr<QOpenGLShaderProgram> m_program;
};

// Builds programs in Qt's global share context so every output window can
// use them. Requires Qt::AA_ShareOpenGLContexts before the application is
// constructed.
class GlShaderCompiler : public ShaderCompiler {
public:
    GlShaderCompiler();
    ~GlShaderCompiler() override;

    bool initialize(QString *errorString);

    std::shared_ptr<CompiledProgram> compile(const QString &name,
                                             const QByteArray &vertexSource,
                                             const QByteArray &fragmentSource,
                                             QString *log) override;

private:
    QOffscreenSurface m_surface;
    QOpenGLContext *m_context = nullptr;
};

} // namespace shadelock

#endif // SHADELOCK_GL_SHADER_COMPILER_H
