#ifndef SHADELOCK_EFFECT_CATALOG_H
#define SHADELOCK_EFFECT_CATALOG_H

#include "config.h"

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <memory>

namespace shadelock {

// Which geometry input an effect expects next to iTime and its sampler.
enum class GeometryInput {
    None,
    Transform,    // mat4 iTransform
    Resolution    // vec2 iResolution
};

// The per-draw inputs a program declares. The render pipeline supplies
// exactly this set, nothing more.
struct UniformContract {
    bool time = false;
    bool fadeAmount = false;
    GeometryInput geometry = GeometryInput::None;
    QString sampler;

    // Uniform names the program consumes, sorted. Includes the sampler.
    QStringList inputNames() const;
};

struct EffectParameters {
    double fadeCeilingSeconds = 10.0;
    double fadeExponent = 1.0;
};

// Backend-specific executable form of an effect. Owned jointly by the
// catalog and any session that selected it.
class CompiledProgram {
public:
    virtual ~CompiledProgram() = default;
};

class ShaderCompiler {
public:
    virtual ~ShaderCompiler() = default;

    // Returns nullptr and fills log when either stage fails to compile or the
    // program fails to link.
    virtual std::shared_ptr<CompiledProgram> compile(const QString &name,
                                                     const QByteArray &vertexSource,
                                                     const QByteArray &fragmentSource,
                                                     QString *log) = 0;
};

class EffectProgram {
public:
    EffectProgram(const QString &name,
                  const UniformContract &contract,
                  const EffectParameters &parameters,
                  std::shared_ptr<CompiledProgram> program);

    const QString &name() const { return m_name; }
    const UniformContract &contract() const { return m_contract; }
    const EffectParameters &parameters() const { return m_parameters; }
    CompiledProgram *program() const { return m_program.get(); }

private:
    const QString m_name;
    const UniformContract m_contract;
    const EffectParameters m_parameters;
    const std::shared_ptr<CompiledProgram> m_program;
};

using EffectProgramPtr = std::shared_ptr<const EffectProgram>;

struct CompileError {
    QString effect;
    QString file;
    QString message;
};

struct CatalogResult {
    bool ok = false;
    int loaded = 0;
    QVector<CompileError> errors;
    QString errorString;
};

struct SelectionPolicy {
    enum Kind { Random, Fixed };

    Kind kind = Random;
    quint32 seed = 0;
    QString name;

    static SelectionPolicy random(quint32 seed);
    static SelectionPolicy fixed(const QString &name);
};

class EffectCatalog {
public:
    explicit EffectCatalog(const FadeDefaults &defaults = FadeDefaults());

    // Compiles every *.frag under sourceDirectory independently. Broken
    // programs are reported in errors and skipped; the load only fails when
    // nothing usable is left.
    CatalogResult load(const QString &sourceDirectory, ShaderCompiler &compiler);

    // Pure over the loaded set: the same policy always yields the same program.
    EffectProgramPtr select(const SelectionPolicy &policy, QString *errorString = nullptr) const;

    EffectProgramPtr find(const QString &name) const;
    QStringList names() const { return m_programs.keys(); }
    int size() const { return m_programs.size(); }
    bool isEmpty() const { return m_programs.isEmpty(); }

    // Scans one shader stage for uniform declarations and merges them into
    // contract. Call once per stage, then validateContract().
    static bool scanUniforms(const QByteArray &source, QMap<QString, QString> *declared,
                             QString *errorString);
    static bool validateContract(const QMap<QString, QString> &declared,
                                 UniformContract *contract, QString *errorString);

    // Full-screen triangle strip from gl_VertexID; vTexCoord has its origin at
    // the top-left of the screenshot. Declares no uniforms.
    static QByteArray genericVertexSource();

private:
    EffectParameters readParameters(const QString &sidecarPath, QString *name) const;

    FadeDefaults m_defaults;
    QMap<QString, EffectProgramPtr> m_programs;
};

} // namespace shadelock

#endif // SHADELOCK_EFFECT_CATALOG_H
