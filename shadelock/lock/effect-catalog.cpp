#include "effect-catalog.h"
#include "log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QSettings>

#include <algorithm>
#include <utility>

namespace shadelock {

static const char *UNIFORM_TIME = "iTime";
static const char *UNIFORM_FADE = "iFadeAmount";
static const char *UNIFORM_TRANSFORM = "iTransform";
static const char *UNIFORM_RESOLUTION = "iResolution";

QStringList UniformContract::inputNames() const
{
    QStringList out;
    if (time) out << UNIFORM_TIME;
    if (fadeAmount) out << UNIFORM_FADE;
    if (geometry == GeometryInput::Transform) out << UNIFORM_TRANSFORM;
    if (geometry == GeometryInput::Resolution) out << UNIFORM_RESOLUTION;
    if (!sampler.isEmpty()) out << sampler;
    out.sort();
    return out;
}

EffectProgram::EffectProgram(const QString &name,
                             const UniformContract &contract,
                             const EffectParameters &parameters,
                             std::shared_ptr<CompiledProgram> program)
    : m_name(name),
      m_contract(contract),
      m_parameters(parameters),
      m_program(std::move(program))
{
}

SelectionPolicy SelectionPolicy::random(quint32 seed)
{
    SelectionPolicy p;
    p.kind = Random;
    p.seed = seed;
    return p;
}

SelectionPolicy SelectionPolicy::fixed(const QString &name)
{
    SelectionPolicy p;
    p.kind = Fixed;
    p.name = name;
    return p;
}

/* ───────────────────────── SOURCE SCANNING ───────────────────────── */

static QByteArray stripComments(const QByteArray &source)
{
    QByteArray out;
    out.reserve(source.size());

    int i = 0;
    const int n = source.size();
    while (i < n) {
        if (source[i] == '/' && i + 1 < n && source[i + 1] == '/') {
            while (i < n && source[i] != '\n') ++i;
        } else if (source[i] == '/' && i + 1 < n && source[i + 1] == '*') {
            i += 2;
            while (i + 1 < n && !(source[i] == '*' && source[i + 1] == '/')) ++i;
            i += 2;
            out.append(' ');
        } else {
            out.append(source[i++]);
        }
    }
    return out;
}

bool EffectCatalog::scanUniforms(const QByteArray &source, QMap<QString, QString> *declared,
                                 QString *errorString)
{
    static const QRegularExpression decl(QStringLiteral(
        "\\buniform\\s+(?:(?:lowp|mediump|highp)\\s+)?(\\w+)\\s+([^;{]+);"));
    static const QRegularExpression arraySuffix(QStringLiteral("\\[[^\\]]*\\]"));
    static const QRegularExpression block(QStringLiteral("\\buniform\\s+(\\w+)\\s*\\{"));

    const QString text = QString::fromUtf8(stripComments(source));

    // Members of an interface block never get bound, so the block is refused.
    QRegularExpressionMatch blockMatch = block.match(text);
    if (blockMatch.hasMatch()) {
        if (errorString)
            *errorString = QString("unsupported uniform block %1").arg(blockMatch.captured(1));
        return false;
    }

    auto it = decl.globalMatch(text);
    while (it.hasNext()) {
        auto m = it.next();
        const QString type = m.captured(1);
        const QStringList names = m.captured(2).split(',');
        for (QString name : names) {
            name.remove(arraySuffix);
            name = name.section('=', 0, 0).trimmed();
            if (name.isEmpty())
                continue;

            auto existing = declared->constFind(name);
            if (existing != declared->constEnd() && existing.value() != type) {
                if (errorString)
                    *errorString = QString("uniform %1 declared as both %2 and %3")
                                       .arg(name, existing.value(), type);
                return false;
            }
            declared->insert(name, type);
        }
    }
    return true;
}

bool EffectCatalog::validateContract(const QMap<QString, QString> &declared,
                                     UniformContract *contract, QString *errorString)
{
    auto fail = [errorString](const QString &msg) {
        if (errorString) *errorString = msg;
        return false;
    };

    UniformContract c;
    bool hasTransform = false;
    bool hasResolution = false;

    for (auto it = declared.constBegin(); it != declared.constEnd(); ++it) {
        const QString &name = it.key();
        const QString &type = it.value();

        if (type == "sampler2D") {
            if (!c.sampler.isEmpty())
                return fail(QString("more than one sampler (%1, %2)").arg(c.sampler, name));
            c.sampler = name;
        } else if (name == UNIFORM_TIME) {
            if (type != "float")
                return fail(QString("iTime must be float, not %1").arg(type));
            c.time = true;
        } else if (name == UNIFORM_FADE) {
            if (type != "float")
                return fail(QString("iFadeAmount must be float, not %1").arg(type));
            c.fadeAmount = true;
        } else if (name == UNIFORM_TRANSFORM) {
            if (type != "mat4")
                return fail(QString("iTransform must be mat4, not %1").arg(type));
            hasTransform = true;
        } else if (name == UNIFORM_RESOLUTION) {
            if (type != "vec2")
                return fail(QString("iResolution must be vec2, not %1").arg(type));
            hasResolution = true;
        } else {
            return fail(QString("unsupported input %1 %2").arg(type, name));
        }
    }

    if (!c.time)
        return fail("missing required input float iTime");
    if (c.sampler.isEmpty())
        return fail("missing screenshot sampler2D");
    if (hasTransform && hasResolution)
        return fail("declares both iTransform and iResolution");

    if (hasTransform)
        c.geometry = GeometryInput::Transform;
    else if (hasResolution)
        c.geometry = GeometryInput::Resolution;

    *contract = c;
    return true;
}

QByteArray EffectCatalog::genericVertexSource()
{
    return QByteArrayLiteral(
        "#version 330 core\n"
        "out vec2 vTexCoord;\n"
        "void main() {\n"
        "    vec2 corner = vec2(float(gl_VertexID & 1), float((gl_VertexID >> 1) & 1));\n"
        "    vTexCoord = vec2(corner.x, 1.0 - corner.y);\n"
        "    gl_Position = vec4(corner * 2.0 - 1.0, 0.0, 1.0);\n"
        "}\n");
}

/* ───────────────────────── LOADING ───────────────────────── */

EffectCatalog::EffectCatalog(const FadeDefaults &defaults)
    : m_defaults(defaults)
{
}

EffectParameters EffectCatalog::readParameters(const QString &sidecarPath, QString *name) const
{
    EffectParameters p;
    p.fadeCeilingSeconds = m_defaults.ceilingSeconds;
    p.fadeExponent = m_defaults.exponent;

    if (QFile::exists(sidecarPath)) {
        QSettings s(sidecarPath, QSettings::IniFormat);
        s.beginGroup("Effect");

        QString n = s.value("Name").toString().trimmed();
        if (!n.isEmpty())
            *name = n;

        bool ok = false;
        double ceiling = s.value("FadeCeiling").toDouble(&ok);
        if (ok && ceiling > 0.0)
            p.fadeCeilingSeconds = ceiling;
        else if (s.contains("FadeCeiling"))
            qCWarning(lcEffects) << sidecarPath << ": ignoring invalid FadeCeiling";

        double exponent = s.value("FadeExponent").toDouble(&ok);
        if (ok && exponent > 0.0)
            p.fadeExponent = exponent;
        else if (s.contains("FadeExponent"))
            qCWarning(lcEffects) << sidecarPath << ": ignoring invalid FadeExponent";

        s.endGroup();
    }

    // No effect may keep desktop content readable past the session-wide bound.
    p.fadeCeilingSeconds = std::min(p.fadeCeilingSeconds, m_defaults.maxCeilingSeconds);
    return p;
}

static bool readSource(const QString &path, QByteArray *out, QString *errorString)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        *errorString = QString("cannot read: %1").arg(f.errorString());
        return false;
    }
    *out = f.readAll();
    return true;
}

CatalogResult EffectCatalog::load(const QString &sourceDirectory, ShaderCompiler &compiler)
{
    CatalogResult result;
    m_programs.clear();

    QDir dir(sourceDirectory);
    if (!dir.exists()) {
        result.errorString = QString("effects directory %1 does not exist").arg(sourceDirectory);
        qCCritical(lcEffects) << result.errorString;
        return result;
    }

    const QFileInfoList fragments = dir.entryInfoList(
        QStringList() << "*.frag", QDir::Files | QDir::Readable, QDir::Name);

    for (const QFileInfo &frag : fragments) {
        const QString stem = frag.completeBaseName();
        QString name = stem;
        QString message;

        auto reject = [&](const QString &file, const QString &msg) {
            qCWarning(lcEffects) << "skipping effect" << name << ":" << msg;
            result.errors.append({name, file, msg});
        };

        QByteArray fragmentSource;
        if (!readSource(frag.filePath(), &fragmentSource, &message)) {
            reject(frag.filePath(), message);
            continue;
        }

        QString vertexPath = dir.filePath(stem + ".vert");
        QByteArray vertexSource;
        if (QFile::exists(vertexPath)) {
            if (!readSource(vertexPath, &vertexSource, &message)) {
                reject(vertexPath, message);
                continue;
            }
        } else {
            vertexPath.clear();
            vertexSource = genericVertexSource();
        }

        EffectParameters params = readParameters(dir.filePath(stem + ".effect"), &name);

        if (m_programs.contains(name)) {
            reject(frag.filePath(), "duplicate effect name");
            continue;
        }

        QMap<QString, QString> declared;
        UniformContract contract;
        if (!scanUniforms(vertexSource, &declared, &message)
            || !scanUniforms(fragmentSource, &declared, &message)
            || !validateContract(declared, &contract, &message)) {
            reject(frag.filePath(), message);
            continue;
        }

        QString log;
        std::shared_ptr<CompiledProgram> program =
            compiler.compile(name, vertexSource, fragmentSource, &log);
        if (!program) {
            reject(frag.filePath(), log.isEmpty() ? QString("compilation failed") : log.trimmed());
            continue;
        }

        qCDebug(lcEffects) << "loaded effect" << name << "inputs" << contract.inputNames()
                           << "fade ceiling" << params.fadeCeilingSeconds << "s"
                           << (vertexPath.isEmpty() ? "(generic vertex stage)" : "");
        m_programs.insert(name, std::make_shared<const EffectProgram>(
                                    name, contract, params, std::move(program)));
    }

    result.loaded = m_programs.size();
    if (m_programs.isEmpty()) {
        result.errorString = QString("no usable effect programs in %1 (%2 rejected)")
                                 .arg(sourceDirectory)
                                 .arg(result.errors.size());
        qCCritical(lcEffects) << result.errorString;
        return result;
    }

    qCInfo(lcEffects) << "catalog holds" << result.loaded << "effects," << result.errors.size()
                      << "rejected";
    result.ok = true;
    return result;
}

EffectProgramPtr EffectCatalog::find(const QString &name) const
{
    return m_programs.value(name);
}

EffectProgramPtr EffectCatalog::select(const SelectionPolicy &policy, QString *errorString) const
{
    if (m_programs.isEmpty()) {
        if (errorString)
            *errorString = "effect catalog is empty";
        return nullptr;
    }

    if (policy.kind == SelectionPolicy::Fixed) {
        EffectProgramPtr p = find(policy.name);
        if (!p && errorString)
            *errorString = QString("effect %1 not found").arg(policy.name);
        return p;
    }

    QRandomGenerator rng(policy.seed);
    const int index = int(rng.bounded(quint32(m_programs.size())));
    return m_programs.value(m_programs.keys().at(index));
}

} // namespace shadelock
