#ifndef SHADELOCK_TEST_SUPPORT_H
#define SHADELOCK_TEST_SUPPORT_H

#include "../lock/auth-gateway.h"
#include "../lock/effect-catalog.h"
#include "../lock/output-registry.h"
#include "../lock/screenshot.h"
#include "../lock/surface.h"
#include "../lock/watchdog.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QMap>
#include <QMutex>
#include <QSet>
#include <QStringList>
#include <QThread>

#include <atomic>
#include <functional>
#include <memory>

namespace shadelock {
namespace test {

// Spins the event loop until pred holds or timeoutMsec passes.
inline bool waitFor(const std::function<bool()> &pred, int timeoutMsec = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMsec)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
    return true;
}

// Keeps the event loop running for msec without waiting on anything.
inline void settle(int msec)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < msec) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
}

inline bool writeFile(const QString &path, const QByteArray &content)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(content) == content.size();
}

// A fragment stage that satisfies the contract with the given extra lines.
inline QByteArray fragmentSource(const QByteArray &uniforms = QByteArray())
{
    return QByteArray("#version 330 core\n"
                      "uniform sampler2D iScreen;\n"
                      "uniform float iTime;\n")
        + uniforms
        + QByteArray("in vec2 vTexCoord;\n"
                     "out vec4 fragColor;\n"
                     "void main() { fragColor = texture(iScreen, vTexCoord); }\n");
}

/* ───────────────────────── shader compiler ───────────────────────── */

// Accepts anything that does not contain "#error".
class FakeCompiler : public ShaderCompiler {
public:
    std::shared_ptr<CompiledProgram> compile(const QString &name,
                                             const QByteArray &vertexSource,
                                             const QByteArray &fragmentSource,
                                             QString *log) override
    {
        compiled << name;
        vertexSources.insert(name, vertexSource);
        if (fragmentSource.contains("#error") || vertexSource.contains("#error")) {
            if (log)
                *log = QStringLiteral("0:1(1): error: #error directive");
            return nullptr;
        }
        return std::make_shared<CompiledProgram>();
    }

    QStringList compiled;
    QMap<QString, QByteArray> vertexSources;
};

/* ───────────────────────── presentation surface ───────────────────────── */

struct SurfaceLog {
    int uploads = 0;
    int iconUploads = 0;
    int presents = 0;
    int recreates = 0;
    int frameRequests = 0;
    bool released = false;

    QImage lastUpload;
    QVector<DrawCommand> commands;

    int failPresents = 0;       // upcoming presents that report a lost surface
    bool failRecreate = false;
    bool failUpload = false;
    bool failIconUpload = false;
};

class FakeSurface : public PresentationSurface {
public:
    explicit FakeSurface(std::shared_ptr<SurfaceLog> log) : m_log(std::move(log)) {}
    ~FakeSurface() override = default;

    bool uploadTexture(const QImage &image) override
    {
        if (m_log->failUpload)
            return false;
        ++m_log->uploads;
        m_log->lastUpload = image;
        return true;
    }

    bool uploadIcon(const QImage &) override
    {
        if (m_log->failIconUpload)
            return false;
        ++m_log->iconUploads;
        return true;
    }

    PresentStatus present(const DrawCommand &command) override
    {
        ++m_log->presents;
        m_log->commands.append(command);
        if (m_log->failPresents > 0) {
            --m_log->failPresents;
            return PresentStatus::SurfaceLost;
        }
        return PresentStatus::Presented;
    }

    bool recreate(const QSize &) override
    {
        ++m_log->recreates;
        return !m_log->failRecreate;
    }

    void requestFrame() override { ++m_log->frameRequests; }
    void release() override { m_log->released = true; }

private:
    std::shared_ptr<SurfaceLog> m_log;
};

// Hands out fake surfaces and keeps their logs reachable by output id.
struct SurfaceFarm {
    QMap<OutputId, std::shared_ptr<SurfaceLog>> logs;
    QSet<OutputId> refuse;

    OutputRegistry::SurfaceFactory factory()
    {
        return [this](OutputId id, const OutputGeometry &, QString *errorString)
                   -> std::unique_ptr<PresentationSurface> {
            if (refuse.contains(id)) {
                if (errorString)
                    *errorString = QStringLiteral("no surface for this output");
                return nullptr;
            }
            auto log = std::make_shared<SurfaceLog>();
            logs.insert(id, log);
            return std::unique_ptr<PresentationSurface>(new FakeSurface(log));
        };
    }
};

/* ───────────────────────── screen capturer ───────────────────────── */

class FakeCapturer : public ScreenCapturer {
public:
    CaptureResult capture(OutputId id) override
    {
        captured << id;
        if (failing.contains(id)) {
            CaptureResult r;
            r.errorString = QStringLiteral("capture refused");
            return r;
        }
        CaptureResult r;
        r.ok = true;
        r.buffer.image = QImage(size, QImage::Format_ARGB32);
        r.buffer.image.fill(color);
        return r;
    }

    QSize size = QSize(64, 48);
    QColor color = QColor(200, 120, 40);
    QSet<OutputId> failing;
    QVector<OutputId> captured;
};

/* ───────────────────────── credential verifier ───────────────────────── */

// Accepts exactly one credential. Runs on the gateway's worker threads.
class FakeVerifier : public CredentialVerifier {
public:
    explicit FakeVerifier(const QByteArray &accepted = "hunter2") : m_accepted(accepted) {}

    AuthResult verify(const QByteArray &credential) override
    {
        const int running = ++m_running;
        int seen = m_maxRunning.load();
        while (running > seen && !m_maxRunning.compare_exchange_weak(seen, running)) {}

        if (latencyMsec > 0)
            QThread::msleep(ulong(latencyMsec));

        {
            QMutexLocker lock(&m_mutex);
            // Deep copy, so the gateway stays the sole owner of its bytes.
            m_seen << QByteArray(credential.constData(), credential.size());
            if (!credential.isDetached())
                ++m_shared;
        }
        ++m_calls;
        --m_running;

        if (failWithError)
            return AuthResult::Error;
        return credential == m_accepted ? AuthResult::Success : AuthResult::Failure;
    }

    int calls() const { return m_calls.load(); }
    // Checks that received bytes somebody else still referenced.
    int sharedCredentials() const
    {
        QMutexLocker lock(&m_mutex);
        return m_shared;
    }
    int maxConcurrent() const { return m_maxRunning.load(); }
    QList<QByteArray> seen() const
    {
        QMutexLocker lock(&m_mutex);
        return m_seen;
    }

    std::atomic<int> latencyMsec{0};
    std::atomic<bool> failWithError{false};

private:
    const QByteArray m_accepted;
    std::atomic<int> m_calls{0};
    std::atomic<int> m_running{0};
    std::atomic<int> m_maxRunning{0};
    mutable QMutex m_mutex;
    QList<QByteArray> m_seen;
    int m_shared = 0;
};

/* ───────────────────────── notify sink ───────────────────────── */

class RecordingSink : public NotifySink {
public:
    bool notify(const QByteArray &message) override
    {
        messages << message;
        return true;
    }

    int count(const QByteArray &message) const { return messages.count(message); }

    QList<QByteArray> messages;
};

} // namespace test
} // namespace shadelock

#endif // SHADELOCK_TEST_SUPPORT_H
