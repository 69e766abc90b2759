/*
Run:
./shadelock
./shadelock --effect ripple
./shadelock --effects ~/shaders --seed 42 --verbose
./shadelock --icon ~/padlock.png
*/

#include "gl/gl-shader-compiler.h"
#include "gl/lock-host.h"
#include "lock/auth-gateway.h"
#include "lock/config.h"
#include "lock/effect-catalog.h"
#include "lock/lock-session.h"
#include "lock/log.h"
#include "lock/pam-verifier.h"
#include "lock/render-pipeline.h"
#include "lock/screenshot.h"
#include "lock/watchdog.h"

#include <QGuiApplication>
#include <QImage>
#include <QProcessEnvironment>
#include <QRandomGenerator>
#include <QSurfaceFormat>

#include <signal.h>

#include <memory>

using namespace shadelock;

// ─────────────────────────────────────────────
// Best-effort signal hardening
// ─────────────────────────────────────────────
static void ignoreSignal(int) {}
static void installSignalHardening() {
    signal(SIGINT,  ignoreSignal);
    signal(SIGTERM, ignoreSignal);
    signal(SIGHUP,  ignoreSignal);
    signal(SIGQUIT, ignoreSignal);
}

static std::shared_ptr<CredentialVerifier> makeVerifier(const LockConfig &config, QString *errorString) {
    if (config.authBackend == QLatin1String("null")) {
        qCWarning(lcAuth) << "null authentication backend configured: ANY credential unlocks";
        return std::make_shared<NullVerifier>();
    }

    const QString user = PamVerifier::currentUser();
    if (user.isEmpty()) {
        *errorString = QStringLiteral("cannot resolve the current user");
        return nullptr;
    }
    qCInfo(lcAuth) << "authenticating" << user << "against PAM service" << config.authService;
    return std::make_shared<PamVerifier>(config.authService, user);
}

// ─────────────────────────────────────────────
// main()
// ─────────────────────────────────────────────
int main(int argc, char *argv[]) {
    installSignalHardening();

    QGuiApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
    QSurfaceFormat format;
    format.setRenderableType(QSurfaceFormat::OpenGL);
    format.setVersion(3, 3);
    format.setProfile(QSurfaceFormat::CoreProfile);
    format.setSwapInterval(1);
    QSurfaceFormat::setDefaultFormat(format);

    QGuiApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("shadelock"));
    app.setQuitOnLastWindowClosed(false);

    LockConfig config = loadConfig(defaultConfigPath(), QProcessEnvironment::systemEnvironment());
    QString error;
    if (!applyArguments(&config, app.arguments().mid(1), &error)) {
        installLogging(false);
        qCCritical(lcConfig) << error;
        return 1;
    }
    installLogging(config.verbose);

    // ── Effects ──
    GlShaderCompiler compiler;
    if (!compiler.initialize(&error)) {
        qCCritical(lcEffects) << error;
        return 1;
    }

    EffectCatalog catalog(config.fade);
    CatalogResult loaded = catalog.load(config.effectsDirectory, compiler);
    for (const CompileError &e : loaded.errors)
        qCWarning(lcEffects) << "skipped" << e.effect << "(" << e.file << "):" << e.message;
    if (!loaded.ok) {
        qCCritical(lcEffects) << loaded.errorString;
        return 1;
    }

    SelectionPolicy policy = config.effectName.isEmpty()
        ? SelectionPolicy::random(config.hasSeed ? config.seed : QRandomGenerator::global()->generate())
        : SelectionPolicy::fixed(config.effectName);

    // ── Authentication ──
    std::shared_ptr<CredentialVerifier> verifier = makeVerifier(config, &error);
    if (!verifier) {
        qCCritical(lcAuth) << error;
        return 1;
    }
    AuthGateway gateway(verifier, config.backoff);

    // ── Session ──
    QImage icon;
    if (!config.iconPath.isEmpty() && !loadIcon(config.iconPath, &icon, &error))
        qCWarning(lcRender) << error << "- locking without an icon";
    RenderPipeline pipeline(config.fallbackColor, icon);
    LockHost host;
    LockSession session(catalog, host.outputs(), pipeline, gateway, host.capturer());

    std::shared_ptr<NotifySink> sink(SystemdNotifySink::fromEnvironment());
    Watchdog watchdog(sink, config.watchdogTimeoutMsec);
    QObject::connect(&session, &LockSession::stateChanged, &watchdog, &Watchdog::onStateChanged);

    bool unlocked = false;
    QObject::connect(&session, &LockSession::unlocked, &app, [&unlocked]() {
        unlocked = true;
        QGuiApplication::quit();
    }, Qt::QueuedConnection);
    QObject::connect(&session, &LockSession::authenticationRejected, &app, []() {
        qCInfo(lcSession) << "credential rejected, still locked";
    });

    host.attach(&session);
    if (!session.engage(policy, &error)) {
        qCCritical(lcSession) << "lock not engaged:" << error;
        return 1;
    }

    app.exec();
    return unlocked ? 0 : 1;
}
