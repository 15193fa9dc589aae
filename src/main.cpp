#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include <QByteArray>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>

#include "petkit_log.h"
#include "petkit_schema.h"
#include "petkit_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;
namespace petkit = phicore::petkit::ipc;

// One host poll slice, then a short Qt slice so the coordinator timers and
// pending network replies get their turn.
constexpr std::chrono::milliseconds kHostPollSlice{250};
constexpr std::chrono::milliseconds kPollRetryDelay{250};
constexpr int kQtEventSliceMs = 5;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class PetkitFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return petkit::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<petkit::PetkitSidecar>();
    }
};

v1::Utf8String resolveSocketPath(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty())
        return positional.constFirst().toStdString();

    const QByteArray fromEnv = qgetenv(petkit::kSocketPathEnv);
    if (!fromEnv.isEmpty())
        return fromEnv.toStdString();

    return petkit::kDefaultSocketPath;
}

void runHostLoop(sdk::SidecarHost &host)
{
    v1::Utf8String error;
    while (g_running.load()) {
        if (!host.pollOnce(kHostPollSlice, &error)) {
            qCWarning(petkitLog) << "Sidecar host poll failed:" << QString::fromStdString(error);
            std::this_thread::sleep_for(kPollRetryDelay);
        }

        if (auto *adapter = dynamic_cast<petkit::PetkitSidecar *>(host.adapter()))
            adapter->tick();

        QCoreApplication::processEvents(QEventLoop::AllEvents, kQtEventSliceMs);
    }
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("phi-adapter-petkit"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Petkit cloud adapter sidecar"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("socket"), QStringLiteral("Host socket path."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Enable Petkit debug logging."));
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("phi-core.adapters.petkit.debug=true"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const v1::Utf8String socketPath = resolveSocketPath(parser);
    qCInfo(petkitLog).noquote() << "Starting" << petkit::kExecutableName << "for pluginType" << petkit::kPluginType
                                << "on" << QString::fromStdString(socketPath);

    PetkitFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        qCCritical(petkitLog) << "Failed to start sidecar host:" << QString::fromStdString(error);
        return 1;
    }

    runHostLoop(host);

    host.stop();
    qCInfo(petkitLog) << "Stopping" << petkit::kExecutableName;
    return 0;
}
