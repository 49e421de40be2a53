#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QThread>

#include "phi/adapter/sdk/sidecar.h"
#include "tv_schema.h"
#include "tv_sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;
namespace tv = phicore::samsungtv::ipc;

constexpr auto kPollSlice = std::chrono::milliseconds(250);
constexpr int kQtSliceMs = 5;

std::atomic_bool g_stopRequested{false};

void requestStop(int)
{
    g_stopRequested.store(true);
}

class SamsungTvFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override { return tv::kPluginType; }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<tv::SamsungTvSidecar>();
    }
};

// Positional argument wins over PHI_ADAPTER_SOCKET_PATH, then the built-in default.
QString resolveSocketPath(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty())
        return positional.constFirst();
    const QString fromEnv = qEnvironmentVariable("PHI_ADAPTER_SOCKET_PATH");
    if (!fromEnv.isEmpty())
        return fromEnv;
    return QStringLiteral("/tmp/phi-adapter-samsungtv-ipc.sock");
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("phi_adapter_samsungtv_ipc"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Samsung TV adapter sidecar"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("socket"), QStringLiteral("Adapter IPC socket path"));
    const QCommandLineOption verboseOption(QStringList{ QStringLiteral("v"), QStringLiteral("verbose") },
                                           QStringLiteral("Enable debug logging"));
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("phi-core.adapters.samsungtv.debug=true"));

    std::signal(SIGINT, requestStop);
    std::signal(SIGTERM, requestStop);

    const QString socketPath = resolveSocketPath(parser);
    std::cerr << "starting phi_adapter_samsungtv_ipc for pluginType=" << tv::kPluginType
              << " socket=" << socketPath.toStdString() << '\n';

    SamsungTvFactory factory;
    sdk::SidecarHost host(socketPath.toStdString(), factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    while (!g_stopRequested.load()) {
        if (!host.pollOnce(kPollSlice, &error)) {
            std::cerr << "poll failed: " << error << '\n';
            QThread::msleep(static_cast<unsigned long>(kPollSlice.count()));
        }

        if (auto *sidecar = dynamic_cast<tv::SamsungTvSidecar *>(host.adapter()))
            sidecar->tick();

        // Wake sequences, polling and deferred app-list refreshes run on Qt timers.
        QCoreApplication::processEvents(QEventLoop::AllEvents, kQtSliceMs);
    }

    host.stop();
    std::cerr << "stopping phi_adapter_samsungtv_ipc" << '\n';
    return 0;
}
