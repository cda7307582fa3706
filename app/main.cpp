// Application entry point: load settings, connect the device and upload the given files.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include "ConsoleShell.hpp"
#include "Settings.hpp"
#include "meterlink/FileCatalog.hpp"
#include "meterlink/HttpDeviceApi.hpp"
#include "meterlink/Log.hpp"
#include "meterlink/WebSocketStreamChannel.hpp"

static std::atomic<bool> g_stop{false};

static void onSignal(int) {
    g_stop.store(true);
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("MeterLink");
    QCoreApplication::setOrganizationName("MeterLink");

    QCommandLineParser parser;
    parser.setApplicationDescription("Upload meter measurement files and keep the device online.");
    parser.addHelpOption();
    QCommandLineOption configOpt({"c", "config"}, "Settings file (created with defaults if missing).",
                                 "ini", QDir(QCoreApplication::applicationDirPath()).filePath("meterlink.ini"));
    QCommandLineOption registerOpt("register", "Register the device before connecting.");
    QCommandLineOption modeOpt("mode", "Heartbeat mode: polling or stream.", "mode");
    QCommandLineOption concurrencyOpt("concurrency", "Number of simultaneous uploads.", "n");
    parser.addOption(configOpt);
    parser.addOption(registerOpt);
    parser.addOption(modeOpt);
    parser.addOption(concurrencyOpt);
    parser.addPositionalArgument("files", "Spreadsheet (.xlsx, .xls) or image (.jpg, .jpeg, .png, .bmp) files.",
                                 "[files...]");
    parser.process(app);

    ConsoleShell shell;

    AppSettings settings;
    QString qerr;
    const QString configPath = parser.value(configOpt);
    if (!AppSettings::load(configPath, settings, qerr)) {
        shell.print(qerr, true);
        return 2;
    }
    if (settings.hardwareKey.isEmpty()) {
        settings.hardwareKey = machineKey();
        if (!settings.save(configPath, qerr)) shell.print(qerr, true);
    }
    if (parser.isSet(modeOpt) && !parseMode(parser.value(modeOpt), settings.mode)) {
        shell.print(QStringLiteral("Unknown mode: %1").arg(parser.value(modeOpt)), true);
        return 2;
    }
    if (parser.isSet(concurrencyOpt)) {
        bool ok = false;
        const int n = parser.value(concurrencyOpt).toInt(&ok);
        if (!ok || n < 1) {
            shell.print(QStringLiteral("Invalid concurrency: %1").arg(parser.value(concurrencyOpt)), true);
            return 2;
        }
        settings.concurrentUploads = n;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    meterlink::HttpDeviceApi api(settings.serverUrl.toStdString(), settings.requestTimeout);
    const std::string baseUrl = api.baseUrl();
    meterlink::SessionController session(api, settings.toSessionConfig(), [baseUrl]() {
        return std::unique_ptr<meterlink::StreamChannel>(new meterlink::WebSocketStreamChannel(baseUrl));
    });
    session.setObserver(&shell);
    LOGI("main: server %s, device %s, %s mode", baseUrl.c_str(),
         settings.deviceId.toStdString().c_str(), modeName(settings.mode).toStdString().c_str());

    std::string err;
    if (parser.isSet(registerOpt) && !session.registerDevice(err)) return 1;
    if (!session.connect(err)) return 1;

    const QStringList files = parser.positionalArguments();
    int exitCode = 0;
    if (files.isEmpty()) {
        shell.print(QStringLiteral("Heartbeat running, press Ctrl+C to go offline."));
        while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    } else {
        for (const QString& f : files) {
            const std::string path = QFileInfo(f).absoluteFilePath().toStdString();
            std::optional<std::string> description;
            if (auto cat = meterlink::classifyFile(path)) {
                description = settings.descriptionFor(*cat).toStdString();
            }
            std::uint64_t id = 0;
            if (!session.addFile(path, id, err, description)) {
                shell.print(QStringLiteral("%1: %2").arg(f, QString::fromStdString(err)), true);
                exitCode = 1;
                err.clear();
            }
        }
        const auto counts = session.queue().counts();
        shell.print(QStringLiteral("Queued %1 file(s): %2 tabular, %3 image")
                        .arg(counts.total()).arg(counts.tabular).arg(counts.image));
        if (counts.total() > 0 && session.uploadSelected(err)) {
            meterlink::BatchTally tally;
            if (shell.waitForBatch(g_stop, tally)) {
                shell.print(QStringLiteral("All uploads finished! Succeeded: %1, Failed: %2")
                                .arg(tally.succeeded).arg(tally.failed));
                if (tally.failed > 0) exitCode = 1;
            } else {
                session.stopUploads();
                exitCode = 1;
            }
        } else {
            exitCode = 1;
        }
    }

    session.shutdown();
    shell.print(QStringLiteral("Device offline."));
    return exitCode;
}
