/*
RangeScope — main.cpp
Role: Entry point for the RangeScope GUI application.
Startup is split into small setup steps: command line, configuration, metatypes, window.
*/
#include <QApplication>
#include <QCommandLineParser>
#include <QMetaType>

#include "AppConfig.hpp"
#include "MainWindow.hpp"
#include "RangeScopeLogging.hpp"
#include "orchestrator/RequestOrchestrator.hpp"
#include "pool/PoolTypes.hpp"

struct LaunchOptions {
    QString configPath = QStringLiteral("config.ini");
    PoolIdentity initialPool;
};

// --- Command line ---
LaunchOptions parseCommandLine(const QApplication& app) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Concentrated-liquidity range explorer");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption poolOption("pool", "Pool address to open on startup.", "address");
    const QCommandLineOption chainOption("chain", "Chain id of the pool.", "id", "1");
    const QCommandLineOption dexOption("dex", "Dex id of the pool.", "id", "1");
    const QCommandLineOption configOption("config", "Path to the INI configuration file.", "path", "config.ini");
    parser.addOptions({poolOption, chainOption, dexOption, configOption});
    parser.process(app);

    LaunchOptions options;
    options.configPath = parser.value(configOption);
    options.initialPool.poolAddress = parser.value(poolOption).trimmed().toStdString();

    bool ok = false;
    const qint64 chain = parser.value(chainOption).toLongLong(&ok);
    if (ok) {
        options.initialPool.chainId = chain;
    } else {
        rsLog_Warning("Ignoring invalid --chain value" << parser.value(chainOption));
        options.initialPool.chainId = 1;
    }
    const qint64 dex = parser.value(dexOption).toLongLong(&ok);
    if (ok) {
        options.initialPool.dexId = dex;
    } else {
        rsLog_Warning("Ignoring invalid --dex value" << parser.value(dexOption));
        options.initialPool.dexId = 1;
    }
    return options;
}

// --- Qt metatype registration ---
void registerMetaTypes() {
    qRegisterMetaType<StageId>("StageId");
    qRegisterMetaType<PoolIdentity>("PoolIdentity");
}

// --- Main application entrypoint ---
int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("RangeScope");
    QApplication::setApplicationVersion("0.1.0");

    const LaunchOptions options = parseCommandLine(app);
    rsLog_App("[RangeScope starting, config:" << options.configPath << "]");

    registerMetaTypes();
    const AppConfig config = AppConfig::load(options.configPath);

    MainWindow window(config);
    window.show();

    if (options.initialPool.isValid()) {
        window.loadPool(options.initialPool);
    }

    rsLog_App("Starting Qt event loop");
    return app.exec();
}
