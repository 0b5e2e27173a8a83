#include "configstore.h"
#include "debuglog.h"
#include "instancechannel.h"
#include "launchrelay.h"
#include "launchwiring.h"
#include "mainwindow.h"
#include "shellbridge.h"

#include <QApplication>
#include <QDir>
#include <QMessageBox>
#include <QObject>

int main(int argc, char *argv[]) {
    // Opt-in file logging, installed before QApplication so its startup is captured too.
    const QString logPath = qEnvironmentVariable("MARKITDOWN_LOG_PATH");
    bool logInstalled = true;
    if (!logPath.isEmpty())
        logInstalled = DebugLog::install(logPath);

    QApplication a(argc, argv);
    a.setApplicationName("MarkItDown");

    if (!logInstalled)
        qCWarning(lcShell) << "cannot open log file" << logPath << "- logging to stderr only";

    const QStringList args = a.arguments();
    qCDebug(lcShell) << "arguments:" << args;

    const AppConfig config = ConfigStore::load(ConfigStore::configFilePath());

    InstanceChannel instance(QCoreApplication::applicationName());
    if (!instance.tryBecomePrimary()) {
        if (!instance.forwardToPrimary(args, QDir::currentPath(), config.launch.forwardTimeoutMs)) {
            QMessageBox::warning(nullptr,
                                 QObject::tr("MarkItDown"),
                                 QObject::tr("Another instance of MarkItDown is already running."));
        }
        return 0;
    }

    LaunchRelay relay;
    relay.setOpenRequestDelay(config.launch.openRequestDelayMs);

    ShellBridge bridge(&relay);
    MainWindow w(config, &bridge);

    connectLaunchRelay(&instance, &relay, &w);

    relay.captureStartupPath(args);

    w.show();
    return a.exec();
}
