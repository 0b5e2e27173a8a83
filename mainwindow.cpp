#include "mainwindow.h"
#include "shellbridge.h"
#include "debuglog.h"

#include <QCoreApplication>
#include <QWebChannel>
#include <QWebEngineCookieStore>
#include <QWebEnginePage>
#include <QWebEngineProfile>
#include <QWebEngineView>

MainWindow::MainWindow(const AppConfig &config, ShellBridge *bridge, QWidget *parent)
    : QMainWindow(parent)
      , view(new QWebEngineView(this))
      , channel(new QWebChannel(this))
      , bridge(bridge) {
    setWindowTitle(config.window.title.isEmpty() ? QCoreApplication::applicationName()
                                                 : config.window.title);
    resize(config.window.width, config.window.height);
    setCentralWidget(view);

    channel->registerObject(QStringLiteral("shell"), bridge);
    view->page()->setWebChannel(channel);

    connect(bridge, &ShellBridge::clearCacheRequested,
            this, &MainWindow::clearBrowsingDataAndReload);

    const QUrl url = ConfigStore::frontendUrl(config);
    qCInfo(lcShell) << "loading frontend" << url.toString();
    view->load(url);
}

MainWindow::~MainWindow() {
    channel->deregisterObject(bridge);
}

void MainWindow::bringToFront() {
    showNormal();
    raise();
    activateWindow();
}

void MainWindow::clearBrowsingDataAndReload() {
    QWebEnginePage *page = view->page();
    QWebEngineProfile *profile = page->profile();
    profile->clearHttpCache();
    profile->clearAllVisitedLinks();
    profile->cookieStore()->deleteAllCookies();
    // The profile has no call for web storage; the page clears it and reloads itself.
    page->runJavaScript(ShellBridge::clearStorageScript());
}
