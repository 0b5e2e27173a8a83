#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

#include "configstore.h"

class QWebChannel;
class QWebEngineView;
class ShellBridge;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(const AppConfig &config, ShellBridge *bridge, QWidget *parent = nullptr);
    ~MainWindow();

public slots:
    void bringToFront();

private slots:
    void clearBrowsingDataAndReload();

private:
    QWebEngineView *view;
    QWebChannel *channel;
    ShellBridge *bridge;
};

#endif // MAINWINDOW_H
