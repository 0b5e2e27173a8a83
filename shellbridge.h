#ifndef SHELLBRIDGE_H
#define SHELLBRIDGE_H

#include <QObject>
#include <QString>

class LaunchRelay;

/**
 * @brief Commands published to the frontend over QWebChannel as "shell".
 *
 * openFileRequested is the push side of the launch path handoff,
 * takePendingPath() the pull side. An empty string from takePendingPath()
 * means nothing is pending.
 */
class ShellBridge : public QObject {
    Q_OBJECT

public:
    explicit ShellBridge(LaunchRelay *relay, QObject *parent = nullptr);

    Q_INVOKABLE QString greet(const QString &name) const;
    Q_INVOKABLE void clearCacheAndReload();
    Q_INVOKABLE QString takePendingPath();

    /// Page script that clears local, session and IndexedDB storage of the
    /// current origin and then reloads.
    static QString clearStorageScript();

signals:
    void openFileRequested(const QString &path);
    void clearCacheRequested();

private:
    LaunchRelay *relay;
};

#endif // SHELLBRIDGE_H
