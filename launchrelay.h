#ifndef LAUNCHRELAY_H
#define LAUNCHRELAY_H

#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Hands a file path given on the command line to the frontend.
 *
 * A path captured at startup is kept until the frontend pulls it with
 * takePendingPath(), and is also pushed through openFileRequested() once
 * the open request delay has elapsed. Both may reach the frontend, so
 * the frontend has to ignore a repeated path.
 */
class LaunchRelay : public QObject {
    Q_OBJECT

public:
    static constexpr int DefaultOpenRequestDelayMs = 1500;

    explicit LaunchRelay(QObject *parent = nullptr);

    void setOpenRequestDelay(int ms);
    int openRequestDelay() const { return openRequestDelayMs; }

    /// args[1] if it names an existing file or directory.
    static std::optional<QString> launchPathFromArguments(const QStringList &args);

    void captureStartupPath(const QStringList &args);

    /// Returns the pending path and clears it.
    std::optional<QString> takePendingPath();
    bool hasPendingPath() const;

public slots:
    void handleSecondLaunch(const QStringList &args, const QString &workingDirectory);

signals:
    void openFileRequested(const QString &path);
    void activationRequested();

private:
    void storePendingPath(const QString &path);
    void scheduleOpenRequest(const QString &path);

    mutable QMutex mutex;
    std::optional<QString> pendingPath;
    int openRequestDelayMs;
};

#endif // LAUNCHRELAY_H
