#include "launchrelay.h"
#include "debuglog.h"

#include <QFileInfo>
#include <QMutexLocker>
#include <QTimer>

LaunchRelay::LaunchRelay(QObject *parent)
    : QObject(parent)
      , openRequestDelayMs(DefaultOpenRequestDelayMs) {
}

void LaunchRelay::setOpenRequestDelay(int ms) {
    openRequestDelayMs = ms > 0 ? ms : DefaultOpenRequestDelayMs;
}

std::optional<QString> LaunchRelay::launchPathFromArguments(const QStringList &args) {
    if (args.size() < 2)
        return std::nullopt;

    const QString candidate = args.at(1);
    if (candidate.isEmpty() || !QFileInfo::exists(candidate))
        return std::nullopt;
    return candidate;
}

void LaunchRelay::captureStartupPath(const QStringList &args) {
    const std::optional<QString> path = launchPathFromArguments(args);
    if (!path)
        return;

    qCInfo(lcRelay) << "startup path:" << *path;
    storePendingPath(*path);
    scheduleOpenRequest(*path);
}

std::optional<QString> LaunchRelay::takePendingPath() {
    QMutexLocker locker(&mutex);
    std::optional<QString> path;
    path.swap(pendingPath);
    return path;
}

bool LaunchRelay::hasPendingPath() const {
    QMutexLocker locker(&mutex);
    return pendingPath.has_value();
}

void LaunchRelay::handleSecondLaunch(const QStringList &args, const QString &workingDirectory) {
    Q_UNUSED(workingDirectory);

    qCDebug(lcRelay) << "second launch:" << args;
    if (const std::optional<QString> path = launchPathFromArguments(args)) {
        storePendingPath(*path);
        emit openFileRequested(*path);
    }
    emit activationRequested();
}

void LaunchRelay::storePendingPath(const QString &path) {
    QMutexLocker locker(&mutex);
    pendingPath = path;
}

void LaunchRelay::scheduleOpenRequest(const QString &path) {
    // Not cancellable. The timer belongs to this object, so the request is
    // dropped if the relay or the event loop goes away before it fires.
    QTimer::singleShot(openRequestDelayMs, this, [this, path]() {
        qCDebug(lcRelay) << "deferred open request:" << path;
        emit openFileRequested(path);
    });
}
