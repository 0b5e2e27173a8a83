#include "instancechannel.h"
#include "debuglog.h"

#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QLockFile>
#include <QStandardPaths>

namespace {
QString userName() {
    QString name = qEnvironmentVariable("USER");
    if (name.isEmpty())
        name = qEnvironmentVariable("USERNAME");
    return name;
}
} // namespace

InstanceChannel::InstanceChannel(const QString &key, QObject *parent)
    : InstanceChannel(key, userName(), parent) {
}

InstanceChannel::InstanceChannel(const QString &key, const QString &user, QObject *parent)
    : QObject(parent)
      , key(key)
      , user(user)
      , server(new QLocalServer(this))
      , primary(false) {
    connect(server, &QLocalServer::newConnection, this, &InstanceChannel::onNewConnection);
}

InstanceChannel::~InstanceChannel() {
    server->close();
}

QString InstanceChannel::serverName() const {
    return user.isEmpty() ? key : key + "-" + user;
}

QString InstanceChannel::lockFilePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation)
           + QDir::separator() + serverName() + ".lock";
}

bool InstanceChannel::tryBecomePrimary() {
    if (primary)
        return true;

    QDir().mkpath(QStandardPaths::writableLocation(QStandardPaths::TempLocation));
    auto lock = std::make_unique<QLockFile>(lockFilePath());
    lock->setStaleLockTime(0);
    if (!lock->tryLock()) {
        qCInfo(lcInstance) << "another instance holds" << lockFilePath();
        return false;
    }
    lockFile = std::move(lock);
    primary = true;

    // A crashed primary can leave its socket file behind.
    QLocalServer::removeServer(serverName());
    if (!server->listen(serverName())) {
        qCWarning(lcInstance) << "cannot listen on" << serverName() << server->errorString()
                              << "- second launches will not be forwarded";
    }
    return true;
}

bool InstanceChannel::forwardToPrimary(const QStringList &args, const QString &workingDirectory,
                                       int timeoutMs) const {
    QLocalSocket socket;
    socket.connectToServer(serverName());
    if (!socket.waitForConnected(timeoutMs)) {
        qCWarning(lcInstance) << "cannot reach primary instance:" << socket.errorString();
        return false;
    }

    socket.write(encodeMessage(args, workingDirectory));
    if (!socket.waitForBytesWritten(timeoutMs)) {
        qCWarning(lcInstance) << "cannot send launch arguments:" << socket.errorString();
        return false;
    }

    socket.disconnectFromServer();
    if (socket.state() != QLocalSocket::UnconnectedState)
        socket.waitForDisconnected(timeoutMs);
    return true;
}

QByteArray InstanceChannel::encodeMessage(const QStringList &args, const QString &workingDirectory) {
    QJsonObject message{
        {"args", QJsonArray::fromStringList(args)},
        {"cwd", workingDirectory}
    };
    return QJsonDocument(message).toJson(QJsonDocument::Compact) + '\n';
}

bool InstanceChannel::decodeMessage(const QByteArray &line, QStringList *args, QString *workingDirectory) {
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed());
    if (doc.isNull() || !doc.isObject())
        return false;

    const QJsonObject root = doc.object();
    const QJsonValue argsValue = root.value("args");
    if (!argsValue.isArray())
        return false;

    QStringList decoded;
    for (const QJsonValue &value : argsValue.toArray()) {
        if (value.isString())
            decoded.append(value.toString());
    }

    if (args)
        *args = decoded;
    if (workingDirectory)
        *workingDirectory = root.value("cwd").toString();
    return true;
}

void InstanceChannel::onNewConnection() {
    while (QLocalSocket *socket = server->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() {
            readMessages(socket);
        });
        connect(socket, &QLocalSocket::disconnected, socket, &QObject::deleteLater);
        // Data may already be buffered when the sender disconnected quickly.
        if (socket->bytesAvailable() > 0)
            readMessages(socket);
    }
}

void InstanceChannel::readMessages(QLocalSocket *socket) {
    while (socket->canReadLine()) {
        const QByteArray line = socket->readLine();
        QStringList args;
        QString workingDirectory;
        if (!decodeMessage(line, &args, &workingDirectory)) {
            qCWarning(lcInstance) << "dropping malformed launch message";
            continue;
        }
        qCDebug(lcInstance) << "launch forwarded from" << workingDirectory << args;
        emit secondLaunch(args, workingDirectory);
    }
}
