#ifndef INSTANCECHANNEL_H
#define INSTANCECHANNEL_H

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

class QLocalServer;
class QLocalSocket;
class QLockFile;

/**
 * @brief Keeps a single running instance per user.
 *
 * The first process to take the lock file becomes the primary and listens
 * on a local socket. Later processes send their arguments and working
 * directory over that socket and exit; the primary reports them through
 * secondLaunch(). Lock file and socket are both named key-user, so each
 * user gets their own primary.
 *
 * Wire format: one UTF-8 JSON object per line,
 * {"args": ["app", "..."], "cwd": "..."}.
 */
class InstanceChannel : public QObject {
    Q_OBJECT

public:
    explicit InstanceChannel(const QString &key, QObject *parent = nullptr);
    InstanceChannel(const QString &key, const QString &user, QObject *parent = nullptr);
    ~InstanceChannel() override;

    bool tryBecomePrimary();
    bool isPrimary() const { return primary; }

    bool forwardToPrimary(const QStringList &args, const QString &workingDirectory, int timeoutMs) const;

    QString serverName() const;
    QString lockFilePath() const;

    static QByteArray encodeMessage(const QStringList &args, const QString &workingDirectory);
    static bool decodeMessage(const QByteArray &line, QStringList *args, QString *workingDirectory);

signals:
    void secondLaunch(const QStringList &args, const QString &workingDirectory);

private slots:
    void onNewConnection();

private:
    void readMessages(QLocalSocket *socket);

    QString key;
    QString user;
    std::unique_ptr<QLockFile> lockFile;
    QLocalServer *server;
    bool primary;
};

#endif // INSTANCECHANNEL_H
