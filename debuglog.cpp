#include "debuglog.h"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

Q_LOGGING_CATEGORY(lcRelay, "markitdown.relay")
Q_LOGGING_CATEGORY(lcInstance, "markitdown.instance")
Q_LOGGING_CATEGORY(lcConfig, "markitdown.config")
Q_LOGGING_CATEGORY(lcShell, "markitdown.shell")

namespace {
QMutex logMutex;
QFile *logFile = nullptr; // kept open until exit
QtMessageHandler previousHandler = nullptr;

const char *typeName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "debug";
        case QtInfoMsg: return "info";
        case QtWarningMsg: return "warning";
        case QtCriticalMsg: return "critical";
        case QtFatalMsg: return "fatal";
    }
    return "unknown";
}

void writeMessage(QtMsgType type, const QMessageLogContext &context, const QString &message) {
    {
        QMutexLocker locker(&logMutex);
        if (logFile) {
            const QString line = QStringLiteral("%1 [%2] %3: %4\n")
                                     .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                                          QString::fromLatin1(typeName(type)),
                                          QString::fromLatin1(context.category ? context.category : "default"),
                                          message);
            logFile->write(line.toUtf8());
            logFile->flush();
        }
    }

    if (previousHandler) {
        previousHandler(type, context, message);
    } else {
        std::fprintf(stderr, "%s\n", qPrintable(qFormatLogMessage(type, context, message)));
    }
}
} // namespace

bool DebugLog::install(const QString &path) {
    auto *file = new QFile(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "cannot open log file %s\n", qPrintable(path));
        delete file;
        return false;
    }

    QMutexLocker locker(&logMutex);
    const bool firstInstall = logFile == nullptr;
    delete logFile;
    logFile = file;
    if (firstInstall)
        previousHandler = qInstallMessageHandler(writeMessage);
    return true;
}
