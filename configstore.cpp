#include "configstore.h"
#include "debuglog.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QStandardPaths>

namespace {
int positiveOr(const QJsonObject &obj, const char *key, int fallback) {
    const int value = obj.value(QLatin1String(key)).toInt(fallback);
    return value > 0 ? value : fallback;
}

LaunchSettings launchFromJson(const QJsonObject &obj, const LaunchSettings &defaults) {
    LaunchSettings launch;
    launch.openRequestDelayMs = positiveOr(obj, "openRequestDelayMs", defaults.openRequestDelayMs);
    launch.forwardTimeoutMs = positiveOr(obj, "forwardTimeoutMs", defaults.forwardTimeoutMs);
    return launch;
}

WindowSettings windowFromJson(const QJsonObject &obj, const WindowSettings &defaults) {
    WindowSettings window;
    window.title = obj.value("title").toString();
    if (window.title.isEmpty())
        window.title = defaults.title;
    window.width = positiveOr(obj, "width", defaults.width);
    window.height = positiveOr(obj, "height", defaults.height);
    return window;
}
} // namespace

QString ConfigStore::configFilePath() {
    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
                              + QDir::separator()
                              + QCoreApplication::applicationName();
    QDir().mkpath(configDir);
    return configDir + QDir::separator() + "config.json";
}

AppConfig ConfigStore::defaultConfig() {
    AppConfig config;
    config.launch.openRequestDelayMs = 1500;
    config.launch.forwardTimeoutMs = 1000;
    config.window.title = "MarkItDown";
    config.window.width = 1000;
    config.window.height = 720;
    config.frontend.url = "";
    return config;
}

AppConfig ConfigStore::fromJson(const QJsonDocument &doc, bool *ok) {
    if (ok)
        *ok = false;

    const AppConfig defaults = defaultConfig();
    if (doc.isNull() || !doc.isObject())
        return defaults;

    const QJsonObject root = doc.object();

    AppConfig config;
    config.launch = launchFromJson(root.value("launch").toObject(), defaults.launch);
    config.window = windowFromJson(root.value("window").toObject(), defaults.window);
    config.frontend.url = root.value("frontend").toObject().value("url").toString();

    if (ok)
        *ok = true;
    return config;
}

QJsonDocument ConfigStore::toJson(const AppConfig &config) {
    QJsonObject launch{
        {"openRequestDelayMs", config.launch.openRequestDelayMs},
        {"forwardTimeoutMs", config.launch.forwardTimeoutMs}
    };

    QJsonObject window{
        {"title", config.window.title},
        {"width", config.window.width},
        {"height", config.window.height}
    };

    QJsonObject frontend{
        {"url", config.frontend.url}
    };

    QJsonObject root{
        {"launch", launch},
        {"window", window},
        {"frontend", frontend}
    };

    return QJsonDocument(root);
}

AppConfig ConfigStore::load(const QString &path, bool *ok) {
    if (ok)
        *ok = false;

    QFile file(path);
    if (!file.exists()) {
        const AppConfig config = defaultConfig();
        if (!save(config, path))
            qCWarning(lcConfig) << "cannot write default config to" << path;
        if (ok)
            *ok = true;
        return config;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcConfig) << "cannot read" << path << file.errorString();
        return defaultConfig();
    }
    const QByteArray data = file.readAll();
    file.close();

    bool parsed = false;
    const AppConfig config = fromJson(QJsonDocument::fromJson(data), &parsed);
    if (!parsed) {
        qCWarning(lcConfig) << "malformed config" << path << "- using defaults";
        return config;
    }

    if (ok)
        *ok = true;
    return config;
}

bool ConfigStore::save(const AppConfig &config, const QString &path) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    const QByteArray data = toJson(config).toJson();
    const bool written = file.write(data) == data.size();
    file.close();
    return written;
}

QUrl ConfigStore::frontendUrl(const AppConfig &config) {
    const QString fromEnv = qEnvironmentVariable("MARKITDOWN_FRONTEND_URL");
    if (!fromEnv.isEmpty())
        return QUrl::fromUserInput(fromEnv);

    if (!config.frontend.url.isEmpty())
        return QUrl::fromUserInput(config.frontend.url);

    return QUrl::fromLocalFile(QCoreApplication::applicationDirPath()
                               + QDir::separator() + "frontend"
                               + QDir::separator() + "index.html");
}
