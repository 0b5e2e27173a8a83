#ifndef CONFIGSTORE_H
#define CONFIGSTORE_H

#include <QJsonDocument>
#include <QString>
#include <QUrl>

struct LaunchSettings {
    int openRequestDelayMs = 1500;
    int forwardTimeoutMs = 1000;
};

struct WindowSettings {
    QString title;
    int width = 1000;
    int height = 720;
};

struct FrontendSettings {
    QString url; ///< empty means the bundled frontend next to the executable
};

struct AppConfig {
    LaunchSettings launch;
    WindowSettings window;
    FrontendSettings frontend;
};

class ConfigStore {
public:
    static QString configFilePath();
    static AppConfig defaultConfig();
    static AppConfig fromJson(const QJsonDocument &doc, bool *ok = nullptr);
    static QJsonDocument toJson(const AppConfig &config);

    /**
     * @brief Reads the config at @p path. A missing file is created with the
     *        defaults; an unreadable or malformed one yields the defaults and
     *        sets @p ok to false.
     */
    static AppConfig load(const QString &path, bool *ok = nullptr);
    static bool save(const AppConfig &config, const QString &path);

    /// MARKITDOWN_FRONTEND_URL, then frontend.url, then frontend/index.html
    /// beside the executable.
    static QUrl frontendUrl(const AppConfig &config);
};

#endif // CONFIGSTORE_H
