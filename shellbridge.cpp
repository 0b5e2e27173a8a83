#include "shellbridge.h"
#include "launchrelay.h"
#include "debuglog.h"

ShellBridge::ShellBridge(LaunchRelay *relay, QObject *parent)
    : QObject(parent)
      , relay(relay) {
    connect(relay, &LaunchRelay::openFileRequested, this, &ShellBridge::openFileRequested);
}

QString ShellBridge::greet(const QString &name) const {
    return QStringLiteral("Hello, %1! You've been greeted from C++!").arg(name);
}

void ShellBridge::clearCacheAndReload() {
    qCDebug(lcShell) << "clear cache and reload";
    emit clearCacheRequested();
}

QString ShellBridge::takePendingPath() {
    return relay->takePendingPath().value_or(QString());
}

QString ShellBridge::clearStorageScript() {
    return QStringLiteral(
        "(function () {"
        "  try { localStorage.clear(); } catch (e) {}"
        "  try { sessionStorage.clear(); } catch (e) {}"
        "  var reload = function () { location.reload(); };"
        "  if (!window.indexedDB || !indexedDB.databases) { reload(); return; }"
        "  indexedDB.databases().then(function (dbs) {"
        "    return Promise.all(dbs.map(function (db) {"
        "      return new Promise(function (resolve) {"
        "        var req = indexedDB.deleteDatabase(db.name);"
        "        req.onsuccess = req.onerror = req.onblocked = resolve;"
        "      });"
        "    }));"
        "  }).then(reload, reload);"
        "})();");
}
