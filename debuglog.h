#ifndef DEBUGLOG_H
#define DEBUGLOG_H

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcRelay)
Q_DECLARE_LOGGING_CATEGORY(lcInstance)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcShell)

namespace DebugLog {

/**
 * @brief Appends every Qt log message to @p path, in addition to the
 *        usual stderr output.
 * @return false if the file cannot be opened for appending.
 */
bool install(const QString &path);

} // namespace DebugLog

#endif // DEBUGLOG_H
