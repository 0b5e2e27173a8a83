#include "doctest/doctest.h"
#include "debuglog.h"

#include <QFile>
#include <QTemporaryDir>

DOCTEST_TEST_CASE("log file that cannot be opened is reported") {
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    DOCTEST_CHECK_FALSE(DebugLog::install(dir.filePath("missing/dir/markitdown.log")));
}

DOCTEST_TEST_CASE("installed log file receives category messages") {
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString path = dir.filePath("markitdown.log");

    DOCTEST_REQUIRE(DebugLog::install(path));
    qCWarning(lcConfig) << "log file check";

    QFile file(path);
    DOCTEST_REQUIRE(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    DOCTEST_CHECK(contents.contains("[warning] markitdown.config:"));
    DOCTEST_CHECK(contents.contains("log file check"));
}
