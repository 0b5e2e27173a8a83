#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include <QCoreApplication>
#include <QStandardPaths>

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("MarkItDownTests");
    QStandardPaths::setTestModeEnabled(true);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
