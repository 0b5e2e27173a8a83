#include "doctest/doctest.h"
#include "launchwiring.h"
#include "test_support.h"

#include <QElapsedTimer>
#include <QRandomGenerator>
#include <QTemporaryFile>

namespace {
struct WindowStandIn : QObject {
    int raised = 0;
    void bringToFront() { ++raised; }
};

QString uniqueKey() {
    return QStringLiteral("MarkItDownWiring-%1-%2")
        .arg(QCoreApplication::applicationPid())
        .arg(QRandomGenerator::global()->generate());
}
} // namespace

DOCTEST_TEST_CASE("forwarded launch raises the window and opens the file without delay") {
    QTemporaryFile file;
    DOCTEST_REQUIRE(file.open());

    const QString key = uniqueKey();
    InstanceChannel primary(key);
    DOCTEST_REQUIRE(primary.tryBecomePrimary());

    LaunchRelay relay;
    relay.setOpenRequestDelay(10000);
    WindowStandIn window;
    connectLaunchRelay(&primary, &relay, &window);

    QStringList opened;
    QObject::connect(&relay, &LaunchRelay::openFileRequested, &relay,
                     [&opened](const QString &path) { opened.append(path); });

    QElapsedTimer elapsed;
    elapsed.start();
    InstanceChannel secondary(key);
    DOCTEST_REQUIRE(secondary.forwardToPrimary({"app", file.fileName()}, "/work", 2000));

    DOCTEST_REQUIRE(waitUntil([&]() { return window.raised > 0 && !opened.isEmpty(); }, 3000));
    DOCTEST_CHECK(elapsed.elapsed() < relay.openRequestDelay());
    DOCTEST_CHECK_EQ(window.raised, 1);
    DOCTEST_REQUIRE_EQ(opened.size(), 1);
    DOCTEST_CHECK(opened.first() == file.fileName());
    DOCTEST_CHECK(relay.takePendingPath() == std::optional<QString>(file.fileName()));
}

DOCTEST_TEST_CASE("forwarded launch without a file still raises the window") {
    const QString key = uniqueKey();
    InstanceChannel primary(key);
    DOCTEST_REQUIRE(primary.tryBecomePrimary());

    LaunchRelay relay;
    WindowStandIn window;
    connectLaunchRelay(&primary, &relay, &window);

    InstanceChannel secondary(key);
    DOCTEST_REQUIRE(secondary.forwardToPrimary({"app"}, QString(), 2000));

    DOCTEST_REQUIRE(waitUntil([&]() { return window.raised > 0; }, 3000));
    DOCTEST_CHECK_FALSE(relay.hasPendingPath());
}
