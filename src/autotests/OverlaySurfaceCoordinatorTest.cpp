/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "OverlaySurfaceCoordinatorTest.h"

// Qt
#include <QJsonObject>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Workdeck
#include "../workspace/OverlaySurfaceCoordinator.h"
#include "FakeHostBridge.h"

using namespace Workdeck;

static const QString Create = QString::fromLatin1(HostProtocol::SurfaceCreate);
static const QString Navigate = QString::fromLatin1(HostProtocol::SurfaceNavigate);
static const QString Show = QString::fromLatin1(HostProtocol::SurfaceShow);
static const QString Hide = QString::fromLatin1(HostProtocol::SurfaceHide);
static const QString Bounds = QString::fromLatin1(HostProtocol::SurfaceUpdateBounds);
static const QString Close = QString::fromLatin1(HostProtocol::SurfaceClose);
static const QString Back = QString::fromLatin1(HostProtocol::SurfaceGoBack);
static const QString Forward = QString::fromLatin1(HostProtocol::SurfaceGoForward);
static const QString Reload = QString::fromLatin1(HostProtocol::SurfaceReload);

void OverlaySurfaceCoordinatorTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void OverlaySurfaceCoordinatorTest::testFormatAddress_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("https kept") << QStringLiteral("  https://kde.org/  ") << QStringLiteral("https://kde.org/");
    QTest::newRow("http kept") << QStringLiteral("http://intranet.local") << QStringLiteral("http://intranet.local");
    QTest::newRow("upper scheme") << QStringLiteral("HTTPS://KDE.ORG") << QStringLiteral("HTTPS://KDE.ORG");
    QTest::newRow("bare host") << QStringLiteral("kde.org") << QStringLiteral("https://kde.org");
    QTest::newRow("localhost") << QStringLiteral("localhost:3000") << QStringLiteral("https://localhost:3000");
    QTest::newRow("search") << QStringLiteral("pod crashloop") << QStringLiteral("https://www.google.com/search?q=pod%20crashloop");
    QTest::newRow("search escaping") << QStringLiteral("a&b") << QStringLiteral("https://www.google.com/search?q=a%26b");
    QTest::newRow("empty") << QStringLiteral("   ") << QString();
}

void OverlaySurfaceCoordinatorTest::testFormatAddress()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);

    QCOMPARE(OverlaySurfaceCoordinator::formatAddress(input), expected);
}

void OverlaySurfaceCoordinatorTest::testFirstNavigateCreates()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    QSignalSpy createdSpy(&coordinator, &OverlaySurfaceCoordinator::surfaceCreated);

    QVERIFY(!coordinator.isSurfaceCreated());
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Uninitialized);

    coordinator.setActive(true);
    coordinator.setPlaceholderGeometry(QRectF(0, 40, 640, 480), QPointF(100, 50), 1.0);
    QCOMPARE(host.calls().size(), 0);

    coordinator.navigate(QStringLiteral("kde.org"));

    QVERIFY(coordinator.isSurfaceCreated());
    QCOMPARE(createdSpy.count(), 1);
    QCOMPARE(host.callCount(Create), 1);
    QCOMPARE(host.callCount(Navigate), 0);
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Visible);

    const QJsonObject params = host.callsTo(Create).first().params;
    QCOMPARE(params.value(QStringLiteral("sessionId")).toString(), QStringLiteral("b1"));
    QCOMPARE(params.value(QStringLiteral("url")).toString(), QStringLiteral("https://kde.org"));
    QCOMPARE(params.value(QStringLiteral("x")).toDouble(), 100.0);
    QCOMPARE(params.value(QStringLiteral("y")).toDouble(), 90.0);
    QCOMPARE(params.value(QStringLiteral("width")).toDouble(), 640.0);
    QCOMPARE(params.value(QStringLiteral("height")).toDouble(), 480.0);

    // The create call carried the bounds already
    QCOMPARE(host.callCount(Bounds), 0);
    QCOMPARE(coordinator.history().index(), 0);
}

void OverlaySurfaceCoordinatorTest::testLaterNavigateUsesNavigate()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);

    coordinator.navigate(QStringLiteral("https://a.example/"));
    coordinator.navigate(QStringLiteral("https://b.example/"));

    QCOMPARE(host.callCount(Create), 1);
    QCOMPARE(host.callCount(Navigate), 1);
    QCOMPARE(host.callsTo(Navigate).first().params.value(QStringLiteral("url")).toString(), QStringLiteral("https://b.example/"));
    QCOMPARE(coordinator.currentUrl(), QStringLiteral("https://b.example/"));
    QVERIFY(coordinator.canGoBack());
}

void OverlaySurfaceCoordinatorTest::testNavigationQueuedWhileCreating()
{
    FakeHostBridge host;
    host.setDeferred(Create, true);
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);

    coordinator.navigate(QStringLiteral("https://a.example/"));
    coordinator.navigate(QStringLiteral("https://b.example/"));
    coordinator.navigate(QStringLiteral("https://c.example/"));
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Creating);
    QCOMPARE(host.callCount(Create), 1);
    QCOMPARE(host.callCount(Navigate), 0);

    QVERIFY(host.completeNext(Create, HostReply::success()));

    QCOMPARE(host.callCount(Create), 1);
    QCOMPARE(host.callCount(Navigate), 1);
    QCOMPARE(host.callsTo(Navigate).first().params.value(QStringLiteral("url")).toString(), QStringLiteral("https://c.example/"));
}

void OverlaySurfaceCoordinatorTest::testFailedCreateRetries()
{
    FakeHostBridge host;
    host.setReply(Create, HostReply::failure(QStringLiteral("webview unavailable")));
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    QSignalSpy errorSpy(&coordinator, &OverlaySurfaceCoordinator::errorOccurred);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Failed to create surface")));
    coordinator.navigate(QStringLiteral("kde.org"));

    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Uninitialized);
    QVERIFY(!coordinator.isSurfaceCreated());
    QCOMPARE(coordinator.errorMessage(), QStringLiteral("webview unavailable"));
    QCOMPARE(errorSpy.count(), 1);

    host.clearReply(Create);
    coordinator.navigate(QStringLiteral("kde.org"));
    QCOMPARE(host.callCount(Create), 2);
    QVERIFY(coordinator.isSurfaceCreated());
    QVERIFY(coordinator.errorMessage().isEmpty());
}

void OverlaySurfaceCoordinatorTest::testFailedNavigateKeepsSurface()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);
    coordinator.navigate(QStringLiteral("a.example"));

    host.setReply(Navigate, HostReply::failure(QStringLiteral("net::ERR_NAME_NOT_RESOLVED")));
    QSignalSpy errorSpy(&coordinator, &OverlaySurfaceCoordinator::errorOccurred);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Navigation failed")));
    coordinator.navigate(QStringLiteral("nope.invalid"));

    QCOMPARE(errorSpy.count(), 1);
    QCOMPARE(coordinator.errorMessage(), QStringLiteral("net::ERR_NAME_NOT_RESOLVED"));
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Visible);
    QCOMPARE(host.callCount(Close), 0);

    host.clearReply(Navigate);
    coordinator.navigate(QStringLiteral("b.example"));
    QVERIFY(coordinator.errorMessage().isEmpty());
}

void OverlaySurfaceCoordinatorTest::testInactiveCreateHides()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));

    coordinator.navigate(QStringLiteral("kde.org"));
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Hidden);
    QCOMPARE(host.callCount(Hide), 1);
    QCOMPARE(host.callCount(Show), 0);
}

void OverlaySurfaceCoordinatorTest::testShowHideFollowsActive()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);
    coordinator.setPlaceholderGeometry(QRectF(0, 0, 800, 600), QPointF(0, 0), 1.0);
    coordinator.navigate(QStringLiteral("kde.org"));
    host.clearCalls();

    coordinator.setActive(false);
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Hidden);
    QCOMPARE(host.callCount(Hide), 1);

    coordinator.setActive(true);
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Visible);

    // show first, then the bounds
    const QList<FakeHostBridge::Call> calls = host.calls();
    QCOMPARE(calls.size(), 3);
    QCOMPARE(calls.at(1).method, Show);
    QCOMPARE(calls.at(2).method, Bounds);
}

void OverlaySurfaceCoordinatorTest::testBoundsComputation()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));

    // Window at physical (200, 100) on a 2x screen
    coordinator.setPlaceholderGeometry(QRectF(10, 20, 300, 200), QPointF(200, 100), 2.0);
    const SurfaceBounds bounds = coordinator.bounds();
    QCOMPARE(bounds.x, 110.0);
    QCOMPARE(bounds.y, 70.0);
    QCOMPARE(bounds.width, 300.0);
    QCOMPARE(bounds.height, 200.0);

    // A bogus scale is treated as 1
    coordinator.setPlaceholderGeometry(QRectF(10, 20, 300, 200), QPointF(200, 100), 0);
    QCOMPARE(coordinator.bounds().x, 210.0);
}

void OverlaySurfaceCoordinatorTest::testBoundsPushedOnlyWhenVisibleAndChanged()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);
    coordinator.setPlaceholderGeometry(QRectF(0, 0, 800, 600), QPointF(0, 0), 1.0);
    coordinator.navigate(QStringLiteral("kde.org"));
    host.clearCalls();

    coordinator.setPlaceholderGeometry(QRectF(0, 0, 800, 600), QPointF(0, 0), 1.0);
    QCOMPARE(host.callCount(Bounds), 0);

    coordinator.setPlaceholderGeometry(QRectF(0, 0, 900, 600), QPointF(0, 0), 1.0);
    QCOMPARE(host.callCount(Bounds), 1);
    QCOMPARE(host.callsTo(Bounds).first().params.value(QStringLiteral("width")).toDouble(), 900.0);

    coordinator.setActive(false);
    coordinator.setPlaceholderGeometry(QRectF(0, 0, 1000, 600), QPointF(0, 0), 1.0);
    QCOMPARE(host.callCount(Bounds), 1);
}

void OverlaySurfaceCoordinatorTest::testBackForward()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);

    QVERIFY(!coordinator.goBack());

    coordinator.navigate(QStringLiteral("https://a.example/"));
    coordinator.navigate(QStringLiteral("https://b.example/"));
    const int index = coordinator.history().index();
    const int size = coordinator.history().size();

    QVERIFY(coordinator.goBack());
    QCOMPARE(host.callCount(Back), 1);
    QCOMPARE(coordinator.currentUrl(), QStringLiteral("https://a.example/"));
    QVERIFY(coordinator.canGoForward());

    // The surface confirms the move; that must not become a new entry
    host.sendAddressChanged(QStringLiteral("b1"), QStringLiteral("https://a.example/"));
    QCOMPARE(coordinator.history().size(), size);

    QVERIFY(coordinator.goForward());
    QCOMPARE(host.callCount(Forward), 1);
    host.sendAddressChanged(QStringLiteral("b1"), QStringLiteral("https://b.example/"));

    QCOMPARE(coordinator.history().index(), index);
    QCOMPARE(coordinator.history().size(), size);
    QVERIFY(!coordinator.goForward());
}

void OverlaySurfaceCoordinatorTest::testAddressChangedRecorded()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);
    coordinator.navigate(QStringLiteral("https://a.example/"));

    QSignalSpy stateSpy(&coordinator, &OverlaySurfaceCoordinator::navigationStateChanged);

    // Someone else's surface
    host.sendAddressChanged(QStringLiteral("b2"), QStringLiteral("https://elsewhere.example/"));
    QCOMPARE(stateSpy.count(), 0);

    // In-page link followed by the user
    host.sendAddressChanged(QStringLiteral("b1"), QStringLiteral("https://a.example/docs"));
    QCOMPARE(stateSpy.count(), 1);
    QCOMPARE(coordinator.currentUrl(), QStringLiteral("https://a.example/docs"));
    QCOMPARE(coordinator.history().size(), 2);
    QVERIFY(coordinator.canGoBack());
}

void OverlaySurfaceCoordinatorTest::testLoadingState()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.navigate(QStringLiteral("kde.org"));

    host.sendLoadingChanged(QStringLiteral("b1"), true);
    QVERIFY(coordinator.isLoading());
    host.sendLoadingChanged(QStringLiteral("b2"), false);
    QVERIFY(coordinator.isLoading());
    host.sendLoadingChanged(QStringLiteral("b1"), false);
    QVERIFY(!coordinator.isLoading());
}

void OverlaySurfaceCoordinatorTest::testReloadAndFavorite()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));

    // Nothing to reload yet
    coordinator.reload();
    QCOMPARE(host.callCount(Reload), 0);

    coordinator.navigate(QStringLiteral("kde.org"));
    coordinator.reload();
    QCOMPARE(host.callCount(Reload), 1);

    QVERIFY(!coordinator.isFavorite());
    QVERIFY(coordinator.toggleFavorite());
    QVERIFY(coordinator.isFavorite());
    QVERIFY(!coordinator.toggleFavorite());
}

void OverlaySurfaceCoordinatorTest::testDisposeOnce()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    coordinator.setActive(true);
    coordinator.navigate(QStringLiteral("kde.org"));
    host.clearCalls();

    coordinator.dispose();
    coordinator.dispose();
    QCOMPARE(host.callCount(Close), 1);
    QCOMPARE(coordinator.state(), OverlaySurfaceCoordinator::State::Disposed);

    // Everything afterwards is ignored
    coordinator.navigate(QStringLiteral("b.example"));
    coordinator.setActive(false);
    coordinator.setPlaceholderGeometry(QRectF(0, 0, 10, 10), QPointF(), 1.0);
    coordinator.reload();
    QVERIFY(!coordinator.goBack());
    host.sendAddressChanged(QStringLiteral("b1"), QStringLiteral("https://late.example/"));

    QCOMPARE(host.calls().size(), 1);
    QCOMPARE(coordinator.currentUrl(), QStringLiteral("https://kde.org"));
}

void OverlaySurfaceCoordinatorTest::testDisposeBeforeCreate()
{
    FakeHostBridge host;
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));

    coordinator.dispose();
    coordinator.navigate(QStringLiteral("kde.org"));
    QCOMPARE(host.calls().size(), 0);
    QVERIFY(!coordinator.isSurfaceCreated());
}

void OverlaySurfaceCoordinatorTest::testDisposeWhileCreating()
{
    FakeHostBridge host;
    host.setDeferred(Create, true);
    OverlaySurfaceCoordinator coordinator(&host, QStringLiteral("b1"));
    QSignalSpy createdSpy(&coordinator, &OverlaySurfaceCoordinator::surfaceCreated);

    coordinator.navigate(QStringLiteral("kde.org"));
    coordinator.dispose();
    QCOMPARE(host.callCount(Close), 0);

    QVERIFY(host.completeNext(Create, HostReply::success()));
    QCOMPARE(host.callCount(Close), 1);
    QCOMPARE(createdSpy.count(), 0);

    coordinator.dispose();
    QCOMPARE(host.callCount(Close), 1);
}

void OverlaySurfaceCoordinatorTest::testDeleteWhileCreating()
{
    FakeHostBridge host;
    host.setDeferred(Create, true);
    auto *coordinator = new OverlaySurfaceCoordinator(&host, QStringLiteral("b1"));

    coordinator->navigate(QStringLiteral("kde.org"));
    delete coordinator;
    QCOMPARE(host.callCount(Close), 0);

    QVERIFY(host.completeNext(Create, HostReply::success()));
    QCOMPARE(host.callCount(Close), 1);
    QCOMPARE(host.callsTo(Close).constFirst().params.value(QStringLiteral("sessionId")).toString(), QStringLiteral("b1"));
}

void OverlaySurfaceCoordinatorTest::testDeleteWhileCreatingFailedCreate()
{
    FakeHostBridge host;
    host.setDeferred(Create, true);
    auto *coordinator = new OverlaySurfaceCoordinator(&host, QStringLiteral("b1"));

    coordinator->navigate(QStringLiteral("kde.org"));
    delete coordinator;

    QVERIFY(host.completeNext(Create, HostReply::failure(QStringLiteral("no window"))));
    QCOMPARE(host.callCount(Close), 0);
}

void OverlaySurfaceCoordinatorTest::testDeleteClosesVisibleSurface()
{
    FakeHostBridge host;
    auto *coordinator = new OverlaySurfaceCoordinator(&host, QStringLiteral("b1"));
    coordinator->setActive(true);
    coordinator->navigate(QStringLiteral("kde.org"));
    QVERIFY(coordinator->hasSurface());

    delete coordinator;
    QCOMPARE(host.callCount(Close), 1);
}

QTEST_GUILESS_MAIN(OverlaySurfaceCoordinatorTest)

#include "moc_OverlaySurfaceCoordinatorTest.cpp"
