/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "PtyBridgeTest.h"

// Qt
#include <QJsonObject>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

#include <memory>

// Workdeck
#include "../workspace/OutputPoller.h"
#include "../workspace/PtyBridge.h"
#include "../workspace/ScreenBuffer.h"
#include "FakeHostBridge.h"

using namespace Workdeck;

static const QString Create = QString::fromLatin1(HostProtocol::TerminalCreate);
static const QString Write = QString::fromLatin1(HostProtocol::TerminalWrite);
static const QString Read = QString::fromLatin1(HostProtocol::TerminalRead);
static const QString Resize = QString::fromLatin1(HostProtocol::TerminalResize);
static const QString Close = QString::fromLatin1(HostProtocol::TerminalClose);

static PtyBridge *startedBridge(FakeHostBridge *host, QObject *parent)
{
    auto *bridge = new PtyBridge(host, std::make_unique<TerminalScreenBuffer>(), 5, parent);
    bridge->start(TerminalSpec());
    return bridge;
}

void PtyBridgeTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void PtyBridgeTest::testStartSuccess()
{
    FakeHostBridge host;
    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);
    QSignalSpy startedSpy(&bridge, &PtyBridge::started);

    TerminalSpec spec;
    spec.columns = 120;
    spec.rows = 40;
    spec.initialCommand = QStringLiteral("kubectl get pods");
    spec.shellPath = QStringLiteral("/bin/bash");
    bridge.start(spec);

    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(startedSpy.at(0).at(0).toString(), QStringLiteral("term-1"));
    QCOMPARE(bridge.state(), PtyBridge::State::Running);
    QCOMPARE(bridge.sessionId(), QStringLiteral("term-1"));
    QCOMPARE(bridge.lastSentSize(), QSize(120, 40));
    QVERIFY(bridge.poller());
    QVERIFY(bridge.poller()->isActive());
    QVERIFY(OutputPoller::isPolling(QStringLiteral("term-1")));

    const QJsonObject params = host.callsTo(Create).first().params;
    QCOMPARE(params.value(QStringLiteral("cols")).toInt(), 120);
    QCOMPARE(params.value(QStringLiteral("rows")).toInt(), 40);
    QCOMPARE(params.value(QStringLiteral("initialCommand")).toString(), QStringLiteral("kubectl get pods"));
    QCOMPARE(params.value(QStringLiteral("shellPath")).toString(), QStringLiteral("/bin/bash"));

    bridge.shutdown();
    QVERIFY(!OutputPoller::isPolling(QStringLiteral("term-1")));
}

void PtyBridgeTest::testStartFailure()
{
    FakeHostBridge host;
    host.setReply(Create, HostReply::failure(QStringLiteral("no pty available")));

    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);
    QSignalSpy startedSpy(&bridge, &PtyBridge::started);
    QSignalSpy failedSpy(&bridge, &PtyBridge::creationFailed);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Failed to create terminal")));
    bridge.start(TerminalSpec());

    QCOMPARE(startedSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), QStringLiteral("no pty available"));
    QCOMPARE(bridge.state(), PtyBridge::State::Idle);
    QVERIFY(!bridge.poller());
}

void PtyBridgeTest::testStartWithoutId()
{
    FakeHostBridge host;
    host.setReply(Create, HostReply::success(QJsonObject()));

    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);
    QSignalSpy failedSpy(&bridge, &PtyBridge::creationFailed);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Failed to create terminal")));
    bridge.start(TerminalSpec());
    QCOMPARE(failedSpy.count(), 1);
}

void PtyBridgeTest::testStartFailsWhenAlreadyPolled()
{
    FakeHostBridge host;
    OutputPoller other(&host, QStringLiteral("term-1"), 10);
    QVERIFY(other.start());

    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);
    QSignalSpy startedSpy(&bridge, &PtyBridge::started);
    QSignalSpy failedSpy(&bridge, &PtyBridge::creationFailed);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("already being polled")));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Failed to start output polling")));
    bridge.start(TerminalSpec());

    QCOMPARE(startedSpy.count(), 0);
    QCOMPARE(failedSpy.count(), 1);
    QVERIFY(failedSpy.at(0).at(0).toString().contains(QStringLiteral("term-1")));
    QCOMPARE(bridge.state(), PtyBridge::State::Closed);
    QVERIFY(!bridge.poller());
    QVERIFY(!bridge.sendInput("x"));

    // The shell belongs to whoever polls it
    bridge.shutdown();
    QCOMPARE(host.callCount(Close), 0);
    QVERIFY(OutputPoller::isPolling(QStringLiteral("term-1")));
    other.cancel();
}

void PtyBridgeTest::testShutdownWhileStarting()
{
    FakeHostBridge host;
    host.setDeferred(Create, true);

    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);
    QSignalSpy startedSpy(&bridge, &PtyBridge::started);
    bridge.start(TerminalSpec());
    QCOMPARE(bridge.state(), PtyBridge::State::Starting);

    bridge.shutdown();
    QCOMPARE(host.callCount(Close), 0);

    // The shell the host spawned anyway is closed, and nobody hears about it
    QVERIFY(host.completeNextWithDefault(Create));
    QCOMPARE(startedSpy.count(), 0);
    QCOMPARE(host.callCount(Close), 1);
    QCOMPARE(host.callsTo(Close).first().params.value(QStringLiteral("sessionId")).toString(), QStringLiteral("term-1"));
}

void PtyBridgeTest::testInputForwardedImmediately()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);

    QVERIFY(bridge->sendInput("l"));
    QVERIFY(bridge->sendInput("s"));

    const QList<FakeHostBridge::Call> writes = host.callsTo(Write);
    QCOMPARE(writes.size(), 2);
    QCOMPARE(HostProtocol::decodeBytes(writes.at(0).params.value(QStringLiteral("data"))), QByteArray("l"));
    QCOMPARE(HostProtocol::decodeBytes(writes.at(1).params.value(QStringLiteral("data"))), QByteArray("s"));
    QCOMPARE(writes.at(1).params.value(QStringLiteral("sessionId")).toString(), QStringLiteral("term-1"));

    delete bridge;
}

void PtyBridgeTest::testInputBeforeStart()
{
    FakeHostBridge host;
    PtyBridge bridge(&host, std::make_unique<TerminalScreenBuffer>(), 5);

    QVERIFY(!bridge.sendInput("x"));
    QCOMPARE(host.callCount(Write), 0);
}

void PtyBridgeTest::testCommandAccumulator()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    QSignalSpy commandSpy(bridge, &PtyBridge::commandSubmitted);

    const QList<QByteArray> keys = {"l", "s", " ", "-", "a", "\x7f", "l"};
    for (const QByteArray &key : keys) {
        bridge->sendInput(key);
    }
    QCOMPARE(bridge->currentLine(), QStringLiteral("ls -l"));

    bridge->sendInput("\r");
    QCOMPARE(commandSpy.count(), 1);
    QCOMPARE(commandSpy.at(0).at(0).toString(), QStringLiteral("ls -l"));
    QVERIFY(bridge->currentLine().isEmpty());

    bridge->sendInput("p");
    bridge->sendInput("\n");
    QCOMPARE(commandSpy.count(), 2);
    QCOMPARE(commandSpy.at(1).at(0).toString(), QStringLiteral("p"));

    delete bridge;
}

void PtyBridgeTest::testWhitespaceCommandNotSubmitted()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    QSignalSpy commandSpy(bridge, &PtyBridge::commandSubmitted);

    bridge->sendInput(" ");
    bridge->sendInput(" ");
    bridge->sendInput("\r");
    QCOMPARE(commandSpy.count(), 0);

    // Backspace on an empty line is harmless
    bridge->sendInput("\x7f");
    QVERIFY(bridge->currentLine().isEmpty());

    delete bridge;
}

void PtyBridgeTest::testPasteNotTracked()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);

    bridge->sendInput("e");
    bridge->sendInput("cho hello");
    bridge->sendInput("\x1b[A");
    QCOMPARE(bridge->currentLine(), QStringLiteral("e"));
    QCOMPARE(host.callCount(Write), 3);

    delete bridge;
}

void PtyBridgeTest::testClearCurrentLine()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    QSignalSpy commandSpy(bridge, &PtyBridge::commandSubmitted);

    bridge->sendInput("x");
    bridge->clearCurrentLine();
    bridge->sendInput("\r");
    QCOMPARE(commandSpy.count(), 0);

    delete bridge;
}

void PtyBridgeTest::testOutputPolledIntoBuffer()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    QSignalSpy outputSpy(bridge, &PtyBridge::outputReceived);

    host.queueOutput(QStringLiteral("term-1"), "hello\r\nworld\r\n");

    QTRY_COMPARE(outputSpy.count(), 1);
    QCOMPARE(bridge->exportLines(), (QStringList{QStringLiteral("hello"), QStringLiteral("world")}));

    // Empty reads don't signal
    QTest::qWait(50);
    QCOMPARE(outputSpy.count(), 1);
    QVERIFY(host.callCount(Read) > 1);

    delete bridge;
}

void PtyBridgeTest::testTerminalReportsWrittenBack()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);

    // Cursor position request after moving to row 2, column 4
    host.queueOutput(QStringLiteral("term-1"), "ab\r\nabc\x1b[6n");

    QTRY_COMPARE(host.callCount(Write), 1);
    const QJsonObject params = host.callsTo(Write).first().params;
    QCOMPARE(params.value(QStringLiteral("sessionId")).toString(), QStringLiteral("term-1"));
    QCOMPARE(HostProtocol::decodeBytes(params.value(QStringLiteral("data"))), QByteArray("\x1b[2;4R"));

    // Reports are not user input
    QVERIFY(bridge->currentLine().isEmpty());

    delete bridge;
}

void PtyBridgeTest::testOnlyOneReadInFlight()
{
    FakeHostBridge host;
    host.setDeferred(Read, true);
    PtyBridge *bridge = startedBridge(&host, this);

    QTRY_COMPARE(host.callCount(Read), 1);
    QTest::qWait(50);
    QCOMPARE(host.callCount(Read), 1);
    QVERIFY(bridge->poller()->isReadInFlight());

    QVERIFY(host.completeNext(Read, HostReply::success(HostProtocol::encodeBytes("ok\r\n"))));
    QVERIFY(!bridge->poller()->isReadInFlight());
    QTRY_COMPARE(host.callCount(Read), 2);
    QCOMPARE(bridge->exportLines(), QStringList{QStringLiteral("ok")});

    delete bridge;
}

void PtyBridgeTest::testFailedReadRetried()
{
    FakeHostBridge host;
    host.setReply(Read, HostReply::failure(QStringLiteral("transient")));
    PtyBridge *bridge = startedBridge(&host, this);

    QTRY_VERIFY(host.callCount(Read) >= 3);
    QVERIFY(bridge->poller()->isActive());

    host.clearReply(Read);
    host.queueOutput(QStringLiteral("term-1"), "recovered\r\n");
    QTRY_COMPARE(bridge->exportLines(), QStringList{QStringLiteral("recovered")});

    delete bridge;
}

void PtyBridgeTest::testLateReplyDroppedAfterShutdown()
{
    FakeHostBridge host;
    host.setDeferred(Read, true);
    PtyBridge *bridge = startedBridge(&host, this);
    QSignalSpy outputSpy(bridge, &PtyBridge::outputReceived);

    QTRY_COMPARE(host.deferredCount(Read), 1);
    bridge->shutdown();

    QVERIFY(host.completeNext(Read, HostReply::success(HostProtocol::encodeBytes("late\r\n"))));
    QCOMPARE(outputSpy.count(), 0);
    QVERIFY(bridge->exportLines().isEmpty());

    delete bridge;
}

void PtyBridgeTest::testOnePollerPerSession()
{
    FakeHostBridge host;
    OutputPoller first(&host, QStringLiteral("shared"), 10);
    OutputPoller second(&host, QStringLiteral("shared"), 10);

    QVERIFY(first.start());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("already being polled")));
    QVERIFY(!second.start());
    QVERIFY(!second.isActive());

    first.cancel();
    QVERIFY(!OutputPoller::isPolling(QStringLiteral("shared")));
    QVERIFY(second.start());
    QVERIFY(OutputPoller::isPolling(QStringLiteral("shared")));
    second.cancel();
}

void PtyBridgeTest::testPollerCancelIdempotent()
{
    FakeHostBridge host;
    OutputPoller poller(&host, QStringLiteral("idem"), 10);
    QVERIFY(poller.start());

    poller.cancel();
    poller.cancel();
    QVERIFY(!poller.isActive());
    QVERIFY(!OutputPoller::isPolling(QStringLiteral("idem")));

    // A cancelled poller stays cancelled
    QVERIFY(!poller.start());

    const int reads = host.callCount(Read);
    QTest::qWait(40);
    QCOMPARE(host.callCount(Read), reads);
}

void PtyBridgeTest::testRepeatedResizeSentOnce()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);

    for (int i = 0; i < 5; ++i) {
        bridge->resize(100, 30);
    }
    QCOMPARE(host.callCount(Resize), 1);
    const QJsonObject params = host.callsTo(Resize).first().params;
    QCOMPARE(params.value(QStringLiteral("cols")).toInt(), 100);
    QCOMPARE(params.value(QStringLiteral("rows")).toInt(), 30);

    // Returning to the creation size is a change
    bridge->resize(80, 24);
    bridge->resize(80, 24);
    QCOMPARE(host.callCount(Resize), 2);

    delete bridge;
}

void PtyBridgeTest::testViewportResizeOnlyWhenActive()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    auto *buffer = static_cast<TerminalScreenBuffer *>(bridge->screenBuffer());

    bridge->viewportResized(QSize(800, 480));
    QCOMPARE(host.callCount(Resize), 0);
    QVERIFY(!buffer->isFocused());

    bridge->setActive(true);
    QVERIFY(buffer->isFocused());
    QCOMPARE(host.callCount(Resize), 1);
    QCOMPARE(bridge->lastSentSize(), QSize(100, 30));

    bridge->viewportResized(QSize(800, 480));
    QCOMPARE(host.callCount(Resize), 1);

    bridge->viewportResized(QSize(400, 480));
    QCOMPARE(host.callCount(Resize), 2);
    QCOMPARE(bridge->lastSentSize(), QSize(50, 30));

    bridge->setActive(false);
    QVERIFY(!buffer->isFocused());
    bridge->viewportResized(QSize(1600, 960));
    QCOMPARE(host.callCount(Resize), 2);

    delete bridge;
}

void PtyBridgeTest::testShutdownClosesOnce()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);

    bridge->shutdown();
    bridge->shutdown();
    QCOMPARE(host.callCount(Close), 1);
    QCOMPARE(bridge->state(), PtyBridge::State::Closed);
    QVERIFY(!bridge->poller()->isActive());
    QVERIFY(!bridge->sendInput("x"));

    bridge->detach();
    QCOMPARE(host.callCount(Close), 1);

    delete bridge;
}

void PtyBridgeTest::testDetachSendsNothing()
{
    FakeHostBridge host;
    PtyBridge *bridge = startedBridge(&host, this);
    host.clearCalls();

    bridge->detach();
    bridge->shutdown();
    QCOMPARE(host.callCount(Close), 0);
    QVERIFY(!OutputPoller::isPolling(bridge->sessionId()));

    delete bridge;
}

QTEST_GUILESS_MAIN(PtyBridgeTest)

#include "moc_PtyBridgeTest.cpp"
