#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <QtTest>
#include <memory>

#include "FakeTransport.hpp"
#include "device/CameraService.hpp"
#include "server/TelemetryBroadcaster.hpp"
#include "server/WebSocketHub.hpp"

class FakeClient : public WebSocketClient {
	Q_OBJECT
public:
	explicit FakeClient(const QString& name, bool failing = false, QObject* parent = nullptr)
		: WebSocketClient(parent), name_(name), failing_(failing) {}

	bool sendText(const QString& payload) override
	{
		if (failing_) {
			// 실제 세션처럼 실패하면 스스로 끊는다
			emit disconnected();
			return false;
		}
		received.append(payload);
		return true;
	}
	void close() override { ++closes; emit disconnected(); }
	QString peerName() const override { return name_; }

	QStringList received;
	int closes = 0;

private:
	QString name_;
	bool failing_;
};

class TestWebSocketHub : public QObject {
	Q_OBJECT

private slots:
	void broadcastReachesEveryClientOnce()
	{
		WebSocketHub hub;
		FakeClient a("a"), b("b"), c("c");
		hub.add(&a);
		hub.add(&b);
		hub.add(&c);
		hub.add(&a);     // idempotent
		QCOMPARE(hub.clientCount(), 3);

		QCOMPARE(hub.broadcast("frame-1"), 3);
		for (FakeClient* fc : {&a, &b, &c})
			QCOMPARE(fc->received, QStringList{"frame-1"});
	}

	void failingClientDoesNotBlockOthers()
	{
		WebSocketHub hub;
		FakeClient good1("good1"), bad("bad", true), good2("good2");
		hub.add(&good1);
		hub.add(&bad);
		hub.add(&good2);

		QCOMPARE(hub.broadcast("x"), 2);
		QCOMPARE(good1.received.size(), 1);
		QCOMPARE(good2.received.size(), 1);
		// disconnected() removed it
		QCOMPARE(hub.clientCount(), 2);
	}

	void removeAndDestroy()
	{
		WebSocketHub hub;
		QSignalSpy counts(&hub, &WebSocketHub::clientCountChanged);
		auto* a = new FakeClient("a");
		FakeClient b("b");
		hub.add(a);
		hub.add(&b);
		hub.remove(&b);
		QCOMPARE(hub.clientCount(), 1);

		delete a;
		QCOMPARE(hub.broadcast("after"), 0);
		QVERIFY(b.received.isEmpty());
		QVERIFY(counts.count() >= 3);
	}

	void closeAllEmptiesHub()
	{
		WebSocketHub hub;
		FakeClient a("a"), b("b");
		hub.add(&a);
		hub.add(&b);
		hub.closeAll();
		QCOMPARE(a.closes, 1);
		QCOMPARE(b.closes, 1);
		QCOMPARE(hub.clientCount(), 0);
	}

	void telemetryTickSendsFrame()
	{
		auto t = std::make_unique<FakeTransport>();
		t->telemetry.fps = 30.0;
		t->telemetry.bitrate = 9000000;
		t->telemetry.tempC = 38.0;
		t->streaming = true;
		CameraService camera(std::move(t), QStringLiteral("cam"));
		WebSocketHub hub;
		TelemetryBroadcaster telemetry(camera, hub, 1000);
		QSignalSpy sent(&telemetry, &TelemetryBroadcaster::frameSent);

		// no clients: nothing is built or sent
		QVERIFY(telemetry.tick());
		QCOMPARE(sent.count(), 0);

		FakeClient a("a"), b("b");
		hub.add(&a);
		hub.add(&b);
		QVERIFY(telemetry.tick());
		QCOMPARE(sent.count(), 1);
		QCOMPARE(sent.at(0).at(0).toInt(), 2);
		QCOMPARE(a.received, b.received);

		const QJsonObject frame = QJsonDocument::fromJson(a.received.first().toUtf8()).object();
		QCOMPARE(frame.value("fps").toDouble(), 30.0);
		QCOMPARE(frame.value("ndi_state").toString(), QString("streaming"));
		QCOMPARE(frame.value("queue_ms").toInt(), 0);
	}

	void telemetryTimerRuns()
	{
		auto t = std::make_unique<FakeTransport>();
		CameraService camera(std::move(t), QStringLiteral("cam"));
		WebSocketHub hub;
		FakeClient a("a");
		hub.add(&a);
		TelemetryBroadcaster telemetry(camera, hub, 50);
		telemetry.start();
		QVERIFY(telemetry.isActive());
		QTRY_VERIFY_WITH_TIMEOUT(a.received.size() >= 2, 2000);
		telemetry.stop();
		QVERIFY(!telemetry.isActive());
	}
};

QTEST_GUILESS_MAIN(TestWebSocketHub)
#include "tst_websockethub.moc"
