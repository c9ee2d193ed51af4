#include <QTemporaryDir>
#include <QtTest>

#include "LocalDevice.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"
#include "console/TelemetryLink.hpp"

class TestTelemetryLink : public QObject {
	Q_OBJECT

private:
	QTemporaryDir dir_;

private slots:
	void backoffDoublesUpToCap()
	{
		QCOMPARE(TelemetryLink::backoffMs(0), 2000);
		QCOMPARE(TelemetryLink::backoffMs(1), 4000);
		QCOMPARE(TelemetryLink::backoffMs(3), 16000);
		QCOMPARE(TelemetryLink::backoffMs(4), 30000);
		QCOMPARE(TelemetryLink::backoffMs(9), 30000);
		QCOMPARE(TelemetryLink::backoffMs(-1), 2000);
	}

	void thresholdCrossing()
	{
		QVERIFY(TelemetryLink::crossesThreshold(false, 41.0, 40.0));
		QVERIFY(!TelemetryLink::crossesThreshold(true, 45.0, 40.0));
		QVERIFY(!TelemetryLink::crossesThreshold(false, 40.0, 40.0));
	}

	void framesReachRegistryAndAlertOnce()
	{
		ControlServerOptions opts;
		opts.telemetryIntervalMs = 50;
		opts.authEnabled = true;
		opts.bearerToken = QStringLiteral("tok");
		LocalDevice dev(QStringLiteral("Cam A"), opts);
		dev.transport->telemetry.fps = 29.97;
		dev.transport->telemetry.tempC = 45.0;
		QVERIFY(dev.start());

		const QString path = dir_.filePath("devices.json");
		QVERIFY(writeDevicesFile(path, {{"Cam A", dev.endpoint("tok")}}));
		DeviceClient client(2000);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		const QString id = registry.ids().first();

		AlertThresholds alerts;
		alerts.temperatureC = 40.0;
		TelemetryLink link(registry, alerts);
		QSignalSpy frames(&link, &TelemetryLink::frameReceived);
		QSignalSpy hot(&link, &TelemetryLink::temperatureAlert);
		QSignalSpy state(&link, &TelemetryLink::linkStateChanged);

		link.start();
		QCOMPARE(link.linkCount(), 1);
		QTRY_VERIFY_WITH_TIMEOUT(link.isConnected(id), 5000);
		QTRY_VERIFY_WITH_TIMEOUT(frames.count() >= 3, 5000);

		const auto stored = registry.device(id)->telemetry;
		QVERIFY(stored.has_value());
		QCOMPARE(stored->tempC, 45.0);
		QCOMPARE(stored->fps, 29.97);

		// still hot: one alert per crossing
		QCOMPARE(hot.count(), 1);
		QCOMPARE(hot.at(0).at(1).toDouble(), 45.0);

		// cool down, then cross again
		dev.transport->telemetry.tempC = 30.0;
		const int seen = frames.count();
		QTRY_VERIFY_WITH_TIMEOUT(frames.count() >= seen + 2, 5000);
		dev.transport->telemetry.tempC = 50.0;
		QTRY_COMPARE_WITH_TIMEOUT(hot.count(), 2, 5000);

		QVERIFY(state.count() >= 1);
		QCOMPARE(state.at(0).at(1).toBool(), true);

		link.stop();
		QCOMPARE(link.linkCount(), 0);
	}

	void unclaimClosesLink()
	{
		ControlServerOptions opts;
		opts.telemetryIntervalMs = 50;
		LocalDevice dev(QStringLiteral("Cam B"), opts);
		QVERIFY(dev.start());

		const QString path = dir_.filePath("unclaim.json");
		QVERIFY(writeDevicesFile(path, {{"Cam B", dev.endpoint()}}));
		DeviceClient client(2000);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		const QString id = registry.ids().first();

		TelemetryLink link(registry, AlertThresholds());
		link.start();
		QTRY_VERIFY_WITH_TIMEOUT(link.isConnected(id), 5000);
		QTRY_COMPARE_WITH_TIMEOUT(dev.server->hub().clientCount(), 1, 5000);

		QVERIFY(registry.unclaim(id, err));
		QCOMPARE(link.linkCount(), 0);
		QTRY_COMPARE_WITH_TIMEOUT(dev.server->hub().clientCount(), 0, 5000);
	}
};

QTEST_GUILESS_MAIN(TestTelemetryLink)
#include "tst_telemetrylink.moc"
