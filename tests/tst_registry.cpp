#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QElapsedTimer>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QtTest>
#include <memory>

#include "LocalDevice.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"

namespace {

std::pair<bool, QString> claimAndWait(DeviceRegistry& registry, const DeviceEndpoint& ep)
{
	bool done = false;
	std::pair<bool, QString> out{false, QString()};
	registry.claim(ep.host, ep.port, ep.token, [&](bool ok, const QString& idOrError) {
		out = {ok, idOrError};
		done = true;
	});
	QTest::qWaitFor([&done]() { return done; }, 10000);
	return out;
}

bool refreshAndWait(DeviceRegistry& registry, const QString& id)
{
	bool done = false;
	bool result = false;
	registry.refreshDevice(id, [&](bool ok) { result = ok; done = true; });
	QTest::qWaitFor([&done]() { return done; }, 10000);
	return result;
}

} // namespace

class TestRegistry : public QObject {
	Q_OBJECT

private:
	QTemporaryDir dir_;

private slots:
	void claimQueriesDevice()
	{
		LocalDevice dev(QStringLiteral("Cam A"));
		QVERIFY(dev.start());
		DeviceClient client(2000);
		const QString path = dir_.filePath("claim.json");
		DeviceRegistry registry(client, path);
		QSignalSpy added(&registry, &DeviceRegistry::deviceAdded);

		const auto [ok, id] = claimAndWait(registry, dev.endpoint());
		QVERIFY2(ok, qPrintable(id));
		QCOMPARE(id, Device::makeId("127.0.0.1", dev.server->port()));
		QCOMPARE(added.count(), 1);

		const Device d = *registry.device(id);
		QCOMPARE(d.alias, QString("Cam A"));
		QCOMPARE(d.liveness, DeviceLiveness::Online);
		QVERIFY(d.status.has_value());
		QCOMPARE(registry.claimedAliases(), QStringList{"Cam A"});
		QVERIFY(QFile::exists(path));

		// claiming again updates in place
		const auto again = claimAndWait(registry, dev.endpoint());
		QVERIFY(again.first);
		QCOMPARE(registry.count(), 1);
		QCOMPARE(added.count(), 1);
	}

	void unreachableClaimAddsNothing()
	{
		DeviceClient client(1000);
		DeviceRegistry registry(client, dir_.filePath("unreachable.json"));
		const auto [ok, error] = claimAndWait(registry, DeviceEndpoint{"127.0.0.1", closedPort(), QString()});
		QVERIFY(!ok);
		QVERIFY2(error.startsWith("CONNECTION: "), qPrintable(error));
		QCOMPARE(registry.count(), 0);

		const auto bad = claimAndWait(registry, DeviceEndpoint{"  ", 8080, QString()});
		QVERIFY(!bad.first);
	}

	void claimNeedsTokenWhenAuthOn()
	{
		ControlServerOptions opts;
		opts.authEnabled = true;
		opts.bearerToken = QStringLiteral("abc");
		LocalDevice dev(QStringLiteral("Cam A"), opts);
		QVERIFY(dev.start());
		DeviceClient client(2000);
		DeviceRegistry registry(client, dir_.filePath("auth.json"));

		const auto denied = claimAndWait(registry, dev.endpoint());
		QVERIFY(!denied.first);
		QVERIFY(denied.second.startsWith("HTTP 401"));

		const auto ok = claimAndWait(registry, dev.endpoint("abc"));
		QVERIFY(ok.first);
		QCOMPARE(registry.device(ok.second)->token, QString("abc"));
	}

	void livenessDegradesAndRecovers()
	{
		auto dev = std::make_unique<LocalDevice>(QStringLiteral("Cam A"));
		QVERIFY(dev->start());
		const quint16 port = dev->server->port();
		DeviceClient client(1000);
		DeviceRegistry registry(client, dir_.filePath("liveness.json"), 3);
		QSignalSpy liveness(&registry, &DeviceRegistry::livenessChanged);

		const auto [ok, id] = claimAndWait(registry, dev->endpoint());
		QVERIFY(ok);

		dev.reset();   // device goes away
		QVERIFY(!refreshAndWait(registry, id));
		QCOMPARE(registry.device(id)->liveness, DeviceLiveness::Stale);
		QCOMPARE(registry.device(id)->consecutiveFailures, 1);
		QVERIFY(!refreshAndWait(registry, id));
		QCOMPARE(registry.device(id)->liveness, DeviceLiveness::Stale);
		QVERIFY(!refreshAndWait(registry, id));
		QCOMPARE(registry.device(id)->liveness, DeviceLiveness::Offline);
		// cached status is kept but never reported as fresh
		QVERIFY(registry.device(id)->status.has_value());

		// back on the same port
		auto t = std::make_unique<FakeTransport>();
		CameraService camera(std::move(t), QStringLiteral("Cam A renamed"));
		DeviceControlServer server(camera, ControlServerOptions());
		QString err;
		if (!server.start(QHostAddress::LocalHost, port, err))
			QSKIP("port was reused by another process");

		QVERIFY(refreshAndWait(registry, id));
		const Device d = *registry.device(id);
		QCOMPARE(d.liveness, DeviceLiveness::Online);
		QCOMPARE(d.consecutiveFailures, 0);
		QCOMPARE(d.alias, QString("Cam A renamed"));

		QCOMPARE(liveness.count(), 3);   // stale, offline, online
	}

	void refreshAllReportsCompletion()
	{
		LocalDevice a(QStringLiteral("Cam A"));
		QVERIFY(a.start());
		const QString path = dir_.filePath("refresh_all.json");
		QVERIFY(writeDevicesFile(path, {{"Cam A", a.endpoint()},
		                                {"Gone", DeviceEndpoint{"127.0.0.1", closedPort(), QString()}}}));

		DeviceClient client(1000);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		for (const Device& d : registry.devices())
			QCOMPARE(d.liveness, DeviceLiveness::Offline);

		QSignalSpy finished(&registry, &DeviceRegistry::refreshFinished);
		registry.refreshAll();
		QVERIFY(registry.isRefreshing(registry.ids().first()));
		// both still in flight: the round has nothing to send and ends at once
		registry.refreshAll();
		QCOMPARE(finished.count(), 1);
		QTRY_COMPARE_WITH_TIMEOUT(finished.count(), 2, 10000);
		QVERIFY(!registry.isRefreshing(registry.ids().first()));

		const QList<Device> devices = registry.devices();
		QCOMPARE(devices[0].liveness, DeviceLiveness::Online);
		QCOMPARE(devices[1].liveness, DeviceLiveness::Offline);
	}

	void silentDeviceDoesNotStallOthers()
	{
		LocalDevice live(QStringLiteral("Cam A"));
		QVERIFY(live.start());
		QTcpServer silent;   // accepts, never answers
		QVERIFY(silent.listen(QHostAddress::LocalHost, 0));
		const QString path = dir_.filePath("silent.json");
		QVERIFY(writeDevicesFile(path, {{"Silent", DeviceEndpoint{"127.0.0.1", silent.serverPort(), QString()}},
		                                {"Cam A", live.endpoint()}}));

		DeviceClient client(4000);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		const QString silentId = Device::makeId("127.0.0.1", silent.serverPort());
		const QString liveId = Device::makeId("127.0.0.1", live.server->port());

		QSignalSpy updated(&registry, &DeviceRegistry::deviceUpdated);
		QSignalSpy rounds(&registry, &DeviceRegistry::refreshFinished);
		auto liveUpdates = [&updated, &liveId]() {
			int n = 0;
			for (const auto& args : updated) n += args.at(0).toString() == liveId ? 1 : 0;
			return n;
		};

		QElapsedTimer timer;
		timer.start();
		registry.startAutoRefresh(100);
		QTRY_VERIFY_WITH_TIMEOUT(liveUpdates() >= 4, 3000);
		QVERIFY(timer.elapsed() < 4000);
		QVERIFY(rounds.count() >= 3);

		// the silent device has a single request out and no verdict yet
		QVERIFY(registry.isRefreshing(silentId));
		QCOMPARE(registry.device(silentId)->consecutiveFailures, 0);
		QCOMPARE(registry.device(liveId)->liveness, DeviceLiveness::Online);

		// its timeout is counted once, then it joins the rounds again
		QTRY_COMPARE_WITH_TIMEOUT(registry.device(silentId)->consecutiveFailures, 1, 6000);
		QCOMPARE(registry.device(silentId)->liveness, DeviceLiveness::Offline);
		registry.stopAutoRefresh();
	}

	void persistenceRoundTrip()
	{
		const QString path = dir_.filePath("persist.json");
		{
			QVERIFY(writeDevicesFile(path, {{"Cam A", DeviceEndpoint{"10.0.0.5", 8080, "tok"}},
			                                {"Cam B", DeviceEndpoint{"10.0.0.6", 8080, QString()}}}));
			DeviceClient client;
			DeviceRegistry registry(client, path);
			QString err;
			QVERIFY(registry.load(err));

			const QString idA = Device::makeId("10.0.0.5", 8080);
			StreamStartRequest s = StreamStartRequest::defaults();
			s.codec = QStringLiteral("hevc");
			registry.recordStreamSettings(idA, s);
			CameraSettingsRequest c;
			c.iso = 800;
			registry.recordCameraSettings(idA, c);

			TelemetryFrame f;
			f.fps = 30;
			registry.recordTelemetry(idA, f);
			QVERIFY(registry.setAlias(idA, QStringLiteral("Cam A+"), err));
			QVERIFY(!registry.setAlias("nope:1", QStringLiteral("x"), err));
		}

		DeviceClient client;
		DeviceRegistry reloaded(client, path);
		QString err;
		QVERIFY(reloaded.load(err));
		QCOMPARE(reloaded.ids().size(), 2);
		const Device a = reloaded.devices().first();
		QCOMPARE(a.alias, QString("Cam A+"));
		QCOMPARE(a.token, QString("tok"));
		QCOMPARE(a.streamSettings->codec, QString("hevc"));
		QCOMPARE(a.cameraSettings->iso.value_or(0), qint64(800));
		QVERIFY(!a.telemetry.has_value());
		QCOMPARE(a.liveness, DeviceLiveness::Offline);
	}

	void brokenEntriesSkipped()
	{
		const QString path = dir_.filePath("broken.json");
		QFile f(path);
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write(R"({"devices":[{"host":"10.0.0.5","port":8080},{"host":"10.0.0.6","port":70000},{"port":1}]})");
		f.close();

		DeviceClient client;
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		QCOMPARE(registry.count(), 1);

		QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
		f.write("not json");
		f.close();
		QVERIFY(!registry.load(err));
		QVERIFY(!err.isEmpty());
	}

	void unclaimAndClear()
	{
		const QString path = dir_.filePath("clear.json");
		QVERIFY(writeDevicesFile(path, {{"Cam A", DeviceEndpoint{"10.0.0.5", 8080, QString()}},
		                                {"Cam B", DeviceEndpoint{"10.0.0.6", 8080, QString()}}}));
		DeviceClient client;
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		QSignalSpy removed(&registry, &DeviceRegistry::deviceRemoved);

		QVERIFY(registry.unclaim(Device::makeId("10.0.0.5", 8080), err));
		QVERIFY(!registry.unclaim(Device::makeId("10.0.0.5", 8080), err));
		QCOMPARE(registry.claimedAliases(), QStringList{"Cam B"});

		QVERIFY(registry.clear(err));
		QCOMPARE(registry.count(), 0);
		QCOMPARE(removed.count(), 2);
		QVERIFY(!QFile::exists(path));
	}
};

QTEST_GUILESS_MAIN(TestRegistry)
#include "tst_registry.moc"
