#include <QFile>
#include <QTemporaryDir>
#include <QtTest>
#include <memory>

#include "LocalDevice.hpp"
#include "console/CommandOrchestrator.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"
#include "console/ProfileStore.hpp"

namespace {

SettingsBundle stageBundle()
{
	SettingsBundle b;
	b.camera.iso = 640;
	b.camera.wbMode = QStringLiteral("manual");
	b.camera.wbKelvin = 5600;
	b.stream = StreamStartRequest{QStringLiteral("1280x720"), 50, 6000000, QStringLiteral("hevc")};
	return b;
}

} // namespace

class TestProfileStore : public QObject {
	Q_OBJECT

private:
	QTemporaryDir dir_;

private slots:
	void saveUpsertsAndPersists()
	{
		const QString path = dir_.filePath("upsert/profiles.json");
		{
			ProfileStore store(path);
			QSignalSpy changed(&store, &ProfileStore::profilesChanged);
			QString err;
			QVERIFY(store.load(err));   // missing file
			QVERIFY(store.list().isEmpty());

			QVERIFY2(store.save("  Stage  ", stageBundle(), err), qPrintable(err));
			SettingsBundle night;
			night.camera.iso = 3200;
			QVERIFY(store.save("Night", night, err));
			QCOMPARE(store.names(), QStringList({"Stage", "Night"}));

			// same name replaces in place
			night.camera.iso = 1600;
			QVERIFY(store.save("Night", night, err));
			QCOMPARE(store.list().size(), 2);
			QCOMPARE(store.find("Night")->settings.camera.iso.value_or(0), qint64(1600));
			QCOMPARE(changed.count(), 3);

			QVERIFY(!store.save("   ", night, err));
			QVERIFY(!err.isEmpty());
			QCOMPARE(changed.count(), 3);
		}

		ProfileStore reloaded(path);
		QString err;
		QVERIFY(reloaded.load(err));
		QCOMPARE(reloaded.names(), QStringList({"Stage", "Night"}));
		const auto stage = reloaded.find("Stage");
		QVERIFY(stage.has_value());
		QCOMPARE(stage->settings.camera.wbKelvin.value_or(0), qint64(5600));
		QCOMPARE(stage->settings.stream->codec, QString("hevc"));
		QVERIFY(!reloaded.find("Night")->settings.stream.has_value());
	}

	void removeIsIdempotent()
	{
		ProfileStore store(dir_.filePath("remove.json"));
		QSignalSpy changed(&store, &ProfileStore::profilesChanged);
		QString err;
		QVERIFY(store.save("Stage", stageBundle(), err));

		QVERIFY(store.remove("Stage", err));
		QVERIFY(store.names().isEmpty());
		QVERIFY(store.remove("Stage", err));
		QVERIFY(store.remove("Never existed", err));
		QCOMPARE(changed.count(), 2);
		QVERIFY(!store.find("Stage").has_value());
	}

	void brokenFileReported()
	{
		const QString path = dir_.filePath("broken.json");
		QFile f(path);
		QVERIFY(f.open(QIODevice::WriteOnly));
		f.write("{\"profiles\": [");
		f.close();

		ProfileStore store(path);
		QString err;
		QVERIFY(!store.load(err));
		QVERIFY(err.contains("invalid JSON"));

		// entries without a name are skipped
		QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
		f.write(R"({"profiles":[{"settings":{}},{"name":"Ok","settings":{}}]})");
		f.close();
		QVERIFY(store.load(err));
		QCOMPARE(store.names(), QStringList{"Ok"});
	}

	void unknownProfileFailsEveryTarget()
	{
		DeviceClient client;
		DeviceRegistry registry(client, dir_.filePath("unknown_devices.json"));
		CommandOrchestrator orch(registry, client);
		ProfileStore store(dir_.filePath("unknown_profiles.json"));

		GroupResults results;
		bool called = false;
		store.apply("Missing", {"a:1", "b:2", "a:1"}, orch, [&](const GroupResults& r) {
			results = r;
			called = true;
		});
		QVERIFY(called);
		QCOMPARE(results.size(), 2);
		for (const auto& r : results) {
			QVERIFY(!r.success);
			QCOMPARE(r.error, QString("NOT_FOUND: Profile not found: Missing"));
		}
		QCOMPARE(results[0].deviceId, QString("a:1"));
		QCOMPARE(results[1].deviceId, QString("b:2"));
	}

	void applyPushesBundleToDevices()
	{
		ControlServerOptions opts;
		opts.rateLimitIntervalMs = 1;
		LocalDevice a(QStringLiteral("Cam A"), opts);
		LocalDevice b(QStringLiteral("Cam B"), opts);
		QVERIFY(a.start());
		QVERIFY(b.start());

		const DeviceEndpoint dead{QStringLiteral("127.0.0.1"), closedPort(), QString()};
		const QString devicesPath = dir_.filePath("apply_devices.json");
		QVERIFY(writeDevicesFile(devicesPath, {{"Cam A", a.endpoint()}, {"Cam Dead", dead}, {"Cam B", b.endpoint()}}));
		DeviceClient client(2000);
		DeviceRegistry registry(client, devicesPath);
		QString err;
		QVERIFY(registry.load(err));
		QCOMPARE(registry.count(), 3);
		CommandOrchestrator orch(registry, client);
		const QStringList targets = registry.ids();

		ProfileStore store(dir_.filePath("apply_profiles.json"));
		QVERIFY(store.save("Stage", stageBundle(), err));

		GroupResults results;
		bool called = false;
		store.apply("Stage", targets, orch, [&](const GroupResults& r) {
			results = r;
			called = true;
		});
		QTRY_VERIFY_WITH_TIMEOUT(called, 15000);

		// one entry per target in request order; the dead device fails alone
		QCOMPARE(results.size(), 3);
		for (int i = 0; i < targets.size(); ++i)
			QCOMPARE(results[i].deviceId, targets[i]);
		QVERIFY2(results[0].success, qPrintable(results[0].error));
		QVERIFY(!results[1].success);
		QVERIFY2(results[1].error.startsWith("CONNECTION: ") || results[1].error.startsWith("TIMEOUT: "),
		         qPrintable(results[1].error));
		QVERIFY2(results[2].success, qPrintable(results[2].error));

		QCOMPARE(a.camera->currentSettings().iso, 640);
		QCOMPARE(b.camera->currentSettings().wbKelvin.value_or(0), qint64(5600));
		const VideoSettings v = b.camera->videoSettings();
		QCOMPARE(v.customResolution.value_or(QString()), QString("1280x720"));
		QCOMPARE(v.customCodec.value_or(QString()), QString("hevc"));
	}
};

QTEST_GUILESS_MAIN(TestProfileStore)
#include "tst_profilestore.moc"
