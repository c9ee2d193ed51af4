#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QtTest>
#include <functional>

#include "LocalDevice.hpp"
#include "console/CommandOrchestrator.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"
#include "console/SettingsDebouncer.hpp"

class TestDebouncer : public QObject {
	Q_OBJECT

private slots:
	void burstCollapsesToLastValue()
	{
		SettingsDebouncer debouncer(100);
		QSignalSpy fired(&debouncer, &SettingsDebouncer::fired);
		QList<int> sent;

		for (int v = 1; v <= 10; ++v)
			debouncer.submit("cam-1", "camera", [&sent, v]() { sent.append(v); });
		QVERIFY(debouncer.isPending("cam-1", "camera"));
		QCOMPARE(debouncer.pendingCount(), 1);

		QTRY_COMPARE_WITH_TIMEOUT(sent.size(), 1, 2000);
		QCOMPARE(sent.first(), 10);
		QCOMPARE(fired.count(), 1);
		QCOMPARE(fired.at(0).at(0).toString(), QString("cam-1"));
		QCOMPARE(fired.at(0).at(1).toString(), QString("camera"));
		QVERIFY(!debouncer.isPending("cam-1", "camera"));

		// nothing else shows up later
		QTest::qWait(250);
		QCOMPARE(sent.size(), 1);
	}

	void eachSubmitRestartsWindow()
	{
		SettingsDebouncer debouncer(300);
		int calls = 0;
		QElapsedTimer t;
		t.start();
		for (int i = 0; i < 4; ++i) {
			debouncer.submit("cam-1", "camera", [&calls]() { ++calls; });
			QTest::qWait(50);
		}
		// edits keep arriving inside the window
		QCOMPARE(calls, 0);
		QTRY_COMPARE_WITH_TIMEOUT(calls, 1, 2000);
		QVERIFY(t.elapsed() >= 400);
	}

	void keysAreIndependent()
	{
		SettingsDebouncer debouncer(50);
		QStringList order;
		debouncer.submit("cam-1", "camera", [&order]() { order.append("cam-1/camera"); });
		debouncer.submit("cam-2", "camera", [&order]() { order.append("cam-2/camera"); });
		debouncer.submit("cam-1", "video", [&order]() { order.append("cam-1/video"); });
		QCOMPARE(debouncer.pendingCount(), 3);

		QTRY_COMPARE_WITH_TIMEOUT(order.size(), 3, 2000);
		QVERIFY(order.contains("cam-2/camera"));
		QCOMPARE(debouncer.pendingCount(), 0);
	}

	void flushRunsPendingNow()
	{
		SettingsDebouncer debouncer(10000);
		QString last;
		debouncer.submit("cam-1", "camera", [&last]() { last = "a"; });
		debouncer.submit("cam-1", "camera", [&last]() { last = "b"; });
		debouncer.flush();
		QCOMPARE(last, QString("b"));
		QCOMPARE(debouncer.pendingCount(), 0);
	}

	void cancelDropsActions()
	{
		SettingsDebouncer debouncer(30);
		int calls = 0;
		debouncer.submit("cam-1", "camera", [&calls]() { ++calls; });
		debouncer.cancelAll();
		QTest::qWait(150);
		QCOMPARE(calls, 0);
	}

	void actionMaySubmitAgain()
	{
		SettingsDebouncer debouncer(20);
		int calls = 0;
		std::function<void()> again = [&]() {
			++calls;
			if (calls < 2) debouncer.submit("cam-1", "camera", again);
		};
		debouncer.submit("cam-1", "camera", again);
		QTRY_COMPARE_WITH_TIMEOUT(calls, 2, 2000);
	}

	void slidingEditsSendOneRequest()
	{
		LocalDevice dev(QStringLiteral("Cam A"));
		QVERIFY(dev.start());
		QTemporaryDir dir;
		const QString path = dir.filePath("devices.json");
		QVERIFY(writeDevicesFile(path, {{"Cam A", dev.endpoint()}}));
		DeviceClient client(2000);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		CommandOrchestrator orch(registry, client);
		const QString id = registry.ids().first();

		SettingsDebouncer debouncer(100);
		int replies = 0;
		bool lastOk = false;
		// ISO slider dragged through 8 stops
		for (int iso = 100; iso <= 800; iso += 100) {
			CameraSettingsRequest r;
			r.iso = iso;
			debouncer.submit(id, "camera", [&orch, &replies, &lastOk, id, r]() {
				orch.updateCameraSettings(id, r, [&replies, &lastOk](const GroupOperationResult& res) {
					++replies;
					lastOk = res.success;
				});
			});
		}
		QCOMPARE(dev.transport->settingsCalls, 0);

		QTRY_COMPARE_WITH_TIMEOUT(replies, 1, 5000);
		QVERIFY(lastOk);
		QCOMPARE(dev.transport->settingsCalls, 1);
		QCOMPARE(dev.transport->lastSettings.iso, 800);
		QCOMPARE(dev.camera->currentSettings().iso, 800);

		QTest::qWait(250);
		QCOMPARE(dev.transport->settingsCalls, 1);
	}
};

QTEST_GUILESS_MAIN(TestDebouncer)
#include "tst_debouncer.moc"
