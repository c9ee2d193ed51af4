#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QtTest>
#include <memory>

#include "LocalDevice.hpp"
#include "console/CommandOrchestrator.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"

namespace {

GroupResults waitGroup(const std::function<void(CommandOrchestrator::GroupCallback)>& run, bool* finished)
{
	GroupResults results;
	*finished = false;
	run([&results, finished](const GroupResults& r) { results = r; *finished = true; });
	QTest::qWaitFor([finished]() { return *finished; }, 15000);
	return results;
}

} // namespace

class TestOrchestrator : public QObject {
	Q_OBJECT

private:
	QTemporaryDir dir_;
	std::unique_ptr<LocalDevice> a_;
	std::unique_ptr<LocalDevice> b_;
	std::unique_ptr<DeviceClient> client_;
	std::unique_ptr<DeviceRegistry> registry_;
	std::unique_ptr<CommandOrchestrator> orch_;
	QString idA_, idB_, idDead_;

private slots:
	void init()
	{
		QVERIFY(dir_.isValid());
		ControlServerOptions opts;
		opts.rateLimitIntervalMs = 1;
		a_ = std::make_unique<LocalDevice>(QStringLiteral("Cam A"), opts);
		b_ = std::make_unique<LocalDevice>(QStringLiteral("Cam B"), opts);
		QVERIFY(a_->start());
		QVERIFY(b_->start());

		const DeviceEndpoint dead{QStringLiteral("127.0.0.1"), closedPort(), QString()};
		const QString path = dir_.filePath(QStringLiteral("devices_%1.json").arg(QString::fromLatin1(QTest::currentTestFunction())));
		QVERIFY(writeDevicesFile(path, {{"Cam A", a_->endpoint()}, {"Cam B", b_->endpoint()}, {"Cam Dead", dead}}));

		client_ = std::make_unique<DeviceClient>(2000);
		registry_ = std::make_unique<DeviceRegistry>(*client_, path);
		QString err;
		QVERIFY2(registry_->load(err), qPrintable(err));
		QCOMPARE(registry_->count(), 3);
		orch_ = std::make_unique<CommandOrchestrator>(*registry_, *client_);

		idA_ = Device::makeId("127.0.0.1", a_->server->port());
		idB_ = Device::makeId("127.0.0.1", b_->server->port());
		idDead_ = Device::makeId("127.0.0.1", dead.port);
	}

	void cleanup()
	{
		orch_.reset();
		registry_.reset();
		client_.reset();
		a_.reset();
		b_.reset();
	}

	void partialFailureKeepsEveryTarget()
	{
		QSignalSpy finishedSpy(orch_.get(), &CommandOrchestrator::groupFinished);
		StreamStartRequest req = StreamStartRequest::defaults();
		req.resolution = QStringLiteral("2560x1440");

		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->startStreamGroup({idA_, idDead_, idB_}, req, cb);
		}, &finished);
		QVERIFY(finished);

		QCOMPARE(r.size(), 3);
		QCOMPARE(r[0].deviceId, idA_);
		QCOMPARE(r[1].deviceId, idDead_);
		QCOMPARE(r[2].deviceId, idB_);
		QVERIFY(r[0].success);
		QVERIFY(!r[1].success);
		QVERIFY2(r[1].error.startsWith("CONNECTION: "), qPrintable(r[1].error));
		QVERIFY(r[2].success);
		QVERIFY(r[0].error.isEmpty());

		QVERIFY(a_->transport->streaming);
		QVERIFY(b_->transport->streaming);
		QCOMPARE(a_->transport->lastStart.resolution, QString("2560x1440"));

		// successful starts are remembered for start-all
		QCOMPARE(registry_->device(idA_)->streamSettings->resolution, QString("2560x1440"));
		QVERIFY(!registry_->device(idDead_)->streamSettings.has_value());

		QCOMPARE(finishedSpy.count(), 1);
		QCOMPARE(finishedSpy.at(0).at(1).toInt(), 2);
		QCOMPARE(finishedSpy.at(0).at(2).toInt(), 1);

		const QJsonObject failedJson = r[1].toJson();
		QCOMPARE(failedJson.value("device_id").toString(), idDead_);
		QCOMPARE(failedJson.value("success").toBool(), false);
		QVERIFY(failedJson.contains("error"));
		QVERIFY(!r[0].toJson().contains("error"));
	}

	void unknownAndDuplicateIds()
	{
		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->stopStreamGroup({idA_, "ghost:1", idA_}, cb);
		}, &finished);
		QVERIFY(finished);

		QCOMPARE(r.size(), 2);
		QCOMPARE(r[0].deviceId, idA_);
		QVERIFY(r[0].success);
		QCOMPARE(r[1].deviceId, QString("ghost:1"));
		QCOMPARE(r[1].error, QString("NOT_FOUND: Device not found: ghost:1"));
	}

	void emptyGroupCompletesImmediately()
	{
		bool called = false;
		orch_->forceKeyframeGroup(QStringList(), [&called](const GroupResults& r) {
			called = true;
			QVERIFY(r.isEmpty());
		});
		QVERIFY(called);
	}

	void deviceErrorsStayPerDevice()
	{
		// A is idle so keyframe fails there; B streams
		b_->transport->streaming = true;
		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->forceKeyframeGroup({idA_, idB_}, cb);
		}, &finished);
		QVERIFY(finished);
		QCOMPARE(r.size(), 2);
		QVERIFY(!r[0].success);
		QVERIFY2(r[0].error.startsWith("HTTP 500 KEYFRAME_FAILED: "), qPrintable(r[0].error));
		QVERIFY(r[1].success);
		QCOMPARE(b_->transport->keyframes, 1);
	}

	void startAllUsesRememberedSettings()
	{
		StreamStartRequest custom = StreamStartRequest::defaults();
		custom.framerate = 60;
		registry_->recordStreamSettings(idA_, custom);

		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) { orch_->startAll(cb); }, &finished);
		QVERIFY(finished);
		QCOMPARE(r.size(), 3);
		QCOMPARE(a_->transport->lastStart.framerate, 60);
		QCOMPARE(b_->transport->lastStart, StreamStartRequest::defaults());

		const GroupResults stopped = waitGroup([&](CommandOrchestrator::GroupCallback cb) { orch_->stopAll(cb); }, &finished);
		QCOMPARE(stopped.size(), 3);
		QVERIFY(!a_->transport->streaming);
	}

	void cameraSettingsRecorded()
	{
		CameraSettingsRequest first;
		first.iso = 400;
		CameraSettingsRequest second;
		second.lens = QStringLiteral("telephoto");

		bool finished = false;
		waitGroup([&](CommandOrchestrator::GroupCallback cb) { orch_->updateCameraSettingsGroup({idA_}, first, cb); }, &finished);
		QTest::qWait(5);
		waitGroup([&](CommandOrchestrator::GroupCallback cb) { orch_->updateCameraSettingsGroup({idA_}, second, cb); }, &finished);

		const auto stored = registry_->device(idA_)->cameraSettings;
		QVERIFY(stored.has_value());
		QCOMPARE(stored->iso.value_or(0), qint64(400));
		QCOMPARE(stored->lens.value_or(QString()), QString("telephoto"));
		QCOMPARE(a_->camera->currentSettings().lens, QString("telephoto"));
	}

	void applyBundleRunsCameraThenVideo()
	{
		SettingsBundle bundle;
		bundle.camera.wbKelvin = 4300;
		bundle.stream = StreamStartRequest{QStringLiteral("1280x720"), 25, 4000000, QStringLiteral("h264")};

		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->applyBundleGroup({idA_, idB_}, bundle, cb);
		}, &finished);
		QCOMPARE(r.size(), 2);
		QVERIFY(r[0].success && r[1].success);

		QCOMPARE(a_->camera->currentSettings().wbKelvin.value_or(0), qint64(4300));
		const VideoSettings v = a_->camera->videoSettings();
		QCOMPARE(v.customResolution.value_or(QString()), QString("1280x720"));
		QCOMPARE(v.customFps.value_or(0), qint64(25));
	}

	void whiteBalanceMeasuredPerDevice()
	{
		a_->transport->measured = WhiteBalanceMeasurement{5100, 1.5};
		b_->transport->failMeasure = QStringLiteral("no frames");

		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->measureWhiteBalanceGroup({idA_, idB_, idDead_}, cb);
		}, &finished);
		QVERIFY(finished);
		QCOMPARE(r.size(), 3);

		QVERIFY(r[0].success);
		const WhiteBalanceMeasurement m = WhiteBalanceMeasurement::fromJson(r[0].data);
		QCOMPARE(m.sceneCctK, qint64(5100));
		QCOMPARE(m.tint, 1.5);
		QCOMPARE(r[0].toJson().value("data").toObject().value("scene_cct_k").toInt(), 5100);
		QCOMPARE(registry_->device(idA_)->cameraSettings->wbMode.value_or(QString()), QString("auto"));

		QVERIFY(!r[1].success);
		QCOMPARE(r[1].error, QString("HTTP 500 MEASURE_FAILED: Measurement failed: no frames"));
		QVERIFY(r[2].error.startsWith("CONNECTION: "));
	}

	void torchLevelSingleAndGroup()
	{
		std::optional<GroupOperationResult> one;
		orch_->setTorchLevel(idA_, 0.6, [&one](const GroupOperationResult& r) { one = r; });
		QTRY_VERIFY_WITH_TIMEOUT(one.has_value(), 10000);
		QVERIFY2(one->success, qPrintable(one->error));
		QCOMPARE(TorchLevelResponse::fromJson(one->data).currentLevel, 0.6);
		QCOMPARE(a_->camera->torchLevel(), 0.6);

		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->setTorchLevelGroup({idA_, idB_}, 1.4, cb);
		}, &finished);
		QCOMPARE(r.size(), 2);
		for (const auto& e : r)
			QVERIFY2(e.error.startsWith("HTTP 400 INVALID_REQUEST: "), qPrintable(e.error));
		QCOMPARE(a_->camera->torchLevel(), 0.6);

		const GroupResults off = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch_->setTorchLevelGroup({idA_, idB_}, 0.0, cb);
		}, &finished);
		QVERIFY(off[0].success && off[1].success);
		QCOMPARE(b_->transport->torchCalls, 1);
		QCOMPARE(a_->camera->torchLevel(), 0.0);
	}

	void aliasUpdateReachesRegistry()
	{
		std::optional<GroupOperationResult> result;
		orch_->updateAlias(idB_, QStringLiteral("Front of House"), [&result](const GroupOperationResult& r) { result = r; });
		QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 10000);
		QVERIFY(result->success);
		QCOMPARE(registry_->device(idB_)->alias, QString("Front of House"));
		QCOMPARE(b_->camera->alias(), QString("Front of House"));
	}

	void slowDeviceDoesNotDelayOthersBeyondTimeout()
	{
		QTcpServer silent;
		QVERIFY(silent.listen(QHostAddress::LocalHost, 0));
		const QString path = dir_.filePath("devices_slow.json");
		QVERIFY(writeDevicesFile(path, {{"Cam A", a_->endpoint()},
		                                {"Silent", DeviceEndpoint{"127.0.0.1", silent.serverPort(), QString()}}}));
		DeviceClient client(500);
		DeviceRegistry registry(client, path);
		QString err;
		QVERIFY(registry.load(err));
		CommandOrchestrator orch(registry, client);

		QElapsedTimer t;
		t.start();
		bool finished = false;
		const GroupResults r = waitGroup([&](CommandOrchestrator::GroupCallback cb) {
			orch.setScreenDimmedGroup(registry.ids(), true, cb);
		}, &finished);
		QVERIFY(finished);
		QVERIFY(t.elapsed() < 5000);
		QCOMPARE(r.size(), 2);
		QVERIFY(r[0].success);
		QVERIFY2(r[1].error.startsWith("TIMEOUT: "), qPrintable(r[1].error));
		QVERIFY(a_->camera->screenDimmed());
	}

	void distinctIdsKeepsFirstOccurrence()
	{
		QCOMPARE(CommandOrchestrator::distinctIds({"b", "a", "b", "c", "a"}), QStringList({"b", "a", "c"}));
	}
};

QTEST_GUILESS_MAIN(TestOrchestrator)
#include "tst_orchestrator.moc"
