#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>
#include <memory>

#include "FakeTransport.hpp"
#include "device/CameraService.hpp"
#include "server/ApiHandlers.hpp"
#include "server/HttpRouter.hpp"
#include "server/Middleware.hpp"

class TestHttpRouter : public QObject {
	Q_OBJECT

private:
	FakeTransport* transport_ = nullptr;
	std::unique_ptr<CameraService> camera_;
	std::unique_ptr<ApiHandlers> handlers_;
	std::unique_ptr<HttpRouter> router_;
	qint64 now_ = 0;

	void build(bool auth)
	{
		auto t = std::make_unique<FakeTransport>();
		transport_ = t.get();
		camera_ = std::make_unique<CameraService>(std::move(t), QStringLiteral("Stage Left"));
		handlers_ = std::make_unique<ApiHandlers>(*camera_);
		router_ = std::make_unique<HttpRouter>();
		router_->addMiddleware(std::make_shared<CorsMiddleware>());
		router_->addMiddleware(std::make_shared<AuthMiddleware>(auth, QStringLiteral("tok")));
		router_->addMiddleware(std::make_shared<RateLimiter>(50, RateLimiter::cameraPaths(),
		                                                     [this] { return now_; }));
		handlers_->registerRoutes(*router_);
	}

	static HttpRequest request(const char* method, const char* path, const QByteArray& body = QByteArray())
	{
		HttpRequest r;
		r.method = QString::fromLatin1(method);
		r.path = QString::fromLatin1(path);
		r.body = body;
		return r;
	}

	static QJsonObject bodyOf(const HttpResponse& resp)
	{
		return QJsonDocument::fromJson(resp.body).object();
	}

private slots:
	void init()
	{
		now_ = 0;
		build(false);
	}

	void preflightShortCircuits()
	{
		build(true);
		const HttpResponse resp = router_->handle(request("OPTIONS", "/api/v1/camera"));
		QCOMPARE(resp.status, 200);
		QCOMPARE(resp.headers.value("Access-Control-Allow-Origin"), QByteArray("*"));
		QVERIFY(resp.headers.value("Access-Control-Allow-Methods").contains("PUT"));
		QVERIFY(resp.headers.value("Access-Control-Allow-Headers").contains("Authorization"));
		QCOMPARE(resp.headers.value("Access-Control-Max-Age"), QByteArray("86400"));
	}

	void authRejectsMissingToken()
	{
		build(true);
		const HttpResponse denied = router_->handle(request("GET", "/api/v1/status"));
		QCOMPARE(denied.status, 401);
		QCOMPARE(bodyOf(denied).value("code").toString(), QString("UNAUTHORIZED"));
		QCOMPARE(denied.headers.value("Access-Control-Allow-Origin"), QByteArray("*"));

		HttpRequest r = request("GET", "/api/v1/status");
		r.headers.insert("authorization", "Bearer tok");
		const HttpResponse ok = router_->handle(r);
		QCOMPARE(ok.status, 200);
		QCOMPARE(bodyOf(ok).value("alias").toString(), QString("Stage Left"));
	}

	void unknownRouteIs404()
	{
		const HttpResponse resp = router_->handle(request("GET", "/api/v1/nope"));
		QCOMPARE(resp.status, 404);
		const QJsonObject o = bodyOf(resp);
		QCOMPARE(o.value("code").toString(), QString("NOT_FOUND"));
		QCOMPARE(o.value("message").toString(),
		         QString("Resource not found: Endpoint not found: GET /api/v1/nope"));

		// method is part of the route key
		QCOMPARE(router_->handle(request("GET", "/api/v1/stream/start")).status, 404);
	}

	void statusShape()
	{
		const QJsonObject o = bodyOf(router_->handle(request("GET", "/api/v1/status")));
		QCOMPARE(o.value("ndi_state").toString(), QString("idle"));
		QVERIFY(o.value("current").isObject());
		QVERIFY(o.value("telemetry").isObject());
		QCOMPARE(o.value("capabilities").toArray().size(), 3);
	}

	void capabilitiesIsArray()
	{
		const HttpResponse resp = router_->handle(request("GET", "/api/v1/capabilities"));
		QCOMPARE(resp.status, 200);
		QVERIFY(QJsonDocument::fromJson(resp.body).isArray());
	}

	void startStreamFlow()
	{
		const HttpResponse missing = router_->handle(request("POST", "/api/v1/stream/start"));
		QCOMPARE(missing.status, 400);
		QCOMPARE(bodyOf(missing).value("code").toString(), QString("MISSING_BODY"));

		const HttpResponse malformed = router_->handle(request("POST", "/api/v1/stream/start", "{oops"));
		QCOMPARE(malformed.status, 400);
		QCOMPARE(bodyOf(malformed).value("code").toString(), QString("INVALID_REQUEST"));

		const HttpResponse started = router_->handle(request("POST", "/api/v1/stream/start",
			R"({"resolution":"1280x720","framerate":25,"bitrate":4000000,"codec":"hevc"})"));
		QCOMPARE(started.status, 200);
		QCOMPARE(bodyOf(started).value("success").toBool(), true);
		QCOMPARE(bodyOf(started).value("message").toString(), QString("Stream started"));
		QCOMPARE(transport_->lastStart.resolution, QString("1280x720"));
		QCOMPARE(camera_->streamState(), NdiState::Streaming);

		const QJsonObject status = bodyOf(router_->handle(request("GET", "/api/v1/status")));
		QCOMPARE(status.value("ndi_state").toString(), QString("streaming"));
		QCOMPARE(status.value("current").toObject().value("codec").toString(), QString("hevc"));
	}

	void upstreamFailureMapsToEndpointCode()
	{
		transport_->failStart = QStringLiteral("encoder busy");
		const HttpResponse resp = router_->handle(request("POST", "/api/v1/stream/start",
			R"({"resolution":"1920x1080","framerate":30,"bitrate":10000000,"codec":"h264"})"));
		QCOMPARE(resp.status, 500);
		const QJsonObject o = bodyOf(resp);
		QCOMPARE(o.value("code").toString(), QString("STREAM_START_FAILED"));
		QVERIFY(o.value("message").toString().contains("encoder busy"));
	}

	void keyframeNeedsRunningStream()
	{
		const HttpResponse idle = router_->handle(request("POST", "/api/v1/encoder/force_keyframe"));
		QCOMPARE(idle.status, 500);
		QCOMPARE(bodyOf(idle).value("code").toString(), QString("KEYFRAME_FAILED"));

		transport_->streaming = true;
		QCOMPARE(router_->handle(request("POST", "/api/v1/encoder/force_keyframe")).status, 200);
		QCOMPARE(transport_->keyframes, 1);
	}

	void cameraRouteIsRateLimited()
	{
		const QByteArray body = R"({"iso":400})";
		QCOMPARE(router_->handle(request("POST", "/api/v1/camera", body)).status, 200);
		now_ = 10;
		const HttpResponse limited = router_->handle(request("POST", "/api/v1/camera", body));
		QCOMPARE(limited.status, 429);
		QCOMPARE(bodyOf(limited).value("message").toString(), QString("Too many requests, wait 40ms"));
		now_ = 60;
		QCOMPARE(router_->handle(request("POST", "/api/v1/camera", body)).status, 200);

		QCOMPARE(transport_->settingsCalls, 2);
		QCOMPARE(camera_->currentSettings().iso, 400);
		QCOMPARE(camera_->currentSettings().isoMode, QString("manual"));
	}

	void whiteBalanceMeasureSharesCameraLimit()
	{
		QCOMPARE(router_->handle(request("POST", "/api/v1/camera", R"({"wb_kelvin":3200})")).status, 200);
		now_ = 10;
		const HttpResponse limited = router_->handle(request("POST", "/api/v1/camera/wb/measure"));
		QCOMPARE(limited.status, 429);
		QCOMPARE(bodyOf(limited).value("code").toString(), QString("RATE_LIMITED"));

		now_ = 60;
		const HttpResponse resp = router_->handle(request("POST", "/api/v1/camera/wb/measure"));
		QCOMPARE(resp.status, 200);
		const QJsonObject o = bodyOf(resp);
		QCOMPARE(o.value("scene_cct_k").toInt(), 4300);
		QCOMPARE(o.value("tint").toDouble(), -2.5);
		QCOMPARE(camera_->currentSettings().wbMode, QString("auto"));

		now_ = 200;
		transport_->failMeasure = QStringLiteral("no frames");
		const HttpResponse failed = router_->handle(request("POST", "/api/v1/camera/wb/measure"));
		QCOMPARE(failed.status, 500);
		QCOMPARE(bodyOf(failed).value("code").toString(), QString("MEASURE_FAILED"));
		QCOMPARE(bodyOf(failed).value("message").toString(), QString("Measurement failed: no frames"));
	}

	void torchLevelRoute()
	{
		QCOMPARE(bodyOf(router_->handle(request("GET", "/api/v1/torch/level"))).value("current_level").toDouble(), 0.0);

		const HttpResponse set = router_->handle(request("PUT", "/api/v1/torch/level", R"({"level":0.75})"));
		QCOMPARE(set.status, 200);
		QCOMPARE(bodyOf(set).value("current_level").toDouble(), 0.75);
		QCOMPARE(transport_->lastTorch, 0.75);
		QCOMPARE(bodyOf(router_->handle(request("GET", "/api/v1/torch/level"))).value("current_level").toDouble(), 0.75);

		QCOMPARE(router_->handle(request("PUT", "/api/v1/torch/level", R"({"level":2})")).status, 400);
		QCOMPARE(router_->handle(request("PUT", "/api/v1/torch/level")).status, 400);

		transport_->failTorch = QStringLiteral("overheated");
		const HttpResponse failed = router_->handle(request("PUT", "/api/v1/torch/level", R"({"level":0.1})"));
		QCOMPARE(failed.status, 500);
		QCOMPARE(bodyOf(failed).value("code").toString(), QString("TORCH_UPDATE_FAILED"));
		QCOMPARE(camera_->torchLevel(), 0.75);
	}

	void videoSettingsRoundTrip()
	{
		const HttpResponse unknown = router_->handle(request("PUT", "/api/v1/video/settings",
			R"({"selected_preset_id":"does_not_exist"})"));
		QCOMPARE(unknown.status, 400);

		QCOMPARE(router_->handle(request("PUT", "/api/v1/video/settings",
			R"({"selected_preset_id":"4k_standard"})")).status, 200);
		const QJsonObject o = bodyOf(router_->handle(request("GET", "/api/v1/video/settings")));
		QCOMPARE(o.value("selected_preset_id").toString(), QString("4k_standard"));
		QCOMPARE(o.value("available_presets").toArray().size(), VideoPreset::builtin().size());
	}

	void aliasUpdate()
	{
		QSignalSpy changed(camera_.get(), &CameraService::aliasChanged);
		const HttpResponse resp = router_->handle(request("PUT", "/api/v1/settings/alias", R"({"alias":"  Booth 2 "})"));
		QCOMPARE(resp.status, 200);
		QCOMPARE(bodyOf(resp).value("alias").toString(), QString("Booth 2"));
		QCOMPARE(camera_->alias(), QString("Booth 2"));
		QCOMPARE(changed.count(), 1);

		const HttpResponse bad = router_->handle(request("PUT", "/api/v1/settings/alias", R"({"alias":""})"));
		QCOMPARE(bad.status, 400);
		QCOMPARE(bodyOf(bad).value("code").toString(), QString("INVALID_ALIAS"));
	}

	void brightness()
	{
		QCOMPARE(router_->handle(request("POST", "/api/v1/screen/brightness", R"({"dimmed":true})")).status, 200);
		QVERIFY(camera_->screenDimmed());
		QCOMPARE(router_->handle(request("POST", "/api/v1/screen/brightness", R"({"dimmed":"yes"})")).status, 400);
	}

	void logsWithoutDatabase()
	{
		QCOMPARE(router_->handle(request("GET", "/api/v1/logs")).status, 501);
		QCOMPARE(router_->handle(request("GET", "/api/v1/logs.zip")).status, 501);
	}

	void indexPageIsHtml()
	{
		const HttpResponse resp = router_->handle(request("GET", "/"));
		QCOMPARE(resp.status, 200);
		QVERIFY(resp.headers.value("Content-Type").startsWith("text/html"));
		QVERIFY(resp.body.contains("/ws"));
	}

	void serializeAddsContentLength()
	{
		HttpResponse resp = HttpResponse::json(200, QJsonObject{{"a", 1}});
		const QByteArray wire = resp.serialize();
		QVERIFY(wire.startsWith("HTTP/1.1 200 OK\r\n"));
		QVERIFY(wire.contains("Content-Length: " + QByteArray::number(resp.body.size())));
		QVERIFY(wire.endsWith("\r\n\r\n" + resp.body));
	}

	void parseHead()
	{
		const QByteArray partial = "POST /api/v1/camera?x=1 HTTP/1.1\r\nHost: a\r\n";
		QCOMPARE(HttpWire::parseHead(partial).state, HttpWire::HeadParse::State::NeedMore);

		const QByteArray full = "post /api/v1/camera?x=1 HTTP/1.1\r\nContent-Length: 12\r\nAuthorization: Bearer t\r\n\r\n{\"iso\":400}";
		const HttpWire::HeadParse p = HttpWire::parseHead(full);
		QCOMPARE(p.state, HttpWire::HeadParse::State::Complete);
		QCOMPARE(p.request.method, QString("POST"));
		QCOMPARE(p.request.path, QString("/api/v1/camera"));
		QCOMPARE(p.request.query, QString("x=1"));
		QCOMPARE(p.contentLength, qint64(12));
		QCOMPARE(p.request.header("Authorization"), QByteArray("Bearer t"));

		QCOMPARE(HttpWire::parseHead("garbage\r\n\r\n").state, HttpWire::HeadParse::State::Invalid);
	}
};

QTEST_GUILESS_MAIN(TestHttpRouter)
#include "tst_httprouter.moc"
