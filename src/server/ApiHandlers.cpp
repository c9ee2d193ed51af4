#include "ApiHandlers.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>
#include <QVector>
#include <QDebug>

#include "device/CameraControl.hpp"
#include "include/LogDtos.hpp"
#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/ApiModels.hpp"
#include "protocol/JsonFields.hpp"
#include "services/LogDatabase.hpp"

namespace {

QJsonObject requireBody(const HttpRequest& req)
{
	if (!req.hasBody()) throw ApiError::missingBody();
	return JsonFields::parseObject(req.body);
}

HttpResponse ok(const QJsonObject& obj)
{
	return HttpResponse::jsonBody(200, JsonFields::encodeCompact(obj));
}

HttpResponse success(const QString& message)
{
	return ok(successJson(message));
}

const char kIndexPage[] = R"(<!doctype html>
<html><head><meta charset="utf-8"><title>camfleet device</title>
<style>body{font-family:sans-serif;margin:2em}pre{background:#eee;padding:1em}</style></head>
<body><h1>camfleet device</h1>
<p><button onclick="post('/api/v1/stream/start',{resolution:'1920x1080',framerate:30,bitrate:10000000,codec:'h264'})">Start</button>
<button onclick="post('/api/v1/stream/stop')">Stop</button></p>
<pre id="status">loading...</pre><pre id="telemetry"></pre>
<script>
function post(p,b){fetch(p,{method:'POST',headers:{'Content-Type':'application/json'},body:b?JSON.stringify(b):null}).then(refresh);}
function refresh(){fetch('/api/v1/status').then(r=>r.json()).then(j=>{document.getElementById('status').textContent=JSON.stringify(j,null,2);});}
var ws=new WebSocket('ws://'+location.host+'/ws');
ws.onmessage=function(e){document.getElementById('telemetry').textContent=e.data;};
refresh();
</script></body></html>
)";

} // namespace

ApiHandlers::ApiHandlers(CameraControl& camera, LogDatabase* logs)
	: camera_(camera)
	, logs_(logs)
{
}

void ApiHandlers::registerRoutes(HttpRouter& router)
{
	auto bind = [this](HttpResponse (ApiHandlers::*fn)(const HttpRequest&)) {
		return [this, fn](const HttpRequest& req) { return (this->*fn)(req); };
	};

	router.addRoute("GET",  ApiPath::Status,        bind(&ApiHandlers::getStatus));
	router.addRoute("GET",  ApiPath::Capabilities,  bind(&ApiHandlers::getCapabilities));
	router.addRoute("GET",  ApiPath::VideoSettings, bind(&ApiHandlers::getVideoSettings));
	router.addRoute("PUT",  ApiPath::VideoSettings, bind(&ApiHandlers::putVideoSettings));
	router.addRoute("POST", ApiPath::StreamStart,   bind(&ApiHandlers::startStream));
	router.addRoute("POST", ApiPath::StreamStop,    bind(&ApiHandlers::stopStream));
	router.addRoute("POST", ApiPath::Camera,        bind(&ApiHandlers::updateCamera));
	router.addRoute("POST", ApiPath::WbMeasure,     bind(&ApiHandlers::measureWhiteBalance));
	router.addRoute("GET",  ApiPath::TorchLevel,    bind(&ApiHandlers::getTorchLevel));
	router.addRoute("PUT",  ApiPath::TorchLevel,    bind(&ApiHandlers::putTorchLevel));
	router.addRoute("POST", ApiPath::ForceKeyframe, bind(&ApiHandlers::forceKeyframe));
	router.addRoute("POST", ApiPath::Brightness,    bind(&ApiHandlers::setBrightness));
	router.addRoute("PUT",  ApiPath::Alias,         bind(&ApiHandlers::putAlias));
	router.addRoute("GET",  ApiPath::Logs,          bind(&ApiHandlers::getLogs));
	router.addRoute("GET",  ApiPath::LogsZip,       bind(&ApiHandlers::getLogsZip));
	router.addRoute("GET",  "/",                    bind(&ApiHandlers::getIndex));
}

HttpResponse ApiHandlers::getStatus(const HttpRequest&)
{
	return ok(camera_.status().toJson());
}

HttpResponse ApiHandlers::getCapabilities(const HttpRequest&)
{
	const QJsonArray arr = capabilitiesToJson(camera_.capabilities());
	return HttpResponse::jsonBody(200, QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

HttpResponse ApiHandlers::getVideoSettings(const HttpRequest&)
{
	return ok(camera_.videoSettings().toResponseJson(camera_.videoPresets()));
}

HttpResponse ApiHandlers::putVideoSettings(const HttpRequest& req)
{
	const VideoSettings settings = VideoSettings::fromJson(requireBody(req));

	if (settings.selectedPresetId) {
		bool known = false;
		for (const auto& p : camera_.videoPresets()) known = known || p.id == *settings.selectedPresetId;
		if (!known)
			throw ApiError::invalidRequest(QStringLiteral("unknown preset '%1'").arg(*settings.selectedPresetId));
	}

	QString err;
	if (!camera_.updateVideoSettings(settings, err))
		throw ApiError::upstream(ErrorCode::VideoSettingsFailed, QStringLiteral("Failed to update video settings: %1").arg(err));
	return success(QStringLiteral("Video settings updated"));
}

HttpResponse ApiHandlers::startStream(const HttpRequest& req)
{
	const StreamStartRequest start = StreamStartRequest::fromJson(requireBody(req));

	QString err;
	if (!camera_.startStream(start, err))
		throw ApiError::upstream(ErrorCode::StreamStartFailed, QStringLiteral("Failed to start stream: %1").arg(err));
	return success(QStringLiteral("Stream started"));
}

HttpResponse ApiHandlers::stopStream(const HttpRequest&)
{
	QString err;
	if (!camera_.stopStream(err))
		throw ApiError::upstream(ErrorCode::StreamStopFailed, QStringLiteral("Failed to stop stream: %1").arg(err));
	return success(QStringLiteral("Stream stopped"));
}

HttpResponse ApiHandlers::updateCamera(const HttpRequest& req)
{
	const CameraSettingsRequest settings = CameraSettingsRequest::fromJson(requireBody(req));

	QString err;
	if (!camera_.updateCameraSettings(settings, err))
		throw ApiError::upstream(ErrorCode::CameraUpdateFailed, QStringLiteral("Failed to update camera: %1").arg(err));
	return success(QStringLiteral("Camera settings updated"));
}

// body is ignored
HttpResponse ApiHandlers::measureWhiteBalance(const HttpRequest&)
{
	WhiteBalanceMeasurement m;
	QString err;
	if (!camera_.measureWhiteBalance(m, err))
		throw ApiError::upstream(ErrorCode::MeasureFailed, QStringLiteral("Measurement failed: %1").arg(err));
	return ok(m.toJson());
}

HttpResponse ApiHandlers::getTorchLevel(const HttpRequest&)
{
	return ok(TorchLevelResponse{camera_.torchLevel()}.toJson());
}

HttpResponse ApiHandlers::putTorchLevel(const HttpRequest& req)
{
	const TorchLevelRequest r = TorchLevelRequest::fromJson(requireBody(req));

	QString err;
	if (!camera_.setTorchLevel(r.level, err))
		throw ApiError::upstream(ErrorCode::TorchUpdateFailed, QStringLiteral("Torch update failed: %1").arg(err));
	return ok(TorchLevelResponse{camera_.torchLevel()}.toJson());
}

HttpResponse ApiHandlers::forceKeyframe(const HttpRequest&)
{
	QString err;
	if (!camera_.forceKeyframe(err))
		throw ApiError::upstream(ErrorCode::KeyframeFailed, QStringLiteral("Failed to force keyframe: %1").arg(err));
	return success(QStringLiteral("Keyframe requested"));
}

HttpResponse ApiHandlers::setBrightness(const HttpRequest& req)
{
	const ScreenBrightnessRequest r = ScreenBrightnessRequest::fromJson(requireBody(req));

	QString err;
	if (!camera_.setScreenDimmed(r.dimmed, err))
		throw ApiError::upstream(ErrorCode::BrightnessFailed, QStringLiteral("Failed to update screen brightness: %1").arg(err));
	return success(QStringLiteral("Screen brightness updated"));
}

HttpResponse ApiHandlers::putAlias(const HttpRequest& req)
{
	const AliasUpdateRequest r = AliasUpdateRequest::fromJson(requireBody(req));

	QString err;
	if (!camera_.updateAlias(r.alias, err))
		throw ApiError::upstream(ErrorCode::AliasUpdateFailed, QStringLiteral("Failed to update alias: %1").arg(err));
	return ok(QJsonObject{{"alias", r.alias}});
}

// GET /api/v1/logs?limit=100&min_level=1&tag=HTTP
HttpResponse ApiHandlers::getLogs(const HttpRequest& req)
{
	if (!logs_)
		throw ApiError::notImplemented(QStringLiteral("System log is not enabled on this device"));

	const QUrlQuery q(req.query);
	bool okLimit = false;
	int limit = q.queryItemValue(QStringLiteral("limit")).toInt(&okLimit);
	if (!okLimit || limit <= 0) limit = 100;
	limit = qMin(limit, 1000);
	const int minLevel = qBound(0, q.queryItemValue(QStringLiteral("min_level")).toInt(), 4);
	const QString tag = q.queryItemValue(QStringLiteral("tag"));

	QVector<SystemLog> rows;
	int total = 0;
	if (!logs_->selectSystemLogs(0, limit, minLevel, tag, QString(), &rows, &total))
		throw ApiError::internal(QStringLiteral("system log query failed"));

	QJsonArray entries;
	for (const auto& r : rows) entries.append(r.toJson());
	return ok(QJsonObject{{"count", entries.size()}, {"total", total}, {"entries", entries}});
}

HttpResponse ApiHandlers::getLogsZip(const HttpRequest&)
{
	throw ApiError::notImplemented(QStringLiteral("Log archive export is not implemented"));
}

HttpResponse ApiHandlers::getIndex(const HttpRequest&)
{
	return HttpResponse::html(200, QByteArray(kIndexPage));
}
