#pragma once
#include <QString>

#include "server/HttpRouter.hpp"

class CameraControl;
class LogDatabase;

namespace ApiPath {
	inline constexpr const char* Status         = "/api/v1/status";
	inline constexpr const char* Capabilities   = "/api/v1/capabilities";
	inline constexpr const char* VideoSettings  = "/api/v1/video/settings";
	inline constexpr const char* StreamStart    = "/api/v1/stream/start";
	inline constexpr const char* StreamStop     = "/api/v1/stream/stop";
	inline constexpr const char* Camera         = "/api/v1/camera";
	inline constexpr const char* WbMeasure      = "/api/v1/camera/wb/measure";
	inline constexpr const char* TorchLevel     = "/api/v1/torch/level";
	inline constexpr const char* ForceKeyframe  = "/api/v1/encoder/force_keyframe";
	inline constexpr const char* Brightness     = "/api/v1/screen/brightness";
	inline constexpr const char* Alias          = "/api/v1/settings/alias";
	inline constexpr const char* Logs           = "/api/v1/logs";
	inline constexpr const char* LogsZip        = "/api/v1/logs.zip";
	inline constexpr const char* WebSocket      = "/ws";
}

// REST surface of one device. Each handler validates its body, calls one
// CameraControl operation and maps a failure to the endpoint's error code.
class ApiHandlers {
public:
	explicit ApiHandlers(CameraControl& camera, LogDatabase* logs = nullptr);

	void registerRoutes(HttpRouter& router);

	HttpResponse getStatus(const HttpRequest& req);
	HttpResponse getCapabilities(const HttpRequest& req);
	HttpResponse getVideoSettings(const HttpRequest& req);
	HttpResponse putVideoSettings(const HttpRequest& req);
	HttpResponse startStream(const HttpRequest& req);
	HttpResponse stopStream(const HttpRequest& req);
	HttpResponse updateCamera(const HttpRequest& req);
	HttpResponse measureWhiteBalance(const HttpRequest& req);
	HttpResponse getTorchLevel(const HttpRequest& req);
	HttpResponse putTorchLevel(const HttpRequest& req);
	HttpResponse forceKeyframe(const HttpRequest& req);
	HttpResponse setBrightness(const HttpRequest& req);
	HttpResponse putAlias(const HttpRequest& req);
	HttpResponse getLogs(const HttpRequest& req);
	HttpResponse getLogsZip(const HttpRequest& req);
	HttpResponse getIndex(const HttpRequest& req);

private:
	CameraControl& camera_;
	LogDatabase* logs_;
};
