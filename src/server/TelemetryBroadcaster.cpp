#include "TelemetryBroadcaster.hpp"

#include "device/CameraControl.hpp"
#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"
#include "server/WebSocketHub.hpp"

TelemetryBroadcaster::TelemetryBroadcaster(CameraControl& camera, WebSocketHub& hub,
                                           int intervalMs, QObject* parent)
	: QObject(parent)
	, camera_(camera)
	, hub_(hub)
{
	timer_.setInterval(qMax(1, intervalMs));
	connect(&timer_, &QTimer::timeout, this, &TelemetryBroadcaster::tick);
}

void TelemetryBroadcaster::start()
{
	if (!timer_.isActive()) timer_.start();
}

void TelemetryBroadcaster::stop()
{
	timer_.stop();
}

bool TelemetryBroadcaster::tick()
{
	// 클라이언트가 없으면 센서 읽기도 생략
	if (hub_.clientCount() == 0) return true;

	const TelemetryFrame frame = TelemetryFrame::from(camera_.currentTelemetry(), camera_.streamState());

	QByteArray encoded;
	try {
		encoded = JsonFields::encodeCompact(frame.toJson());
	} catch (const ApiError& e) {
		qCWarning(LC_WS) << "[Telemetry] frame skipped:" << e.message();
		return false;
	}

	const int delivered = hub_.broadcast(QString::fromUtf8(encoded));
	emit frameSent(delivered);
	return true;
}
