#pragma once
#include <QObject>
#include <QTimer>

class CameraControl;
class WebSocketHub;

// Pushes one TelemetryFrame per interval to every hub client.
class TelemetryBroadcaster : public QObject {
	Q_OBJECT
public:
	explicit TelemetryBroadcaster(CameraControl& camera, WebSocketHub& hub,
	                              int intervalMs = 1000, QObject* parent = nullptr);

	void start();
	void stop();
	bool isActive() const { return timer_.isActive(); }

public slots:
	// Returns false when the frame could not be encoded; the tick is skipped.
	bool tick();

signals:
	void frameSent(int clients);

private:
	CameraControl& camera_;
	WebSocketHub& hub_;
	QTimer timer_;
};
