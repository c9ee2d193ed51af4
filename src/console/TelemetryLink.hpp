#pragma once
#include <QHash>
#include <QObject>
#include <QString>

#include "config/ConsoleConfig.hpp"
#include "console/FleetTypes.hpp"

class DeviceRegistry;
class QTimer;
class QWebSocket;

// Keeps a /ws connection per claimed device and stores the latest
// TelemetryFrame on the registry. Dropped links reconnect with backoff.
class TelemetryLink : public QObject {
	Q_OBJECT
public:
	explicit TelemetryLink(DeviceRegistry& registry, const AlertThresholds& alerts,
	                       QObject* parent = nullptr);
	~TelemetryLink() override;

	void start();
	void stop();

	bool isConnected(const QString& id) const;
	int linkCount() const { return links_.size(); }

	// 2 s * 2^min(attempt, 5), capped at 30 s
	static int backoffMs(int attempt);

	// True when this frame crosses the threshold from below.
	static bool crossesThreshold(bool wasHot, double tempC, double thresholdC) { return !wasHot && tempC > thresholdC; }

signals:
	void frameReceived(const QString& id, const TelemetryFrame& frame);
	void temperatureAlert(const QString& id, double tempC);
	void cpuAlert(const QString& id, double cpuPercent);
	void linkStateChanged(const QString& id, bool connected);

private:
	struct Link {
		QWebSocket* socket = nullptr;
		QTimer* retry = nullptr;
		int attempt = 0;
		bool hot = false;
		bool cpuHot = false;
	};

	void open_(const QString& id);
	void close_(const QString& id);
	void scheduleReconnect_(const QString& id);
	void handleText_(const QString& id, const QString& message);

private:
	DeviceRegistry& registry_;
	AlertThresholds alerts_;
	QHash<QString, Link> links_;
	bool running_ = false;
};
