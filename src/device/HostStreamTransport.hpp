#pragma once
#include <QElapsedTimer>
#include <QString>

#include "device/StreamTransport.hpp"

// Stand-in pipeline for hosts without a capture/encode stack. Stream state is
// simulated; health values come from sysfs/procfs where available.
class HostStreamTransport : public StreamTransport {
public:
	HostStreamTransport() = default;

	bool start(const StreamStartRequest& config, QString& errorString) override;
	bool stop(QString& errorString) override;
	bool forceKeyframe(QString& errorString) override;
	bool updateSettings(const CurrentSettings& settings, QString& errorString) override;
	bool measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString) override;
	bool setTorch(double level, QString& errorString) override;
	Telemetry currentTelemetry() override;
	bool isStreaming() const override { return streaming_; }

	qint64 keyframeCount() const { return keyframes_; }

private:
	// Utils
	static QString readAll(const QString& path);
	static double readCpuTempC();
	static int readWifiRssi();
	double readBattery(ChargingState* state) const;
	double sampleCpuUsage();

private:
	bool streaming_ = false;
	StreamStartRequest config_;
	QElapsedTimer uptime_;
	qint64 keyframes_ = 0;
	qint64 wbKelvin_ = 5000;
	double wbTint_ = 0.0;

	// /proc/stat previous sample
	quint64 prevIdle_ = 0;
	quint64 prevTotal_ = 0;
};
