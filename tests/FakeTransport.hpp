#pragma once
#include <QString>
#include <QThread>

#include "device/StreamTransport.hpp"

// Scripted pipeline: records calls, fails on demand.
class FakeTransport : public StreamTransport {
public:
	bool start(const StreamStartRequest& config, QString& errorString) override
	{
		++startCalls;
		if (startDelayMs > 0) QThread::msleep(startDelayMs);   // slow encoder bring-up
		if (!failStart.isEmpty()) { errorString = failStart; return false; }
		lastStart = config;
		streaming = true;
		return true;
	}
	bool stop(QString&) override { streaming = false; ++stopCalls; return true; }
	bool forceKeyframe(QString&) override { ++keyframes; return true; }
	bool updateSettings(const CurrentSettings& settings, QString& errorString) override
	{
		if (!failSettings.isEmpty()) { errorString = failSettings; return false; }
		lastSettings = settings;
		++settingsCalls;
		return true;
	}
	bool measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString) override
	{
		if (!failMeasure.isEmpty()) { errorString = failMeasure; return false; }
		out = measured;
		return true;
	}
	bool setTorch(double level, QString& errorString) override
	{
		if (!failTorch.isEmpty()) { errorString = failTorch; return false; }
		lastTorch = level;
		++torchCalls;
		return true;
	}
	Telemetry currentTelemetry() override { return telemetry; }
	bool isStreaming() const override { return streaming; }

	bool streaming = false;
	int startCalls = 0;
	int stopCalls = 0;
	int keyframes = 0;
	int settingsCalls = 0;
	int torchCalls = 0;
	unsigned long startDelayMs = 0;
	QString failStart;
	QString failSettings;
	QString failMeasure;
	QString failTorch;
	StreamStartRequest lastStart;
	CurrentSettings lastSettings;
	WhiteBalanceMeasurement measured{4300, -2.5};
	double lastTorch = 0.0;
	Telemetry telemetry;
};
