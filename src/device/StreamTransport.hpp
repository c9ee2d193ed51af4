#pragma once
#include <QString>

#include "protocol/ApiModels.hpp"

// Capture/encode/transmit pipeline. CameraService serializes every call
// through its I/O mutex, so implementations need not lock themselves.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    virtual bool start(const StreamStartRequest& config, QString& errorString) = 0;
    virtual bool stop(QString& errorString) = 0;
    virtual bool forceKeyframe(QString& errorString) = 0;
    virtual bool updateSettings(const CurrentSettings& settings, QString& errorString) = 0;
    // Switches to auto white balance, lets it settle and reads the scene back.
    virtual bool measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString) = 0;
    virtual bool setTorch(double level, QString& errorString) = 0;
    virtual Telemetry currentTelemetry() = 0;
    virtual bool isStreaming() const = 0;
};
