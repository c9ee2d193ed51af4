#pragma once
#include <QList>
#include <QString>

#include "protocol/ApiModels.hpp"

// Operation set the control server drives. Handlers call exactly one
// mutating operation per request and may do so from pool threads.
class CameraControl {
public:
    virtual ~CameraControl() = default;

    virtual StatusResponse status() = 0;
    virtual QList<Capability> capabilities() = 0;
    virtual QList<VideoPreset> videoPresets() = 0;
    virtual VideoSettings videoSettings() = 0;
    virtual Telemetry currentTelemetry() = 0;
    virtual NdiState streamState() = 0;

    virtual bool updateVideoSettings(const VideoSettings& settings, QString& errorString) = 0;
    virtual bool startStream(const StreamStartRequest& request, QString& errorString) = 0;
    virtual bool stopStream(QString& errorString) = 0;
    virtual bool updateCameraSettings(const CameraSettingsRequest& request, QString& errorString) = 0;
    virtual bool forceKeyframe(QString& errorString) = 0;
    virtual bool setScreenDimmed(bool dimmed, QString& errorString) = 0;
    virtual bool updateAlias(const QString& alias, QString& errorString) = 0;
    virtual bool measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString) = 0;
    virtual double torchLevel() = 0;
    virtual bool setTorchLevel(double level, QString& errorString) = 0;
};
