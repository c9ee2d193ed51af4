#ifndef CAMERASERVICE_HPP
#define CAMERASERVICE_HPP

#include <QObject>
#include <QMutex>
#include <QString>
#include <memory>

#include "device/CameraControl.hpp"
#include "device/StreamTransport.hpp"

// Owns the device-side camera state (alias, current settings, video
// settings, screen dim) and drives the StreamTransport.
//
// Two locks: ioMutex_ serializes the mutating operations end to end
// (transport, backlight and state file I/O), mutex_ guards the fields and is
// only held to copy them. Readers never wait on ioMutex_; telemetry and
// stream state fall back to the last sample while an operation is running.
// Lock order: ioMutex_, then mutex_.
class CameraService : public QObject, public CameraControl {
	Q_OBJECT
public:
	explicit CameraService(std::unique_ptr<StreamTransport> transport,
	                       const QString& alias,
	                       QObject* parent = nullptr);
	~CameraService() override;

	// Optional JSON file for alias + video settings; loaded immediately.
	void setStatePath(const QString& path);
	void setBacklightPath(const QString& path) { backlightPath_ = path; }
	void setCapabilities(const QList<Capability>& caps);

	QString alias();
	bool screenDimmed();
	CurrentSettings currentSettings();

	// CameraControl
	StatusResponse status() override;
	QList<Capability> capabilities() override;
	QList<VideoPreset> videoPresets() override;
	VideoSettings videoSettings() override;
	Telemetry currentTelemetry() override;
	NdiState streamState() override;

	bool updateVideoSettings(const VideoSettings& settings, QString& errorString) override;
	bool startStream(const StreamStartRequest& request, QString& errorString) override;
	bool stopStream(QString& errorString) override;
	bool updateCameraSettings(const CameraSettingsRequest& request, QString& errorString) override;
	bool forceKeyframe(QString& errorString) override;
	bool setScreenDimmed(bool dimmed, QString& errorString) override;
	bool updateAlias(const QString& alias, QString& errorString) override;
	bool measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString) override;
	double torchLevel() override;
	bool setTorchLevel(double level, QString& errorString) override;

	static QList<Capability> defaultCapabilities();

signals:
	void aliasChanged(const QString& alias);
	void streamStateChanged(NdiState state);

private:
	bool loadState_();
	bool saveState_(const QString& alias, const VideoSettings& video);
	bool writeBacklight_(bool dimmed, QString& errorString);

private:
	QMutex ioMutex_;
	QMutex mutex_;
	std::unique_ptr<StreamTransport> transport_;

	// last transport sample
	bool streaming_ = false;
	Telemetry telemetry_;

	QString alias_;
	CurrentSettings current_;
	VideoSettings video_;
	QList<Capability> caps_;
	QList<VideoPreset> presets_;
	std::optional<double> torchLevel_;
	QString orientationLock_;
	bool dimmed_ = false;

	QString statePath_;
	QString backlightPath_;
};

#endif // CAMERASERVICE_HPP
