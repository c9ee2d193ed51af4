#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

#include "console/DeviceClient.hpp"
#include "console/FleetTypes.hpp"

class DeviceRegistry;

// Resolves device ids through the registry and fans commands out over one
// DeviceClient. Group forms return exactly one entry per distinct requested
// id, in request order, once every call has settled.
class CommandOrchestrator : public QObject {
	Q_OBJECT
public:
	using ResultCallback = std::function<void(const GroupOperationResult&)>;
	using GroupCallback = std::function<void(const GroupResults&)>;
	using DeviceOp = std::function<void(const QString& id, ResultCallback)>;

	explicit CommandOrchestrator(DeviceRegistry& registry, DeviceClient& client,
	                             QObject* parent = nullptr);

	// single device
	void startStream(const QString& id, const StreamStartRequest& req, ResultCallback cb);
	void stopStream(const QString& id, ResultCallback cb);
	void updateCameraSettings(const QString& id, const CameraSettingsRequest& req, ResultCallback cb);
	void updateVideoSettings(const QString& id, const VideoSettings& settings, ResultCallback cb);
	void forceKeyframe(const QString& id, ResultCallback cb);
	void setScreenDimmed(const QString& id, bool dimmed, ResultCallback cb);
	void updateAlias(const QString& id, const QString& alias, ResultCallback cb);
	// result data carries {scene_cct_k, tint}
	void measureWhiteBalance(const QString& id, ResultCallback cb);
	// result data carries {current_level}
	void setTorchLevel(const QString& id, double level, ResultCallback cb);
	// camera settings, then video settings; fails on the first failing step
	void applyBundle(const QString& id, const SettingsBundle& bundle, ResultCallback cb);

	// groups
	void startStreamGroup(const QStringList& ids, const StreamStartRequest& req, GroupCallback done);
	void stopStreamGroup(const QStringList& ids, GroupCallback done);
	void updateCameraSettingsGroup(const QStringList& ids, const CameraSettingsRequest& req, GroupCallback done);
	void updateVideoSettingsGroup(const QStringList& ids, const VideoSettings& settings, GroupCallback done);
	void forceKeyframeGroup(const QStringList& ids, GroupCallback done);
	void setScreenDimmedGroup(const QStringList& ids, bool dimmed, GroupCallback done);
	void measureWhiteBalanceGroup(const QStringList& ids, GroupCallback done);
	void setTorchLevelGroup(const QStringList& ids, double level, GroupCallback done);
	void applyBundleGroup(const QStringList& ids, const SettingsBundle& bundle, GroupCallback done);

	// every claimed device; start uses each device's last stream settings
	void startAll(GroupCallback done);
	void stopAll(GroupCallback done);

	void runGroup(const QString& operation, const QStringList& ids, const DeviceOp& op, GroupCallback done);

	static QStringList distinctIds(const QStringList& ids);
	static GroupOperationResult failed(const QString& id, DeviceFailureKind kind, const QString& detail);

signals:
	void groupFinished(const QString& operation, int succeeded, int failed);

private:
	using SuccessHook = std::function<void(const QString& id)>;
	void call_(const QString& id, const QByteArray& verb, const QString& path,
	           const QJsonObject& body, const SuccessHook& onSuccess, ResultCallback cb);

private:
	DeviceRegistry& registry_;
	DeviceClient& client_;
};
