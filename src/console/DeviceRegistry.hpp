#pragma once
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <functional>
#include <optional>

#include "console/DeviceClient.hpp"
#include "console/FleetTypes.hpp"

// Claimed devices, persisted as devices.json and polled for status.
// All access happens on the thread owning the registry.
class DeviceRegistry : public QObject {
	Q_OBJECT
public:
	using ClaimCallback = std::function<void(bool ok, const QString& idOrError)>;
	using RefreshCallback = std::function<void(bool ok)>;

	explicit DeviceRegistry(DeviceClient& client, const QString& storePath,
	                        int offlineAfterFailures = 3, QObject* parent = nullptr);

	// Missing file is an empty registry. Loaded devices start offline.
	bool load(QString& errorString);
	bool save(QString& errorString) const;

	// Queries GET /api/v1/status first; only a reachable device is added.
	void claim(const QString& host, quint16 port, const QString& token, ClaimCallback cb);
	bool unclaim(const QString& id, QString& errorString);
	bool clear(QString& errorString);

	bool contains(const QString& id) const { return devices_.contains(id); }
	std::optional<Device> device(const QString& id) const;
	QList<Device> devices() const;
	QStringList ids() const { return order_; }
	QStringList claimedAliases() const;
	int count() const { return order_.size(); }

	bool setAlias(const QString& id, const QString& alias, QString& errorString);
	void recordStreamSettings(const QString& id, const StreamStartRequest& settings);
	void recordCameraSettings(const QString& id, const CameraSettingsRequest& settings);
	void recordTelemetry(const QString& id, const TelemetryFrame& frame);

	// Always re-queries the device; cached status is never reported as fresh.
	void refreshDevice(const QString& id, RefreshCallback done = {});
	// One round over every claimed device. A device whose previous refresh is
	// still in flight sits the round out; refreshFinished fires per round.
	void refreshAll();
	bool isRefreshing(const QString& id) const { return refreshing_.contains(id); }

	void startAutoRefresh(int intervalMs);
	void stopAutoRefresh();

	static DeviceEndpoint endpointOf(const Device& d) { return DeviceEndpoint{d.host, d.port, d.token}; }

signals:
	void deviceAdded(const QString& id);
	void deviceRemoved(const QString& id);
	void deviceUpdated(const QString& id);
	void livenessChanged(const QString& id, DeviceLiveness liveness);
	void refreshFinished();

private:
	void markSuccess_(const QString& id, const StatusResponse& status);
	void markFailure_(const QString& id, const QString& error);
	void persist_();

private:
	DeviceClient& client_;
	QString storePath_;
	int offlineAfterFailures_;

	QHash<QString, Device> devices_;
	QStringList order_;         // claim order
	QTimer refreshTimer_;
	QSet<QString> refreshing_;  // ids with a status request in flight
};
