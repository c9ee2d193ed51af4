#include "DeviceRegistry.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QPointer>
#include <QSaveFile>
#include <QDebug>
#include <memory>

#include "include/fleet_logging.hpp"
#include "log/SystemLogger.hpp"
#include "protocol/ApiError.hpp"

namespace {
const QString kStatusPath = QStringLiteral("/api/v1/status");
}

DeviceRegistry::DeviceRegistry(DeviceClient& client, const QString& storePath,
                               int offlineAfterFailures, QObject* parent)
	: QObject(parent)
	, client_(client)
	, storePath_(storePath)
	, offlineAfterFailures_(qMax(1, offlineAfterFailures))
{
	connect(&refreshTimer_, &QTimer::timeout, this, &DeviceRegistry::refreshAll);
}

bool DeviceRegistry::load(QString& errorString)
{
	QFile f(storePath_);
	if (!f.exists()) return true;
	if (!f.open(QIODevice::ReadOnly)) {
		errorString = QStringLiteral("cannot open %1: %2").arg(storePath_, f.errorString());
		return false;
	}

	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
		errorString = QStringLiteral("%1: invalid JSON (%2)").arg(storePath_, perr.errorString());
		return false;
	}

	devices_.clear();
	order_.clear();
	const QJsonArray arr = doc.object().value("devices").toArray();
	for (const QJsonValue& v : arr) {
		try {
			const Device d = Device::fromJson(v.toObject());
			if (devices_.contains(d.id)) continue;
			devices_.insert(d.id, d);
			order_.append(d.id);
		} catch (const ApiError& e) {
			// 깨진 항목만 건너뜀
			qCWarning(LC_REGISTRY) << "[DeviceRegistry] skipping stored device:" << e.message();
		}
	}
	qCInfo(LC_REGISTRY) << "[DeviceRegistry] loaded" << order_.size() << "device(s) from" << storePath_;
	return true;
}

bool DeviceRegistry::save(QString& errorString) const
{
	QJsonArray arr;
	for (const QString& id : order_)
		arr.append(devices_.value(id).toJson());

	QDir().mkpath(QFileInfo(storePath_).absolutePath());
	QSaveFile sf(storePath_);
	if (!sf.open(QIODevice::WriteOnly)) {
		errorString = QStringLiteral("cannot write %1: %2").arg(storePath_, sf.errorString());
		return false;
	}
	sf.write(QJsonDocument(QJsonObject{{"devices", arr}}).toJson(QJsonDocument::Indented));
	if (!sf.commit()) {
		errorString = QStringLiteral("commit %1 failed: %2").arg(storePath_, sf.errorString());
		return false;
	}
	return true;
}

void DeviceRegistry::persist_()
{
	QString err;
	if (!save(err))
		qCCritical(LC_REGISTRY) << "[DeviceRegistry]" << err;
}

void DeviceRegistry::claim(const QString& host, quint16 port, const QString& token, ClaimCallback cb)
{
	const QString trimmedHost = host.trimmed();
	if (trimmedHost.isEmpty() || port == 0) {
		cb(false, QStringLiteral("invalid address %1:%2").arg(host).arg(port));
		return;
	}

	const DeviceEndpoint ep{trimmedHost, port, token};
	QPointer<DeviceRegistry> guard(this);
	client_.get(ep, kStatusPath, [this, guard, ep, cb](const DeviceReply& reply) {
		if (!guard) return;
		const QString id = Device::makeId(ep.host, ep.port);

		if (!reply.ok()) {
			qCInfo(LC_REGISTRY) << "[DeviceRegistry] claim of" << id << "failed:" << reply.errorString();
			cb(false, reply.errorString());
			return;
		}

		StatusResponse status;
		try {
			const auto o = reply.json();
			if (!o) throw ApiError::invalidRequest(QStringLiteral("status body is not an object"));
			status = StatusResponse::fromJson(*o);
		} catch (const ApiError& e) {
			cb(false, QStringLiteral("PROTOCOL: %1").arg(e.message()));
			return;
		}

		const bool existed = devices_.contains(id);
		Device d = existed ? devices_.value(id) : Device();
		d.id = id;
		d.host = ep.host;
		d.port = ep.port;
		d.token = ep.token;
		d.alias = status.alias;
		d.status = status;
		d.liveness = DeviceLiveness::Online;
		d.consecutiveFailures = 0;
		devices_.insert(id, d);
		if (!existed) order_.append(id);
		persist_();

		SystemLogger::info("REGISTRY", QStringLiteral("claimed %1 (%2)").arg(id, d.alias));
		if (existed) emit deviceUpdated(id);
		else emit deviceAdded(id);
		cb(true, id);
	});
}

bool DeviceRegistry::unclaim(const QString& id, QString& errorString)
{
	if (!devices_.contains(id)) {
		errorString = QStringLiteral("Device not found: %1").arg(id);
		return false;
	}
	devices_.remove(id);
	order_.removeAll(id);
	persist_();

	SystemLogger::info("REGISTRY", QStringLiteral("unclaimed %1").arg(id));
	emit deviceRemoved(id);
	return true;
}

bool DeviceRegistry::clear(QString& errorString)
{
	const QStringList removed = order_;
	devices_.clear();
	order_.clear();

	if (QFile::exists(storePath_) && !QFile::remove(storePath_)) {
		errorString = QStringLiteral("cannot remove %1").arg(storePath_);
		return false;
	}
	for (const QString& id : removed)
		emit deviceRemoved(id);
	return true;
}

std::optional<Device> DeviceRegistry::device(const QString& id) const
{
	const auto it = devices_.constFind(id);
	if (it == devices_.constEnd()) return std::nullopt;
	return it.value();
}

QList<Device> DeviceRegistry::devices() const
{
	QList<Device> out;
	out.reserve(order_.size());
	for (const QString& id : order_)
		out.append(devices_.value(id));
	return out;
}

QStringList DeviceRegistry::claimedAliases() const
{
	QStringList out;
	for (const QString& id : order_) {
		const QString a = devices_.value(id).alias;
		if (!a.isEmpty()) out.append(a);
	}
	return out;
}

bool DeviceRegistry::setAlias(const QString& id, const QString& alias, QString& errorString)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) {
		errorString = QStringLiteral("Device not found: %1").arg(id);
		return false;
	}
	it->alias = alias;
	persist_();
	emit deviceUpdated(id);
	return true;
}

void DeviceRegistry::recordStreamSettings(const QString& id, const StreamStartRequest& settings)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) return;
	it->streamSettings = settings;
	persist_();
}

void DeviceRegistry::recordCameraSettings(const QString& id, const CameraSettingsRequest& settings)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) return;
	CameraSettingsRequest merged = it->cameraSettings.value_or(CameraSettingsRequest());
	merged.mergeFrom(settings);
	it->cameraSettings = merged;
	persist_();
}

void DeviceRegistry::recordTelemetry(const QString& id, const TelemetryFrame& frame)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) return;
	it->telemetry = frame;
	emit deviceUpdated(id);
}

void DeviceRegistry::refreshDevice(const QString& id, RefreshCallback done)
{
	const auto it = devices_.constFind(id);
	if (it == devices_.constEnd()) {
		if (done) done(false);
		return;
	}

	QPointer<DeviceRegistry> guard(this);
	client_.get(endpointOf(it.value()), kStatusPath, [this, guard, id, done](const DeviceReply& reply) {
		if (!guard) return;
		bool ok = false;
		if (!reply.ok()) {
			markFailure_(id, reply.errorString());
		} else {
			try {
				const auto o = reply.json();
				if (!o) throw ApiError::invalidRequest(QStringLiteral("status body is not an object"));
				markSuccess_(id, StatusResponse::fromJson(*o));
				ok = true;
			} catch (const ApiError& e) {
				markFailure_(id, QStringLiteral("PROTOCOL: %1").arg(e.message()));
			}
		}
		if (done) done(ok);
	});
}

void DeviceRegistry::refreshAll()
{
	QStringList ids;
	for (const QString& id : order_) {
		if (!refreshing_.contains(id)) ids.append(id);
	}
	if (ids.size() < order_.size())
		qCDebug(LC_REGISTRY) << "[DeviceRegistry]" << order_.size() - ids.size() << "device(s) still refreshing, skipped this round";
	if (ids.isEmpty()) {
		emit refreshFinished();
		return;
	}

	auto pending = std::make_shared<int>(ids.size());
	for (const QString& id : ids) {
		refreshing_.insert(id);
		refreshDevice(id, [this, id, pending](bool) {
			refreshing_.remove(id);
			if (--*pending == 0)
				emit refreshFinished();
		});
	}
}

void DeviceRegistry::startAutoRefresh(int intervalMs)
{
	refreshTimer_.start(qMax(100, intervalMs));
	refreshAll();
}

void DeviceRegistry::stopAutoRefresh()
{
	refreshTimer_.stop();
}

void DeviceRegistry::markSuccess_(const QString& id, const StatusResponse& status)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) return;   // unclaimed while in flight

	const DeviceLiveness before = it->liveness;
	const bool aliasChanged = !status.alias.isEmpty() && status.alias != it->alias;
	it->status = status;
	it->consecutiveFailures = 0;
	it->liveness = DeviceLiveness::Online;
	if (aliasChanged) it->alias = status.alias;

	if (aliasChanged) persist_();
	if (before != DeviceLiveness::Online) {
		qCInfo(LC_REGISTRY) << "[DeviceRegistry]" << id << livenessName(before) << "-> online";
		emit livenessChanged(id, DeviceLiveness::Online);
	}
	emit deviceUpdated(id);
}

void DeviceRegistry::markFailure_(const QString& id, const QString& error)
{
	auto it = devices_.find(id);
	if (it == devices_.end()) return;

	const DeviceLiveness before = it->liveness;
	++it->consecutiveFailures;
	// offline 은 성공해야만 벗어남
	if (before != DeviceLiveness::Offline)
		it->liveness = it->consecutiveFailures >= offlineAfterFailures_
		               ? DeviceLiveness::Offline : DeviceLiveness::Stale;

	qCDebug(LC_REGISTRY) << "[DeviceRegistry] refresh of" << id << "failed (" << it->consecutiveFailures << "):" << error;
	if (before != it->liveness) {
		qCInfo(LC_REGISTRY) << "[DeviceRegistry]" << id << livenessName(before) << "->" << livenessName(it->liveness);
		emit livenessChanged(id, it->liveness);
	}
}
