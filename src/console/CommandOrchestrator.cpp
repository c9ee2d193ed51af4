#include "CommandOrchestrator.hpp"

#include <QJsonDocument>
#include <QPointer>
#include <QSet>
#include <QVector>
#include <QDebug>
#include <memory>

#include "console/DeviceRegistry.hpp"
#include "include/fleet_logging.hpp"
#include "log/SystemLogger.hpp"

namespace {
const QString kStreamStart   = QStringLiteral("/api/v1/stream/start");
const QString kStreamStop    = QStringLiteral("/api/v1/stream/stop");
const QString kCamera        = QStringLiteral("/api/v1/camera");
const QString kVideoSettings = QStringLiteral("/api/v1/video/settings");
const QString kKeyframe      = QStringLiteral("/api/v1/encoder/force_keyframe");
const QString kBrightness    = QStringLiteral("/api/v1/screen/brightness");
const QString kAlias         = QStringLiteral("/api/v1/settings/alias");
const QString kWbMeasure     = QStringLiteral("/api/v1/camera/wb/measure");
const QString kTorchLevel    = QStringLiteral("/api/v1/torch/level");
}

CommandOrchestrator::CommandOrchestrator(DeviceRegistry& registry, DeviceClient& client, QObject* parent)
	: QObject(parent)
	, registry_(registry)
	, client_(client)
{
}

QStringList CommandOrchestrator::distinctIds(const QStringList& ids)
{
	QStringList out;
	QSet<QString> seen;
	for (const QString& id : ids) {
		if (seen.contains(id)) continue;
		seen.insert(id);
		out.append(id);
	}
	return out;
}

GroupOperationResult CommandOrchestrator::failed(const QString& id, DeviceFailureKind kind, const QString& detail)
{
	return GroupOperationResult{id, false, QStringLiteral("%1: %2").arg(failureKindName(kind), detail)};
}

void CommandOrchestrator::call_(const QString& id, const QByteArray& verb, const QString& path,
                                const QJsonObject& body, const SuccessHook& onSuccess, ResultCallback cb)
{
	const std::optional<Device> dev = registry_.device(id);
	if (!dev) {
		cb(failed(id, DeviceFailureKind::NotFound, QStringLiteral("Device not found: %1").arg(id)));
		return;
	}

	const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);
	QPointer<CommandOrchestrator> guard(this);
	client_.send(DeviceRegistry::endpointOf(*dev), verb, path, payload,
	             [guard, id, onSuccess, cb](const DeviceReply& reply) {
		if (!reply.ok()) {
			cb(GroupOperationResult{id, false, reply.errorString()});
			return;
		}
		if (guard && onSuccess) onSuccess(id);
		cb(GroupOperationResult{id, true, QString(), reply.json().value_or(QJsonObject())});
	});
}

// ---------- single device ----------
void CommandOrchestrator::startStream(const QString& id, const StreamStartRequest& req, ResultCallback cb)
{
	call_(id, "POST", kStreamStart, req.toJson(),
	      [this, req](const QString& d) { registry_.recordStreamSettings(d, req); }, std::move(cb));
}

void CommandOrchestrator::stopStream(const QString& id, ResultCallback cb)
{
	call_(id, "POST", kStreamStop, QJsonObject(), {}, std::move(cb));
}

void CommandOrchestrator::updateCameraSettings(const QString& id, const CameraSettingsRequest& req, ResultCallback cb)
{
	call_(id, "POST", kCamera, req.toJson(),
	      [this, req](const QString& d) { registry_.recordCameraSettings(d, req); }, std::move(cb));
}

void CommandOrchestrator::updateVideoSettings(const QString& id, const VideoSettings& settings, ResultCallback cb)
{
	call_(id, "PUT", kVideoSettings, settings.toJson(), {}, std::move(cb));
}

void CommandOrchestrator::forceKeyframe(const QString& id, ResultCallback cb)
{
	call_(id, "POST", kKeyframe, QJsonObject(), {}, std::move(cb));
}

void CommandOrchestrator::setScreenDimmed(const QString& id, bool dimmed, ResultCallback cb)
{
	call_(id, "POST", kBrightness, ScreenBrightnessRequest{dimmed}.toJson(), {}, std::move(cb));
}

void CommandOrchestrator::updateAlias(const QString& id, const QString& alias, ResultCallback cb)
{
	call_(id, "PUT", kAlias, QJsonObject{{"alias", alias}},
	      [this, alias](const QString& d) {
	          QString err;
	          if (!registry_.setAlias(d, alias.trimmed(), err))
	              qCWarning(LC_ORCH) << "[CommandOrchestrator]" << err;
	      }, std::move(cb));
}

void CommandOrchestrator::measureWhiteBalance(const QString& id, ResultCallback cb)
{
	// device leaves manual white balance
	call_(id, "POST", kWbMeasure, QJsonObject(),
	      [this](const QString& d) {
	          CameraSettingsRequest wb;
	          wb.wbMode = QStringLiteral("auto");
	          registry_.recordCameraSettings(d, wb);
	      }, std::move(cb));
}

void CommandOrchestrator::setTorchLevel(const QString& id, double level, ResultCallback cb)
{
	call_(id, "PUT", kTorchLevel, TorchLevelRequest{level}.toJson(), {}, std::move(cb));
}

void CommandOrchestrator::applyBundle(const QString& id, const SettingsBundle& bundle, ResultCallback cb)
{
	QPointer<CommandOrchestrator> guard(this);
	updateCameraSettings(id, bundle.camera, [guard, id, bundle, cb](const GroupOperationResult& r) {
		if (!r.success || !bundle.stream || !guard) {
			cb(r);
			return;
		}
		guard->updateVideoSettings(id, VideoSettings::fromStream(*bundle.stream), cb);
	});
}

// ---------- groups ----------
void CommandOrchestrator::runGroup(const QString& operation, const QStringList& ids,
                                   const DeviceOp& op, GroupCallback done)
{
	const QStringList targets = distinctIds(ids);
	if (targets.isEmpty()) {
		done(GroupResults());
		return;
	}

	struct Join {
		GroupResults results;
		int pending = 0;
	};
	auto join = std::make_shared<Join>();
	join->pending = targets.size();
	for (const QString& id : targets)
		join->results.append(GroupOperationResult{id, false, QString()});

	qCDebug(LC_ORCH) << "[CommandOrchestrator]" << operation << "->" << targets.size() << "device(s)";

	QPointer<CommandOrchestrator> guard(this);
	for (int i = 0; i < targets.size(); ++i) {
		op(targets[i], [guard, join, i, operation, done](const GroupOperationResult& r) {
			join->results[i] = r;
			if (--join->pending > 0) return;

			int ok = 0;
			for (const auto& e : join->results) ok += e.success ? 1 : 0;
			const int bad = join->results.size() - ok;
			if (bad > 0)
				SystemLogger::warn("ORCH", QStringLiteral("%1: %2 ok, %3 failed").arg(operation).arg(ok).arg(bad));
			if (guard) emit guard->groupFinished(operation, ok, bad);
			done(join->results);
		});
	}
}

void CommandOrchestrator::startStreamGroup(const QStringList& ids, const StreamStartRequest& req, GroupCallback done)
{
	runGroup(QStringLiteral("start-stream"), ids,
	         [this, req](const QString& id, ResultCallback cb) { startStream(id, req, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::stopStreamGroup(const QStringList& ids, GroupCallback done)
{
	runGroup(QStringLiteral("stop-stream"), ids,
	         [this](const QString& id, ResultCallback cb) { stopStream(id, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::updateCameraSettingsGroup(const QStringList& ids, const CameraSettingsRequest& req,
                                                    GroupCallback done)
{
	runGroup(QStringLiteral("update-camera-settings"), ids,
	         [this, req](const QString& id, ResultCallback cb) { updateCameraSettings(id, req, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::updateVideoSettingsGroup(const QStringList& ids, const VideoSettings& settings,
                                                   GroupCallback done)
{
	runGroup(QStringLiteral("update-video-settings"), ids,
	         [this, settings](const QString& id, ResultCallback cb) { updateVideoSettings(id, settings, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::forceKeyframeGroup(const QStringList& ids, GroupCallback done)
{
	runGroup(QStringLiteral("force-keyframe"), ids,
	         [this](const QString& id, ResultCallback cb) { forceKeyframe(id, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::setScreenDimmedGroup(const QStringList& ids, bool dimmed, GroupCallback done)
{
	runGroup(QStringLiteral("set-screen-brightness"), ids,
	         [this, dimmed](const QString& id, ResultCallback cb) { setScreenDimmed(id, dimmed, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::measureWhiteBalanceGroup(const QStringList& ids, GroupCallback done)
{
	runGroup(QStringLiteral("measure-white-balance"), ids,
	         [this](const QString& id, ResultCallback cb) { measureWhiteBalance(id, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::setTorchLevelGroup(const QStringList& ids, double level, GroupCallback done)
{
	runGroup(QStringLiteral("set-torch-level"), ids,
	         [this, level](const QString& id, ResultCallback cb) { setTorchLevel(id, level, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::applyBundleGroup(const QStringList& ids, const SettingsBundle& bundle, GroupCallback done)
{
	runGroup(QStringLiteral("apply-profile"), ids,
	         [this, bundle](const QString& id, ResultCallback cb) { applyBundle(id, bundle, std::move(cb)); },
	         std::move(done));
}

void CommandOrchestrator::startAll(GroupCallback done)
{
	runGroup(QStringLiteral("start-all"), registry_.ids(),
	         [this](const QString& id, ResultCallback cb) {
	             const std::optional<Device> dev = registry_.device(id);
	             const StreamStartRequest req = dev && dev->streamSettings ? *dev->streamSettings
	                                                                       : StreamStartRequest::defaults();
	             startStream(id, req, std::move(cb));
	         },
	         std::move(done));
}

void CommandOrchestrator::stopAll(GroupCallback done)
{
	stopStreamGroup(registry_.ids(), std::move(done));
}
