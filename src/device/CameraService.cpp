#include "CameraService.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSaveFile>
#include <QDebug>

#include "include/fleet_logging.hpp"
#include "log/SystemLogger.hpp"
#include "protocol/ApiError.hpp"

CameraService::CameraService(std::unique_ptr<StreamTransport> transport,
                             const QString& alias,
                             QObject* parent)
	: QObject(parent)
	, transport_(std::move(transport))
	, alias_(alias)
	, caps_(defaultCapabilities())
	, presets_(VideoPreset::builtin())
{
	video_.selectedPresetId = QStringLiteral("smooth_1080p60");
}

CameraService::~CameraService()
{
	QMutexLocker io(&ioMutex_);
	if (transport_ && transport_->isStreaming()) {
		QString err;
		if (!transport_->stop(err))
			qCWarning(LC_CAMERA) << "[CameraService] stop on shutdown failed:" << err;
	}
}

QList<Capability> CameraService::defaultCapabilities()
{
	const QStringList codecs{QStringLiteral("h264"), QStringLiteral("hevc")};
	return {
		Capability{QStringLiteral("1920x1080"), {24, 25, 30, 60}, codecs, QStringLiteral("wide"), 10.0},
		Capability{QStringLiteral("2560x1440"), {24, 25, 30, 60}, codecs, QStringLiteral("wide"), 10.0},
		Capability{QStringLiteral("3840x2160"), {24, 25, 30, 60}, codecs, QStringLiteral("wide"), 6.0},
	};
}

void CameraService::setCapabilities(const QList<Capability>& caps)
{
	QMutexLocker lock(&mutex_);
	caps_ = caps;
}

void CameraService::setStatePath(const QString& path)
{
	QMutexLocker io(&ioMutex_);
	statePath_ = path;
	loadState_();
}

// caller holds ioMutex_
bool CameraService::loadState_()
{
	if (statePath_.isEmpty()) return false;

	QFile f(statePath_);
	if (!f.exists()) return false;
	if (!f.open(QIODevice::ReadOnly)) {
		qCWarning(LC_CAMERA) << "[CameraService] cannot open state file" << statePath_ << f.errorString();
		return false;
	}

	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
		qCWarning(LC_CAMERA) << "[CameraService] state file ignored:" << perr.errorString();
		return false;
	}

	const QJsonObject o = doc.object();
	std::optional<VideoSettings> video;
	try {
		if (o.value("video_settings").isObject())
			video = VideoSettings::fromJson(o.value("video_settings").toObject());
	} catch (const ApiError& e) {
		qCWarning(LC_CAMERA) << "[CameraService] stored video settings ignored:" << e.message();
	}

	QMutexLocker lock(&mutex_);
	const QString a = o.value("alias").toString().trimmed();
	if (!a.isEmpty()) alias_ = a;
	if (video) video_ = *video;
	return true;
}

// caller holds ioMutex_
bool CameraService::saveState_(const QString& alias, const VideoSettings& video)
{
	if (statePath_.isEmpty()) return true;

	QDir().mkpath(QFileInfo(statePath_).absolutePath());
	QSaveFile sf(statePath_);
	if (!sf.open(QIODevice::WriteOnly)) {
		qCWarning(LC_CAMERA) << "[CameraService] state save failed:" << sf.errorString();
		return false;
	}
	const QJsonObject o{{"alias", alias}, {"video_settings", video.toJson()}};
	sf.write(QJsonDocument(o).toJson(QJsonDocument::Indented));
	if (!sf.commit()) {
		qCWarning(LC_CAMERA) << "[CameraService] state commit failed:" << sf.errorString();
		return false;
	}
	return true;
}

QString CameraService::alias()
{
	QMutexLocker lock(&mutex_);
	return alias_;
}

bool CameraService::screenDimmed()
{
	QMutexLocker lock(&mutex_);
	return dimmed_;
}

CurrentSettings CameraService::currentSettings()
{
	QMutexLocker lock(&mutex_);
	return current_;
}

StatusResponse CameraService::status()
{
	const Telemetry telemetry = currentTelemetry();
	const NdiState state = streamState();

	QMutexLocker lock(&mutex_);
	StatusResponse s;
	s.alias        = alias_;
	s.ndiState     = state;
	s.current      = current_;
	s.telemetry    = telemetry;
	s.capabilities = caps_;
	return s;
}

QList<Capability> CameraService::capabilities()
{
	QMutexLocker lock(&mutex_);
	return caps_;
}

QList<VideoPreset> CameraService::videoPresets()
{
	QMutexLocker lock(&mutex_);
	return presets_;
}

VideoSettings CameraService::videoSettings()
{
	QMutexLocker lock(&mutex_);
	return video_;
}

// Called from the telemetry tick on the main thread: never waits for a
// running operation, answers from the last sample instead.
Telemetry CameraService::currentTelemetry()
{
	if (ioMutex_.tryLock()) {
		const Telemetry t = transport_->currentTelemetry();
		{
			QMutexLocker lock(&mutex_);
			telemetry_ = t;
		}
		ioMutex_.unlock();
		return t;
	}
	QMutexLocker lock(&mutex_);
	return telemetry_;
}

NdiState CameraService::streamState()
{
	if (ioMutex_.tryLock()) {
		const bool streaming = transport_->isStreaming();
		{
			QMutexLocker lock(&mutex_);
			streaming_ = streaming;
		}
		ioMutex_.unlock();
	}
	QMutexLocker lock(&mutex_);
	return streaming_ ? NdiState::Streaming : NdiState::Idle;
}

bool CameraService::updateVideoSettings(const VideoSettings& settings, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	QString alias;
	{
		QMutexLocker lock(&mutex_);
		if (!settings.effective(presets_)) {
			errorString = QStringLiteral("settings resolve to neither a known preset nor a complete custom configuration");
			return false;
		}
		alias = alias_;
	}

	// 저장 실패 시 이전 설정 유지
	if (!saveState_(alias, settings)) {
		errorString = QStringLiteral("failed to persist video settings");
		return false;
	}
	{
		QMutexLocker lock(&mutex_);
		video_ = settings;
	}
	qCInfo(LC_CAMERA) << "[CameraService] video settings updated" << QJsonDocument(settings.toJson()).toJson(QJsonDocument::Compact);
	return true;
}

bool CameraService::startStream(const StreamStartRequest& request, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	bool started = true;
	// restart with the new configuration
	if (transport_->isStreaming() && !transport_->stop(errorString))
		started = false;
	else
		started = transport_->start(request, errorString);

	{
		QMutexLocker lock(&mutex_);
		streaming_ = transport_->isStreaming();
		if (started) {
			current_.resolution = request.resolution;
			current_.fps        = request.framerate;
			current_.bitrate    = request.bitrate;
			current_.codec      = request.codec;
		}
	}
	io.unlock();

	if (!started) {
		SystemLogger::error("CAMERA", QStringLiteral("stream start failed: %1").arg(errorString));
		return false;
	}
	SystemLogger::info("CAMERA", QStringLiteral("stream started %1@%2 %3")
	                   .arg(request.resolution).arg(request.framerate).arg(request.codec));
	emit streamStateChanged(NdiState::Streaming);
	return true;
}

bool CameraService::stopStream(QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	if (!transport_->isStreaming()) return true;
	const bool stopped = transport_->stop(errorString);
	{
		QMutexLocker lock(&mutex_);
		streaming_ = transport_->isStreaming();
	}
	io.unlock();
	if (!stopped) return false;

	SystemLogger::info("CAMERA", QStringLiteral("stream stopped"));
	emit streamStateChanged(NdiState::Idle);
	return true;
}

bool CameraService::updateCameraSettings(const CameraSettingsRequest& r, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	CurrentSettings next;
	QList<Capability> caps;
	{
		QMutexLocker lock(&mutex_);
		next = current_;
		caps = caps_;
	}
	if (r.wbMode)         next.wbMode = *r.wbMode;
	if (r.wbKelvin)       next.wbKelvin = *r.wbKelvin;
	if (r.wbTint)         next.wbTint = *r.wbTint;
	if (r.isoMode)        next.isoMode = *r.isoMode;
	if (r.iso)            next.iso = static_cast<int>(*r.iso);
	if (r.shutterMode)    next.shutterMode = *r.shutterMode;
	if (r.shutterS)       next.shutterS = *r.shutterS;
	if (r.focusMode)      next.focusMode = *r.focusMode;
	if (r.zoomFactor)     next.zoomFactor = *r.zoomFactor;
	if (r.lens)           next.lens = *r.lens;
	if (r.cameraPosition) next.cameraPosition = *r.cameraPosition;

	// manual values imply manual mode
	if (r.wbKelvin && !r.wbMode)  next.wbMode = QStringLiteral("manual");
	if (r.iso && !r.isoMode)      next.isoMode = QStringLiteral("manual");
	if (r.shutterS && !r.shutterMode) next.shutterMode = QStringLiteral("manual");

	for (const auto& c : caps) {
		if (c.maxZoom && next.zoomFactor > *c.maxZoom && c.resolution == next.resolution) {
			errorString = QStringLiteral("zoom_factor %1 exceeds max %2").arg(next.zoomFactor).arg(*c.maxZoom);
			return false;
		}
	}

	if (r.torchLevel && !transport_->setTorch(*r.torchLevel, errorString))
		return false;
	if (!transport_->updateSettings(next, errorString))
		return false;

	{
		QMutexLocker lock(&mutex_);
		current_ = next;
		if (r.torchLevel) torchLevel_ = r.torchLevel;
		if (r.orientationLock) orientationLock_ = *r.orientationLock;
	}
	qCDebug(LC_CAMERA) << "[CameraService] camera settings applied" << QJsonDocument(r.toJson()).toJson(QJsonDocument::Compact);
	return true;
}

bool CameraService::measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	if (!transport_->measureWhiteBalance(out, errorString)) {
		SystemLogger::warn("CAMERA", QStringLiteral("white balance measurement failed: %1").arg(errorString));
		return false;
	}
	{
		QMutexLocker lock(&mutex_);
		current_.wbMode = QStringLiteral("auto");
	}
	qCInfo(LC_CAMERA) << "[CameraService] wb measured" << out.sceneCctK << "K tint" << out.tint;
	return true;
}

double CameraService::torchLevel()
{
	QMutexLocker lock(&mutex_);
	return torchLevel_.value_or(0.0);
}

bool CameraService::setTorchLevel(double level, QString& errorString)
{
	if (level < 0.0 || level > 1.0) {
		errorString = QStringLiteral("torch level must be within 0..1");
		return false;
	}
	QMutexLocker io(&ioMutex_);
	if (!transport_->setTorch(level, errorString))
		return false;
	QMutexLocker lock(&mutex_);
	torchLevel_ = level;
	return true;
}

bool CameraService::forceKeyframe(QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	if (!transport_->isStreaming()) {
		errorString = QStringLiteral("stream is not running");
		return false;
	}
	return transport_->forceKeyframe(errorString);
}

bool CameraService::setScreenDimmed(bool dimmed, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	if (!backlightPath_.isEmpty() && !writeBacklight_(dimmed, errorString))
		return false;
	QMutexLocker lock(&mutex_);
	dimmed_ = dimmed;
	return true;
}

// caller holds ioMutex_
bool CameraService::writeBacklight_(bool dimmed, QString& errorString)
{
	QString maxStr;
	{
		QFile mf(backlightPath_ + QStringLiteral("/max_brightness"));
		if (mf.open(QIODevice::ReadOnly)) maxStr = QString::fromUtf8(mf.readAll()).trimmed();
	}
	bool ok = false;
	const int maxBrightness = maxStr.toInt(&ok);
	const int value = dimmed ? (ok ? qMax(1, maxBrightness / 10) : 1) : (ok ? maxBrightness : 255);

	QFile f(backlightPath_ + QStringLiteral("/brightness"));
	if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		errorString = QStringLiteral("backlight: %1").arg(f.errorString());
		return false;
	}
	if (f.write(QByteArray::number(value)) < 0) {
		errorString = QStringLiteral("backlight: %1").arg(f.errorString());
		return false;
	}
	return true;
}

bool CameraService::updateAlias(const QString& alias, QString& errorString)
{
	QMutexLocker io(&ioMutex_);
	QString previous;
	VideoSettings video;
	{
		QMutexLocker lock(&mutex_);
		previous = alias_;
		video = video_;
	}
	if (!saveState_(alias, video)) {
		errorString = QStringLiteral("failed to persist alias");
		return false;
	}
	{
		QMutexLocker lock(&mutex_);
		alias_ = alias;
	}
	io.unlock();

	SystemLogger::info("CAMERA", QStringLiteral("alias changed %1 -> %2").arg(previous, alias));
	emit aliasChanged(alias);
	return true;
}
