#include "HostStreamTransport.hpp"

#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QDebug>
#include <cmath>

#include "include/common_path.hpp"
#include "include/fleet_logging.hpp"

QString HostStreamTransport::readAll(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return {};
    return QString::fromUtf8(f.readAll()).trimmed();
}

bool HostStreamTransport::start(const StreamStartRequest& config, QString& errorString)
{
	static const QRegularExpression reRes(QStringLiteral("^(\\d{3,4})x(\\d{3,4})$"));
	if (!reRes.match(config.resolution).hasMatch()) {
		errorString = QStringLiteral("unsupported resolution '%1'").arg(config.resolution);
		return false;
	}
	if (config.codec != QLatin1String("h264") && config.codec != QLatin1String("hevc")) {
		errorString = QStringLiteral("unsupported codec '%1'").arg(config.codec);
		return false;
	}

	config_ = config;
	streaming_ = true;
	uptime_.start();
	qCInfo(LC_CAMERA) << "[HostStreamTransport] streaming" << config.resolution << config.framerate << "fps" << config.codec;
	return true;
}

bool HostStreamTransport::stop(QString& errorString)
{
	Q_UNUSED(errorString);
	streaming_ = false;
	uptime_.invalidate();
	return true;
}

bool HostStreamTransport::forceKeyframe(QString& errorString)
{
	if (!streaming_) {
		errorString = QStringLiteral("encoder idle");
		return false;
	}
	++keyframes_;
	return true;
}

bool HostStreamTransport::updateSettings(const CurrentSettings& settings, QString& errorString)
{
	Q_UNUSED(errorString);
	if (settings.wbKelvin) wbKelvin_ = *settings.wbKelvin;
	if (settings.wbTint) wbTint_ = *settings.wbTint;
	qCDebug(LC_CAMERA) << "[HostStreamTransport] settings" << settings.wbMode << settings.iso << settings.zoomFactor;
	return true;
}

// no sensor here: the scene reads back as the last white point applied
bool HostStreamTransport::measureWhiteBalance(WhiteBalanceMeasurement& out, QString& errorString)
{
	Q_UNUSED(errorString);
	out.sceneCctK = wbKelvin_;
	out.tint = wbTint_;
	qCInfo(LC_CAMERA) << "[HostStreamTransport] wb measured" << out.sceneCctK << "K tint" << out.tint;
	return true;
}

bool HostStreamTransport::setTorch(double level, QString& errorString)
{
	if (level < 0.0 || level > 1.0) {
		errorString = QStringLiteral("torch level %1 out of range").arg(level);
		return false;
	}
	qCDebug(LC_CAMERA) << "[HostStreamTransport] torch" << level;
	return true;
}

double HostStreamTransport::readCpuTempC()
{
	const QString tStr = readAll(QStringLiteral(THERMAL_ZONE_TEMP));
	if (tStr.isEmpty()) return 0.0;
	return tStr.toDouble() / 1000.0;
}

// /proc/net/wireless: "wlan0: 0000   54.  -56.  -256 ..."
int HostStreamTransport::readWifiRssi()
{
	const QStringList lines = readAll(QStringLiteral(PROC_NET_WIRELESS)).split('\n', Qt::SkipEmptyParts);
	static const QRegularExpression re(QStringLiteral("^\\s*\\S+:\\s+\\S+\\s+[-\\d.]+\\s+(-?\\d+)"));
	for (const auto& line : lines) {
		const QRegularExpressionMatch m = re.match(line);
		if (m.hasMatch()) return m.captured(1).toInt();
	}
	return 0;
}

double HostStreamTransport::readBattery(ChargingState* state) const
{
	const QDir dir(QStringLiteral(POWER_SUPPLY_PATH));
	const QStringList bats = dir.entryList({QStringLiteral("BAT*")}, QDir::Dirs | QDir::NoDotAndDotDot);
	if (bats.isEmpty()) {
		if (state) *state = ChargingState::Unplugged;
		return 1.0;
	}
	const QString base = dir.filePath(bats.first());
	const QString status = readAll(base + QStringLiteral("/status"));
	if (state) {
		if (status == QLatin1String("Charging")) *state = ChargingState::Charging;
		else if (status == QLatin1String("Full")) *state = ChargingState::Full;
		else *state = ChargingState::Unplugged;
	}
	bool ok = false;
	const int capacity = readAll(base + QStringLiteral("/capacity")).toInt(&ok);
	return ok ? qBound(0, capacity, 100) / 100.0 : 0.0;
}

double HostStreamTransport::sampleCpuUsage()
{
	const QString first = readAll(QStringLiteral(PROC_STAT)).section('\n', 0, 0);
	const QStringList f = first.split(' ', Qt::SkipEmptyParts);
	if (f.size() < 5 || f[0] != QLatin1String("cpu")) return 0.0;

	quint64 total = 0;
	for (int i = 1; i < f.size(); ++i) total += f[i].toULongLong();
	const quint64 idle = f[4].toULongLong() + (f.size() > 5 ? f[5].toULongLong() : 0);

	double usage = 0.0;
	if (prevTotal_ > 0 && total > prevTotal_) {
		const double dTotal = double(total - prevTotal_);
		const double dIdle  = double(idle - prevIdle_);
		usage = qBound(0.0, 100.0 * (1.0 - dIdle / dTotal), 100.0);
	}
	prevTotal_ = total;
	prevIdle_ = idle;
	return usage;
}

Telemetry HostStreamTransport::currentTelemetry()
{
	Telemetry t;
	ChargingState cs = ChargingState::Unplugged;
	t.battery  = readBattery(&cs);
	t.chargingState = cs;
	t.tempC    = readCpuTempC();
	t.wifiRssi = readWifiRssi();
	t.cpuUsage = sampleCpuUsage();
	if (streaming_) {
		t.fps     = config_.framerate;
		t.bitrate = config_.bitrate;
	}
	t.queueMs       = 0;
	t.droppedFrames = 0;
	return t;
}
