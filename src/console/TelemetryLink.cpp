#include "TelemetryLink.hpp"

#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QWebSocket>
#include <QDebug>

#include "console/DeviceRegistry.hpp"
#include "include/fleet_logging.hpp"
#include "log/SystemLogger.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"

TelemetryLink::TelemetryLink(DeviceRegistry& registry, const AlertThresholds& alerts, QObject* parent)
	: QObject(parent)
	, registry_(registry)
	, alerts_(alerts)
{
	connect(&registry_, &DeviceRegistry::deviceAdded, this, [this](const QString& id) {
		if (running_) open_(id);
	});
	connect(&registry_, &DeviceRegistry::deviceRemoved, this, [this](const QString& id) {
		close_(id);
	});
}

TelemetryLink::~TelemetryLink()
{
	stop();
}

int TelemetryLink::backoffMs(int attempt)
{
	const int exp = qBound(0, attempt, 5);
	return qMin(30000, 2000 * (1 << exp));
}

void TelemetryLink::start()
{
	if (running_) return;
	running_ = true;
	for (const QString& id : registry_.ids())
		open_(id);
}

void TelemetryLink::stop()
{
	running_ = false;
	const QStringList ids = links_.keys();
	for (const QString& id : ids)
		close_(id);
}

bool TelemetryLink::isConnected(const QString& id) const
{
	const auto it = links_.constFind(id);
	return it != links_.constEnd() && it->socket
	       && it->socket->state() == QAbstractSocket::ConnectedState;
}

void TelemetryLink::open_(const QString& id)
{
	const std::optional<Device> dev = registry_.device(id);
	if (!dev) return;

	Link& link = links_[id];
	if (!link.socket) {
		link.socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
		link.retry = new QTimer(this);
		link.retry->setSingleShot(true);

		QWebSocket* ws = link.socket;
		connect(link.retry, &QTimer::timeout, this, [this, id]() { open_(id); });
		connect(ws, &QWebSocket::connected, this, [this, id]() {
			auto it = links_.find(id);
			if (it == links_.end()) return;
			it->attempt = 0;
			qCInfo(LC_WS) << "[TelemetryLink] connected to" << id;
			emit linkStateChanged(id, true);
		});
		connect(ws, &QWebSocket::disconnected, this, [this, id]() {
			emit linkStateChanged(id, false);
			scheduleReconnect_(id);
		});
		connect(ws, &QWebSocket::textMessageReceived, this, [this, id](const QString& message) {
			handleText_(id, message);
		});
	}

	QUrl url;
	url.setScheme(QStringLiteral("ws"));
	url.setHost(dev->host);
	url.setPort(dev->port);
	url.setPath(QStringLiteral("/ws"));

	QNetworkRequest req(url);
	if (!dev->token.isEmpty())
		req.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + dev->token.toUtf8());
	link.socket->open(req);
}

void TelemetryLink::close_(const QString& id)
{
	auto it = links_.find(id);
	if (it == links_.end()) return;

	Link link = it.value();
	links_.erase(it);

	// disconnected 에서 재접속하지 않도록 먼저 끊음
	link.retry->stop();
	link.socket->disconnect(this);
	link.socket->abort();
	link.socket->deleteLater();
	link.retry->deleteLater();
}

void TelemetryLink::scheduleReconnect_(const QString& id)
{
	auto it = links_.find(id);
	if (it == links_.end() || !running_) return;
	if (it->retry->isActive()) return;

	const int delay = backoffMs(it->attempt);
	++it->attempt;
	qCDebug(LC_WS) << "[TelemetryLink]" << id << "reconnect in" << delay << "ms (attempt" << it->attempt << ")";
	it->retry->start(delay);
}

void TelemetryLink::handleText_(const QString& id, const QString& message)
{
	TelemetryFrame frame;
	try {
		frame = TelemetryFrame::fromJson(JsonFields::parseObject(message.toUtf8()));
	} catch (const ApiError& e) {
		// 텔레메트리가 아닌 메시지 (예: ws set 오류 응답)
		qCDebug(LC_WS) << "[TelemetryLink] non-telemetry frame from" << id << ":" << e.message();
		return;
	}

	registry_.recordTelemetry(id, frame);
	emit frameReceived(id, frame);

	auto it = links_.find(id);
	if (it == links_.end()) return;

	// 임계값을 넘는 순간 한 번만 경고
	if (alerts_.temperatureEnabled) {
		if (crossesThreshold(it->hot, frame.tempC, alerts_.temperatureC)) {
			it->hot = true;
			qCWarning(LC_WS) << "[TelemetryLink]" << id << "temperature" << frame.tempC << "C above" << alerts_.temperatureC;
			SystemLogger::warn("TELEMETRY", QStringLiteral("%1 temperature %2 C").arg(id).arg(frame.tempC));
			emit temperatureAlert(id, frame.tempC);
		} else if (frame.tempC <= alerts_.temperatureC) {
			it->hot = false;
		}
	}

	if (alerts_.cpuEnabled) {
		if (crossesThreshold(it->cpuHot, frame.cpuUsage, alerts_.cpuPercent)) {
			it->cpuHot = true;
			qCWarning(LC_WS) << "[TelemetryLink]" << id << "cpu" << frame.cpuUsage << "% above" << alerts_.cpuPercent;
			emit cpuAlert(id, frame.cpuUsage);
		} else if (frame.cpuUsage <= alerts_.cpuPercent) {
			it->cpuHot = false;
		}
	}
}
