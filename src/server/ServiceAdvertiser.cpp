#include "ServiceAdvertiser.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkDatagram>

#include "include/fleet_logging.hpp"

ServiceAdvertiser::ServiceAdvertiser(QObject* parent)
	: QObject(parent)
{
	connect(&timer_, &QTimer::timeout, this, &ServiceAdvertiser::announce);
	connect(&socket_, &QUdpSocket::readyRead, this, &ServiceAdvertiser::handleReadyRead);
}

ServiceAdvertiser::~ServiceAdvertiser()
{
	stop();
}

bool ServiceAdvertiser::start(const QString& alias, quint16 controlPort,
                              quint16 discoveryPort, int intervalMs, QString& errorString)
{
	if (running_) return true;

	alias_ = alias;
	controlPort_ = controlPort;
	discoveryPort_ = discoveryPort;

	// 같은 호스트에서 콘솔/다른 장치와 포트를 공유
	if (!socket_.bind(QHostAddress::AnyIPv4, discoveryPort_,
	                  QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
		errorString = QStringLiteral("discovery bind %1: %2").arg(discoveryPort_).arg(socket_.errorString());
		return false;
	}

	timer_.start(qMax(100, intervalMs));
	running_ = true;

	// 첫 공지는 바로
	QTimer::singleShot(100, this, &ServiceAdvertiser::announce);
	qCInfo(LC_DISCOVERY) << "[Advertiser] announcing" << alias_ << "port" << controlPort_
	                     << "on udp" << discoveryPort_;
	return true;
}

void ServiceAdvertiser::stop()
{
	if (!running_) return;
	timer_.stop();
	socket_.close();
	running_ = false;
}

QByteArray ServiceAdvertiser::announcement() const
{
	const QJsonObject txt{
		{"alias",    alias_},
		{"version",  QStringLiteral(DISCOVERY_VERSION)},
		{"protocol", QStringLiteral(DISCOVERY_PROTOCOL)},
	};
	const QJsonObject o{
		{"type",    QStringLiteral("announce")},
		{"service", QStringLiteral(DISCOVERY_SERVICE_TYPE)},
		{"name",    alias_},
		{"port",    int(controlPort_)},
		{"txt",     txt},
	};
	return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

void ServiceAdvertiser::setAlias(const QString& alias)
{
	if (alias == alias_) return;
	alias_ = alias;
	if (running_) announce();
}

void ServiceAdvertiser::announce()
{
	if (!running_) return;
	const QByteArray payload = announcement();
	if (socket_.writeDatagram(payload, QHostAddress::Broadcast, discoveryPort_) < 0)
		qCWarning(LC_DISCOVERY) << "[Advertiser] broadcast failed:" << socket_.errorString();
}

void ServiceAdvertiser::handleReadyRead()
{
	bool queried = false;
	while (socket_.hasPendingDatagrams()) {
		const QNetworkDatagram dg = socket_.receiveDatagram();
		QJsonParseError perr;
		const QJsonDocument doc = QJsonDocument::fromJson(dg.data(), &perr);
		if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
			qCDebug(LC_DISCOVERY) << "[Advertiser] ignoring datagram from" << dg.senderAddress();
			continue;
		}
		const QJsonObject o = doc.object();
		if (o.value("type").toString() == QLatin1String("query")
		    && o.value("service").toString() == QLatin1String(DISCOVERY_SERVICE_TYPE))
			queried = true;
	}
	// 여러 질의가 한 번에 와도 응답은 한 번
	if (queried) announce();
}
