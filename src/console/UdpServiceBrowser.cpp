#include "UdpServiceBrowser.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkDatagram>
#include <QDebug>

#include "include/fleet_logging.hpp"

UdpServiceBrowser::UdpServiceBrowser(quint16 discoveryPort, int windowMs, QObject* parent)
	: ServiceBrowser(parent)
	, discoveryPort_(discoveryPort)
{
	window_.setSingleShot(true);
	window_.setInterval(qMax(50, windowMs));
	connect(&window_, &QTimer::timeout, this, &UdpServiceBrowser::finishCycle);
	connect(&socket_, &QUdpSocket::readyRead, this, &UdpServiceBrowser::handleReadyRead);
}

UdpServiceBrowser::~UdpServiceBrowser() = default;

bool UdpServiceBrowser::ensureBound_(QString& errorString)
{
	if (socket_.state() == QAbstractSocket::BoundState) return true;
	// 같은 호스트의 장치 광고기와 포트 공유
	if (!socket_.bind(QHostAddress::AnyIPv4, discoveryPort_,
	                  QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
		errorString = QStringLiteral("bind udp %1: %2").arg(discoveryPort_).arg(socket_.errorString());
		return false;
	}
	return true;
}

void UdpServiceBrowser::startCycle()
{
	if (window_.isActive()) {
		qCDebug(LC_DISCOVERY) << "[UdpServiceBrowser] cycle already running";
		return;
	}

	QString err;
	if (!ensureBound_(err)) {
		qCWarning(LC_DISCOVERY) << "[UdpServiceBrowser]" << err;
		emit browseFailed(err);
		return;
	}

	seen_.clear();
	const QJsonObject query{
		{"type",    QStringLiteral("query")},
		{"service", QStringLiteral(DISCOVERY_SERVICE_TYPE)},
	};
	const QByteArray payload = QJsonDocument(query).toJson(QJsonDocument::Compact);
	if (socket_.writeDatagram(payload, QHostAddress::Broadcast, discoveryPort_) < 0) {
		const QString e = QStringLiteral("query broadcast failed: %1").arg(socket_.errorString());
		qCWarning(LC_DISCOVERY) << "[UdpServiceBrowser]" << e;
		emit browseFailed(e);
		return;
	}
	window_.start();
}

std::optional<DiscoveredCandidate> UdpServiceBrowser::parseAnnouncement(const QByteArray& datagram,
                                                                        const QString& senderHost)
{
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(datagram, &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) return std::nullopt;

	const QJsonObject o = doc.object();
	if (o.value("type").toString() != QLatin1String("announce")) return std::nullopt;
	if (o.value("service").toString() != QLatin1String(DISCOVERY_SERVICE_TYPE)) return std::nullopt;

	const int port = o.value("port").toInt(0);
	if (port <= 0 || port > 65535 || senderHost.isEmpty()) return std::nullopt;

	const QJsonObject txt = o.value("txt").toObject();
	DiscoveredCandidate c;
	c.host     = senderHost;
	c.port     = static_cast<quint16>(port);
	c.alias    = txt.value("alias").toString(o.value("name").toString());
	c.version  = txt.value("version").toString();
	c.protocol = txt.value("protocol").toString();
	if (!c.protocol.isEmpty() && c.protocol != QLatin1String(DISCOVERY_PROTOCOL))
		return std::nullopt;
	return c;
}

void UdpServiceBrowser::handleReadyRead()
{
	while (socket_.hasPendingDatagrams()) {
		const QNetworkDatagram dg = socket_.receiveDatagram();
		if (!window_.isActive()) continue;   // 사이클 밖의 데이터그램은 버림

		QHostAddress sender = dg.senderAddress();
		bool mapped = false;
		const quint32 v4 = sender.toIPv4Address(&mapped);
		if (mapped) sender = QHostAddress(v4);

		const auto c = parseAnnouncement(dg.data(), sender.toString());
		if (!c) continue;
		seen_.insert(c->id(), *c);
	}
}

void UdpServiceBrowser::finishCycle()
{
	const QList<DiscoveredCandidate> found = seen_.values();
	seen_.clear();
	qCDebug(LC_DISCOVERY) << "[UdpServiceBrowser] cycle done," << found.size() << "candidate(s)";
	emit cycleFinished(found);
}
