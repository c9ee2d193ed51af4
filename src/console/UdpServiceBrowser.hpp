#pragma once
#include <QHash>
#include <QTimer>
#include <QUdpSocket>
#include <optional>

#include "console/ServiceBrowser.hpp"
#include "include/common_path.hpp"

// Broadcasts a query on the discovery port and collects announcements until
// the cycle window closes. Unsolicited announcements during the window count.
class UdpServiceBrowser : public ServiceBrowser {
	Q_OBJECT
public:
	explicit UdpServiceBrowser(quint16 discoveryPort = DEFAULT_DISCOVERY_PORT,
	                           int windowMs = 1500, QObject* parent = nullptr);
	~UdpServiceBrowser() override;

	void startCycle() override;
	bool isBrowsing() const override { return window_.isActive(); }

	// Parses one announcement datagram; nullopt for anything else.
	static std::optional<DiscoveredCandidate> parseAnnouncement(const QByteArray& datagram,
	                                                            const QString& senderHost);

private slots:
	void handleReadyRead();
	void finishCycle();

private:
	bool ensureBound_(QString& errorString);

private:
	quint16 discoveryPort_;
	QUdpSocket socket_;
	QTimer window_;
	QHash<QString, DiscoveredCandidate> seen_;
};
