#pragma once
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUdpSocket>

#include "include/common_path.hpp"

// Announces this device on the discovery port and answers browse queries.
//
// Datagrams are compact JSON, always broadcast so that every socket sharing
// the port sees them:
//   query:    {"type":"query","service":"_camfleet._tcp"}
//   announce: {"type":"announce","service":"_camfleet._tcp","name":<alias>,
//              "port":<control port>,"txt":{"alias","version","protocol"}}
class ServiceAdvertiser : public QObject {
	Q_OBJECT
public:
	explicit ServiceAdvertiser(QObject* parent = nullptr);
	~ServiceAdvertiser() override;

	bool start(const QString& alias, quint16 controlPort,
	           quint16 discoveryPort, int intervalMs, QString& errorString);
	void stop();
	bool isRunning() const { return running_; }

	QByteArray announcement() const;

public slots:
	void setAlias(const QString& alias);
	void announce();

private slots:
	void handleReadyRead();

private:
	QUdpSocket socket_;
	QTimer timer_;
	bool running_ = false;

	QString alias_;
	quint16 controlPort_ = DEFAULT_CONTROL_PORT;
	quint16 discoveryPort_ = DEFAULT_DISCOVERY_PORT;
};
