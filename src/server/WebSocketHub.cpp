#include "WebSocketHub.hpp"

#include <QList>
#include <QMutexLocker>
#include <QDebug>

#include "include/fleet_logging.hpp"

WebSocketHub::WebSocketHub(QObject* parent)
	: QObject(parent)
{
}

WebSocketHub::~WebSocketHub()
{
	QMutexLocker lock(&mutex_);
	clients_.clear();
}

void WebSocketHub::add(WebSocketClient* client)
{
	if (!client) return;

	int count = 0;
	{
		QMutexLocker lock(&mutex_);
		if (clients_.contains(client)) return;
		clients_.insert(client, QPointer<WebSocketClient>(client));
		count = clients_.size();
	}

	connect(client, &WebSocketClient::disconnected, this, [this, client]() { remove(client); });
	connect(client, &QObject::destroyed, this, [this, client]() { remove(client); });
	qCInfo(LC_WS) << "[WebSocketHub] client added" << client->peerName() << "total" << count;
	emit clientCountChanged(count);
}

void WebSocketHub::remove(WebSocketClient* client)
{
	int count = 0;
	{
		QMutexLocker lock(&mutex_);
		if (clients_.remove(client) == 0) return;
		count = clients_.size();
	}

	qCInfo(LC_WS) << "[WebSocketHub] client removed, total" << count;
	emit clientCountChanged(count);
}

int WebSocketHub::broadcast(const QString& payload)
{
	QList<QPointer<WebSocketClient>> snapshot;
	{
		QMutexLocker lock(&mutex_);
		snapshot = clients_.values();
	}

	int delivered = 0;
	for (const auto& c : snapshot) {
		if (!c) continue;
		// a failing client closes itself; removal follows its disconnected()
		if (c->sendText(payload)) ++delivered;
	}
	return delivered;
}

void WebSocketHub::closeAll()
{
	QList<QPointer<WebSocketClient>> snapshot;
	{
		QMutexLocker lock(&mutex_);
		snapshot = clients_.values();
		clients_.clear();
	}

	for (const auto& c : snapshot) {
		if (c) c->close();
	}
	if (!snapshot.isEmpty()) emit clientCountChanged(0);
}

int WebSocketHub::clientCount() const
{
	QMutexLocker lock(&mutex_);
	return clients_.size();
}
