#pragma once
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QString>

// Live connection handle. The Hub never owns one; a client that fails to
// send closes itself and announces it through disconnected().
class WebSocketClient : public QObject {
	Q_OBJECT
public:
	using QObject::QObject;
	~WebSocketClient() override = default;

	virtual bool sendText(const QString& payload) = 0;
	virtual void close() = 0;
	virtual QString peerName() const = 0;

signals:
	void disconnected();
	void textReceived(const QString& message);
};

class WebSocketHub : public QObject {
	Q_OBJECT
public:
	explicit WebSocketHub(QObject* parent = nullptr);
	~WebSocketHub() override;

	// Also subscribes to the client's disconnected() for removal.
	void add(WebSocketClient* client);
	void remove(WebSocketClient* client);

	// Point-in-time snapshot under the lock, sends outside it.
	// Returns the number of clients the payload was handed to.
	int broadcast(const QString& payload);

	void closeAll();
	int clientCount() const;

signals:
	void clientCountChanged(int count);

private:
	mutable QMutex mutex_;
	QHash<WebSocketClient*, QPointer<WebSocketClient>> clients_;
};
