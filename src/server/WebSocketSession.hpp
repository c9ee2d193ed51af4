#pragma once
#include <QString>

#include "server/WebSocketHub.hpp"

class QWebSocket;

// WebSocketClient over an accepted QWebSocket. Takes ownership of the socket
// and deletes itself after the connection drops.
class WebSocketSession : public WebSocketClient {
	Q_OBJECT
public:
	explicit WebSocketSession(QWebSocket* socket, QObject* parent = nullptr);
	~WebSocketSession() override;

	bool sendText(const QString& payload) override;
	void close() override;
	QString peerName() const override { return peer_; }

private:
	QWebSocket* socket_;
	QString peer_;
	bool closing_ = false;
};
