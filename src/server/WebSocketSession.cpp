#include "WebSocketSession.hpp"

#include <QWebSocket>
#include <QDebug>

#include "include/fleet_logging.hpp"

WebSocketSession::WebSocketSession(QWebSocket* socket, QObject* parent)
	: WebSocketClient(parent)
	, socket_(socket)
{
	socket_->setParent(this);
	peer_ = QStringLiteral("%1:%2").arg(socket_->peerAddress().toString()).arg(socket_->peerPort());

	connect(socket_, &QWebSocket::textMessageReceived, this, &WebSocketClient::textReceived);
	connect(socket_, &QWebSocket::binaryMessageReceived, this, [this](const QByteArray& data) {
		qCDebug(LC_WS) << "[WebSocketSession] binary frame ignored from" << peer_ << data.size() << "bytes";
	});
	connect(socket_, &QWebSocket::disconnected, this, [this]() {
		qCInfo(LC_WS) << "[WebSocketSession] disconnected" << peer_;
		emit disconnected();
		deleteLater();
	});
}

WebSocketSession::~WebSocketSession() = default;

bool WebSocketSession::sendText(const QString& payload)
{
	if (closing_ || socket_->state() != QAbstractSocket::ConnectedState) return false;

	const qint64 sent = socket_->sendTextMessage(payload);
	if (sent < payload.toUtf8().size()) {
		qCWarning(LC_WS) << "[WebSocketSession] send failed to" << peer_ << socket_->errorString();
		close();
		return false;
	}
	return true;
}

void WebSocketSession::close()
{
	if (closing_) return;
	closing_ = true;
	socket_->close(QWebSocketProtocol::CloseCodeGoingAway);
}
