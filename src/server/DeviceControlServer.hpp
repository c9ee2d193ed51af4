#pragma once
#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QThreadPool>
#include <QWebSocketServer>
#include <memory>

#include "server/ApiHandlers.hpp"
#include "server/HttpRouter.hpp"
#include "server/Middleware.hpp"
#include "server/TelemetryBroadcaster.hpp"
#include "server/WebSocketHub.hpp"

class CameraControl;
class LogDatabase;
class QTcpSocket;
class WebSocketSession;

struct ControlServerOptions {
	bool authEnabled = false;
	QString bearerToken;
	int rateLimitIntervalMs = 50;
	int telemetryIntervalMs = 1000;
	int maxWorkers = 4;
};

// HTTP/1.1 + WebSocket endpoint of one device.
//
// Socket I/O stays on the thread owning the server; router dispatch runs on a
// private QThreadPool so a slow CameraControl call never stalls other
// connections. Each HTTP exchange is answered with "Connection: close".
class DeviceControlServer : public QObject {
	Q_OBJECT
public:
	explicit DeviceControlServer(CameraControl& camera,
	                             const ControlServerOptions& options,
	                             LogDatabase* logs = nullptr,
	                             QObject* parent = nullptr);
	~DeviceControlServer() override;

	// port 0 picks an ephemeral port; see port()
	bool start(const QHostAddress& address, quint16 port, QString& errorString);
	void stop();

	bool isListening() const { return tcp_.isListening(); }
	quint16 port() const { return tcp_.serverPort(); }

	HttpRouter& router() { return router_; }
	WebSocketHub& hub() { return hub_; }
	TelemetryBroadcaster& telemetry() { return telemetry_; }

signals:
	void requestServed(const QString& method, const QString& path, int status);

private slots:
	void handleNewConnection();
	void handleWebSocketConnection();

private:
	void handleReadyRead_(QTcpSocket* socket);
	void upgrade_(QTcpSocket* socket, const HttpRequest& req);
	void dispatch_(QTcpSocket* socket, const HttpRequest& req);
	void writeAndClose_(QTcpSocket* socket, const HttpResponse& resp);
	void handleWsCommand_(WebSocketSession* session, const QString& message);

private:
	CameraControl& camera_;
	ControlServerOptions options_;

	HttpRouter router_;
	ApiHandlers handlers_;
	std::shared_ptr<AuthMiddleware> auth_;
	std::shared_ptr<RateLimiter> rateLimiter_;

	QTcpServer tcp_;
	QWebSocketServer wsServer_;
	WebSocketHub hub_;
	TelemetryBroadcaster telemetry_;
	QThreadPool pool_;
};
