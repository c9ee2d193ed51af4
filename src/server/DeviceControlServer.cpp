#include "DeviceControlServer.hpp"

#include <QFutureWatcher>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QPointer>
#include <QTcpSocket>
#include <QWebSocket>
#include <QtConcurrent>
#include <optional>
#include <QDebug>

#include "device/CameraControl.hpp"
#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"
#include "server/WebSocketSession.hpp"

namespace {
const char* kInFlight = "camfleet_inflight";
}

DeviceControlServer::DeviceControlServer(CameraControl& camera,
                                         const ControlServerOptions& options,
                                         LogDatabase* logs,
                                         QObject* parent)
	: QObject(parent)
	, camera_(camera)
	, options_(options)
	, handlers_(camera, logs)
	, auth_(std::make_shared<AuthMiddleware>(options.authEnabled, options.bearerToken))
	, rateLimiter_(std::make_shared<RateLimiter>(options.rateLimitIntervalMs))
	, wsServer_(QStringLiteral("camfleet"), QWebSocketServer::NonSecureMode)
	, telemetry_(camera, hub_, options.telemetryIntervalMs)
{
	// CORS -> Auth -> RateLimit -> route
	router_.addMiddleware(std::make_shared<CorsMiddleware>());
	router_.addMiddleware(auth_);
	router_.addMiddleware(rateLimiter_);
	handlers_.registerRoutes(router_);

	pool_.setMaxThreadCount(qMax(1, options_.maxWorkers));

	connect(&tcp_, &QTcpServer::newConnection, this, &DeviceControlServer::handleNewConnection);
	connect(&wsServer_, &QWebSocketServer::newConnection, this, &DeviceControlServer::handleWebSocketConnection);
	connect(&wsServer_, &QWebSocketServer::serverError, this, [](QWebSocketProtocol::CloseCode code) {
		qCWarning(LC_WS) << "[DeviceControlServer] handshake rejected, close code" << int(code);
	});
}

DeviceControlServer::~DeviceControlServer()
{
	stop();
}

bool DeviceControlServer::start(const QHostAddress& address, quint16 port, QString& errorString)
{
	if (tcp_.isListening()) return true;

	if (!tcp_.listen(address, port)) {
		errorString = QStringLiteral("listen %1:%2 failed: %3")
		              .arg(address.toString()).arg(port).arg(tcp_.errorString());
		return false;
	}

	telemetry_.start();
	qCInfo(LC_HTTP) << "[DeviceControlServer] listening on" << address.toString() << tcp_.serverPort()
	                << (auth_->enabled() ? "(auth on)" : "(auth off)");
	return true;
}

void DeviceControlServer::stop()
{
	telemetry_.stop();
	hub_.closeAll();
	if (tcp_.isListening()) {
		tcp_.close();
		qCInfo(LC_HTTP) << "[DeviceControlServer] stopped";
	}
	// 핸들러가 router_/camera_ 를 참조하므로 모두 끝날 때까지 대기
	pool_.waitForDone();
}

void DeviceControlServer::handleNewConnection()
{
	while (QTcpSocket* socket = tcp_.nextPendingConnection()) {
		connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { handleReadyRead_(socket); });
		connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
	}
}

void DeviceControlServer::handleReadyRead_(QTcpSocket* socket)
{
	if (socket->property(kInFlight).toBool()) return;

	// Peek only: an upgrade hands the untouched bytes to QWebSocketServer.
	const QByteArray buffered = socket->peek(socket->bytesAvailable());
	HttpWire::HeadParse head = HttpWire::parseHead(buffered);

	switch (head.state) {
		case HttpWire::HeadParse::State::NeedMore:
			return;
		case HttpWire::HeadParse::State::Invalid: {
			qCDebug(LC_HTTP) << "[DeviceControlServer] bad request from" << socket->peerAddress().toString()
			                 << ":" << head.error;
			socket->setProperty(kInFlight, true);
			socket->readAll();
			HttpResponse resp = HttpResponse::json(400, ApiError::invalidRequest(head.error).toJson());
			CorsMiddleware::applyHeaders(resp);
			writeAndClose_(socket, resp);
			return;
		}
		case HttpWire::HeadParse::State::Complete:
			break;
	}

	HttpRequest req = head.request;
	req.peer = QStringLiteral("%1:%2").arg(socket->peerAddress().toString()).arg(socket->peerPort());

	if (req.isWebSocketUpgrade()) {
		upgrade_(socket, req);
		return;
	}

	if (buffered.size() < head.headerBytes + head.contentLength)
		return;   // body still arriving

	socket->setProperty(kInFlight, true);
	socket->read(head.headerBytes);
	req.body = socket->read(head.contentLength);
	dispatch_(socket, req);
}

void DeviceControlServer::upgrade_(QTcpSocket* socket, const HttpRequest& req)
{
	socket->setProperty(kInFlight, true);

	if (req.method != QLatin1String("GET") || req.path != QLatin1String(ApiPath::WebSocket)) {
		socket->readAll();
		HttpResponse resp = HttpResponse::json(404, ApiError::notFound(
			QStringLiteral("Endpoint not found: %1 %2").arg(req.method, req.path)).toJson());
		CorsMiddleware::applyHeaders(resp);
		writeAndClose_(socket, resp);
		return;
	}

	// 핸드셰이크 전에 인증
	if (!auth_->authorize(req)) {
		qCInfo(LC_AUTH) << "[DeviceControlServer] websocket upgrade rejected from" << req.peer;
		socket->readAll();
		HttpResponse resp = HttpResponse::json(401, ApiError::unauthorized().toJson());
		CorsMiddleware::applyHeaders(resp);
		writeAndClose_(socket, resp);
		return;
	}

	// Hand the socket over untouched; QWebSocketServer reads the handshake itself.
	disconnect(socket, nullptr, this, nullptr);
	disconnect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
	socket->setParent(nullptr);
	wsServer_.handleConnection(socket);
}

void DeviceControlServer::handleWebSocketConnection()
{
	while (wsServer_.hasPendingConnections()) {
		QWebSocket* ws = wsServer_.nextPendingConnection();
		if (!ws) break;

		auto* session = new WebSocketSession(ws, this);
		connect(session, &WebSocketClient::textReceived, this, [this, session](const QString& message) {
			handleWsCommand_(session, message);
		});
		hub_.add(session);
		qCInfo(LC_WS) << "[DeviceControlServer] websocket client" << session->peerName()
		              << "connected," << hub_.clientCount() << "total";
	}
}

void DeviceControlServer::handleWsCommand_(WebSocketSession* session, const QString& message)
{
	// Envelope only; the settings themselves are validated by the camera handler.
	QString op;
	std::optional<QJsonObject> camera;
	try {
		const QJsonObject frame = JsonFields::parseObject(message.toUtf8());
		op = JsonFields::requireString(frame, "op");
		camera = JsonFields::optionalObject(frame, "camera");
	} catch (const ApiError& e) {
		qCWarning(LC_WS) << "[DeviceControlServer] malformed frame from" << session->peerName() << ":" << e.message();
		return;
	}

	if (op != QLatin1String("set") || !camera) {
		qCDebug(LC_WS) << "[DeviceControlServer] unsupported op" << op << "from" << session->peerName();
		return;
	}

	// Same path as REST: middleware chain (incl. rate limiter) and handler.
	HttpRequest req;
	req.method = QStringLiteral("POST");
	req.path = QString::fromLatin1(ApiPath::Camera);
	req.peer = session->peerName();
	req.headers.insert("content-type", "application/json");
	if (auth_->enabled())
		req.headers.insert("authorization", QByteArrayLiteral("Bearer ") + options_.bearerToken.toUtf8());
	req.body = QJsonDocument(*camera).toJson(QJsonDocument::Compact);

	QPointer<WebSocketSession> guard(session);
	auto* watcher = new QFutureWatcher<HttpResponse>(this);
	connect(watcher, &QFutureWatcher<HttpResponse>::finished, this, [this, watcher, guard, req]() {
		const HttpResponse resp = watcher->result();
		watcher->deleteLater();
		emit requestServed(req.method, req.path, resp.status);
		if (resp.status < 400) return;

		qCInfo(LC_WS) << "[DeviceControlServer] ws set from" << req.peer << "failed with" << resp.status;
		// 오류는 요청한 클라이언트에게만
		if (guard) guard->sendText(QString::fromUtf8(resp.body));
	});
	watcher->setFuture(QtConcurrent::run(&pool_, [this, req]() { return router_.handle(req); }));
}

void DeviceControlServer::dispatch_(QTcpSocket* socket, const HttpRequest& req)
{
	QPointer<QTcpSocket> guard(socket);
	auto* watcher = new QFutureWatcher<HttpResponse>(this);
	connect(watcher, &QFutureWatcher<HttpResponse>::finished, this, [this, watcher, guard, req]() {
		const HttpResponse resp = watcher->result();
		watcher->deleteLater();
		emit requestServed(req.method, req.path, resp.status);
		if (!guard) {
			qCDebug(LC_HTTP) << "[DeviceControlServer] client left before response" << req.method << req.path;
			return;
		}
		writeAndClose_(guard, resp);
	});
	watcher->setFuture(QtConcurrent::run(&pool_, [this, req]() { return router_.handle(req); }));
}

void DeviceControlServer::writeAndClose_(QTcpSocket* socket, const HttpResponse& resp)
{
	HttpResponse out = resp;
	out.setHeader("Connection", "close");
	socket->write(out.serialize());
	socket->disconnectFromHost();
}
