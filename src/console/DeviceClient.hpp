#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <functional>
#include <optional>

#include "console/FleetTypes.hpp"

class QNetworkAccessManager;

struct DeviceEndpoint {
	QString host;
	quint16 port = 0;
	QString token;           // empty: no Authorization header
};

// Outcome of one HTTP exchange with a device. Never thrown; callers inspect kind.
struct DeviceReply {
	DeviceFailureKind kind = DeviceFailureKind::None;
	int status = 0;          // HTTP status when a response arrived
	QString code;            // server error code for Http failures
	QString message;
	QByteArray body;

	bool ok() const { return kind == DeviceFailureKind::None; }

	// "<KIND>: <detail>", e.g. "HTTP 429 RATE_LIMITED: Too many requests, wait 40ms"
	QString errorString() const;

	// Body as a JSON object; nullopt when it is not one.
	std::optional<QJsonObject> json() const;

	static DeviceReply failure(DeviceFailureKind kind, const QString& message);
};

// Async HTTP client for the /api/v1 surface. Every call is bounded by its own
// timer which aborts only that reply.
class DeviceClient : public QObject {
	Q_OBJECT
public:
	using Callback = std::function<void(const DeviceReply&)>;

	explicit DeviceClient(int timeoutMs = 5000, QObject* parent = nullptr);
	~DeviceClient() override;

	void setTimeoutMs(int ms) { timeoutMs_ = ms; }
	int timeoutMs() const { return timeoutMs_; }
	int inFlight() const { return inFlight_; }

	void get(const DeviceEndpoint& ep, const QString& path, Callback cb);
	void post(const DeviceEndpoint& ep, const QString& path, const QJsonObject& body, Callback cb);
	void put(const DeviceEndpoint& ep, const QString& path, const QJsonObject& body, Callback cb);

	void send(const DeviceEndpoint& ep, const QByteArray& verb, const QString& path,
	          const QByteArray& body, Callback cb);

private:
	QNetworkAccessManager* nam_;
	int timeoutMs_;
	int inFlight_ = 0;
};
