#pragma once
#include <QByteArray>
#include <QElapsedTimer>
#include <QHash>
#include <QMutex>
#include <QString>
#include <functional>
#include <optional>

#include "server/HttpTypes.hpp"

// One stage of the request pipeline. Returning a response short-circuits the
// chain, nullopt passes the request on, throwing ApiError rejects it.
class Middleware {
public:
	virtual ~Middleware() = default;
	virtual std::optional<HttpResponse> process(const HttpRequest& req) = 0;
};

class CorsMiddleware : public Middleware {
public:
	std::optional<HttpResponse> process(const HttpRequest& req) override;

	// Added to every response leaving the server.
	static void applyHeaders(HttpResponse& resp);
};

class AuthMiddleware : public Middleware {
public:
	AuthMiddleware(bool enabled, const QString& bearerToken);

	std::optional<HttpResponse> process(const HttpRequest& req) override;

	// Shared with the WebSocket upgrade path.
	bool authorize(const HttpRequest& req) const;
	bool enabled() const { return enabled_; }

private:
	bool enabled_;
	QByteArray expected_;     // "Bearer <token>"
};

// Minimum spacing between accepted requests of one path class.
class RateLimiter : public Middleware {
public:
	using Clock = std::function<qint64()>;              // monotonic ms
	using Classifier = std::function<QString(const QString& path)>;  // empty: not limited

	explicit RateLimiter(int minIntervalMs = 50,
	                     Classifier classifier = cameraPaths(),
	                     Clock clock = Clock());

	std::optional<HttpResponse> process(const HttpRequest& req) override;

	// Returns 0 when accepted (and records the time), else the remaining wait in ms.
	qint64 tryAcquire(const QString& path);

	int minIntervalMs() const { return minIntervalMs_; }

	static Classifier cameraPaths();     // any path containing "/camera"

private:
	const int minIntervalMs_;
	Classifier classifier_;
	Clock clock_;
	QElapsedTimer monotonic_;

	QMutex mutex_;
	QHash<QString, qint64> lastAccepted_;
};

// Constant-time equality for secrets of equal length.
bool constantTimeEquals(const QByteArray& a, const QByteArray& b);
