#include "Middleware.hpp"

#include <QMutexLocker>
#include <QDebug>

#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"

bool constantTimeEquals(const QByteArray& a, const QByteArray& b)
{
	if (a.size() != b.size()) return false;
	unsigned char diff = 0;
	for (int i = 0; i < a.size(); ++i)
		diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
	return diff == 0;
}

// ---------- CORS ----------
std::optional<HttpResponse> CorsMiddleware::process(const HttpRequest& req)
{
	if (req.method != QLatin1String("OPTIONS")) return std::nullopt;

	HttpResponse resp;
	resp.status = 200;
	resp.setHeader("Access-Control-Allow-Origin", "*");
	resp.setHeader("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
	resp.setHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
	resp.setHeader("Access-Control-Max-Age", "86400");
	return resp;
}

void CorsMiddleware::applyHeaders(HttpResponse& resp)
{
	if (!resp.hasHeader("Access-Control-Allow-Origin"))
		resp.setHeader("Access-Control-Allow-Origin", "*");
	if (!resp.hasHeader("Content-Type"))
		resp.setHeader("Content-Type", "application/json");
}

// ---------- Auth ----------
AuthMiddleware::AuthMiddleware(bool enabled, const QString& bearerToken)
	: enabled_(enabled)
	, expected_(QByteArrayLiteral("Bearer ") + bearerToken.toUtf8())
{
}

bool AuthMiddleware::authorize(const HttpRequest& req) const
{
	if (!enabled_) return true;
	const QByteArray got = req.header("authorization");
	if (got.isEmpty()) return false;
	return constantTimeEquals(got, expected_);
}

std::optional<HttpResponse> AuthMiddleware::process(const HttpRequest& req)
{
	if (!authorize(req)) {
		qCInfo(LC_AUTH) << "[AuthMiddleware] rejected" << req.method << req.path << "from" << req.peer;
		throw ApiError::unauthorized();
	}
	return std::nullopt;
}

// ---------- RateLimiter ----------
RateLimiter::Classifier RateLimiter::cameraPaths()
{
	return [](const QString& path) {
		return path.contains(QLatin1String("/camera")) ? QStringLiteral("camera") : QString();
	};
}

RateLimiter::RateLimiter(int minIntervalMs, Classifier classifier, Clock clock)
	: minIntervalMs_(minIntervalMs)
	, classifier_(std::move(classifier))
	, clock_(std::move(clock))
{
	monotonic_.start();
	if (!clock_) clock_ = [this] { return monotonic_.elapsed(); };
}

qint64 RateLimiter::tryAcquire(const QString& path)
{
	const QString cls = classifier_ ? classifier_(path) : QString();
	if (cls.isEmpty()) return 0;

	QMutexLocker lock(&mutex_);
	const qint64 now = clock_();
	const auto it = lastAccepted_.constFind(cls);
	if (it != lastAccepted_.constEnd()) {
		const qint64 elapsed = now - it.value();
		if (elapsed < minIntervalMs_)
			return qMax<qint64>(1, minIntervalMs_ - elapsed);
	}
	lastAccepted_.insert(cls, now);
	return 0;
}

std::optional<HttpResponse> RateLimiter::process(const HttpRequest& req)
{
	const qint64 waitMs = tryAcquire(req.path);
	if (waitMs > 0) {
		qCDebug(LC_HTTP) << "[RateLimiter]" << req.path << "limited, wait" << waitMs << "ms";
		throw ApiError::rateLimited(waitMs);
	}
	return std::nullopt;
}
