#include "HttpRouter.hpp"

#include <QElapsedTimer>
#include <QDebug>

#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"

QString HttpRouter::key(const QString& method, const QString& path)
{
	return method.toUpper() + QLatin1Char(' ') + path;
}

void HttpRouter::addMiddleware(std::shared_ptr<Middleware> m)
{
	middlewares_.push_back(std::move(m));
}

void HttpRouter::addRoute(const QString& method, const QString& path, Handler handler)
{
	const QString k = key(method, path);
	if (routes_.contains(k))
		qCWarning(LC_HTTP) << "[HttpRouter] route replaced:" << k;
	routes_.insert(k, std::move(handler));
}

bool HttpRouter::hasRoute(const QString& method, const QString& path) const
{
	return routes_.contains(key(method, path));
}

HttpResponse HttpRouter::dispatch_(const HttpRequest& req) const
{
	for (const auto& m : middlewares_) {
		if (auto shortCircuit = m->process(req))
			return *shortCircuit;
	}

	const auto it = routes_.constFind(key(req.method, req.path));
	if (it == routes_.constEnd())
		throw ApiError::notFound(QStringLiteral("Endpoint not found: %1 %2").arg(req.method, req.path));
	return it.value()(req);
}

HttpResponse HttpRouter::handle(const HttpRequest& req) const
{
	QElapsedTimer t;
	t.start();

	HttpResponse resp;
	try {
		resp = dispatch_(req);
	} catch (const ApiError& e) {
		resp = HttpResponse::json(e.httpStatus(), e.toJson());
	} catch (const std::exception& e) {
		qCCritical(LC_HTTP) << "[HttpRouter] unhandled exception on" << req.method << req.path << ":" << e.what();
		resp = HttpResponse::json(500, ApiError::internal(QString::fromUtf8(e.what()).left(200)).toJson());
	}

	CorsMiddleware::applyHeaders(resp);
	qCDebug(LC_HTTP).noquote() << req.method << req.path << "->" << resp.status
	                           << QStringLiteral("(%1 ms)").arg(t.elapsed());
	return resp;
}
