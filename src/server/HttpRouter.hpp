#pragma once
#include <QHash>
#include <QString>
#include <functional>
#include <memory>
#include <vector>

#include "server/HttpTypes.hpp"
#include "server/Middleware.hpp"

// Exact method+path dispatch behind an ordered middleware chain.
// Paths carry no parameters; "/api/v1/x/1" and "/api/v1/x/{id}" are unrelated.
class HttpRouter {
public:
	using Handler = std::function<HttpResponse(const HttpRequest&)>;

	void addMiddleware(std::shared_ptr<Middleware> m);
	void addRoute(const QString& method, const QString& path, Handler handler);
	bool hasRoute(const QString& method, const QString& path) const;
	int routeCount() const { return routes_.size(); }

	// Never throws: every failure becomes a {code, message} JSON response.
	HttpResponse handle(const HttpRequest& req) const;

private:
	static QString key(const QString& method, const QString& path);
	HttpResponse dispatch_(const HttpRequest& req) const;

private:
	std::vector<std::shared_ptr<Middleware>> middlewares_;
	QHash<QString, Handler> routes_;
};
