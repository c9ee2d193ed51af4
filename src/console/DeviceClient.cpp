#include "DeviceClient.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#include <QDebug>
#include <memory>

#include "include/fleet_logging.hpp"

QString DeviceReply::errorString() const
{
	switch (kind) {
		case DeviceFailureKind::None:
			return QString();
		case DeviceFailureKind::Http:
			return code.isEmpty()
			       ? QStringLiteral("HTTP %1: %2").arg(status).arg(message)
			       : QStringLiteral("HTTP %1 %2: %3").arg(status).arg(code, message);
		default:
			return QStringLiteral("%1: %2").arg(failureKindName(kind), message);
	}
}

std::optional<QJsonObject> DeviceReply::json() const
{
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject())
		return std::nullopt;
	return doc.object();
}

DeviceReply DeviceReply::failure(DeviceFailureKind kind, const QString& message)
{
	DeviceReply r;
	r.kind = kind;
	r.message = message;
	return r;
}

DeviceClient::DeviceClient(int timeoutMs, QObject* parent)
	: QObject(parent)
	, nam_(new QNetworkAccessManager(this))
	, timeoutMs_(timeoutMs)
{
}

DeviceClient::~DeviceClient() = default;

void DeviceClient::get(const DeviceEndpoint& ep, const QString& path, Callback cb)
{
	send(ep, QByteArrayLiteral("GET"), path, QByteArray(), std::move(cb));
}

void DeviceClient::post(const DeviceEndpoint& ep, const QString& path, const QJsonObject& body, Callback cb)
{
	send(ep, QByteArrayLiteral("POST"), path, QJsonDocument(body).toJson(QJsonDocument::Compact), std::move(cb));
}

void DeviceClient::put(const DeviceEndpoint& ep, const QString& path, const QJsonObject& body, Callback cb)
{
	send(ep, QByteArrayLiteral("PUT"), path, QJsonDocument(body).toJson(QJsonDocument::Compact), std::move(cb));
}

void DeviceClient::send(const DeviceEndpoint& ep, const QByteArray& verb, const QString& path,
                        const QByteArray& body, Callback cb)
{
	QUrl url;
	url.setScheme(QStringLiteral("http"));
	url.setHost(ep.host);
	url.setPort(ep.port);
	url.setPath(path);

	QNetworkRequest req(url);
	req.setRawHeader("Accept", "application/json");
	if (!body.isEmpty())
		req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
	if (!ep.token.isEmpty())
		req.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + ep.token.toUtf8());

	QNetworkReply* reply = nam_->sendCustomRequest(req, verb, body);
	if (!reply) {
		cb(DeviceReply::failure(DeviceFailureKind::Connection,
		                        QStringLiteral("request to %1 could not be sent").arg(url.toString())));
		return;
	}
	++inFlight_;

	// reply 에 묶인 타이머: 이 요청만 중단
	auto* timer = new QTimer(reply);
	timer->setSingleShot(true);
	QPointer<QNetworkReply> guardReply(reply);
	auto timedOut = std::make_shared<bool>(false);
	connect(timer, &QTimer::timeout, reply, [guardReply, timedOut]() {
		*timedOut = true;
		if (guardReply) guardReply->abort();
	});
	timer->start(timeoutMs_);

	const int timeoutMs = timeoutMs_;
	connect(reply, &QNetworkReply::finished, this, [this, reply, timer, timedOut, timeoutMs, verb, url, cb]() {
		timer->stop();
		--inFlight_;

		DeviceReply r;
		r.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
		r.body = reply->readAll();

		if (*timedOut) {
			r.kind = DeviceFailureKind::Timeout;
			r.message = QStringLiteral("no response from %1 within %2 ms").arg(url.authority()).arg(timeoutMs);
		} else if (r.status == 0) {
			r.kind = DeviceFailureKind::Connection;
			r.message = reply->errorString();
		} else if (r.status < 200 || r.status >= 300) {
			r.kind = DeviceFailureKind::Http;
			if (const auto o = r.json()) {
				r.code = o->value("code").toString();
				r.message = o->value("message").toString();
			}
			if (r.message.isEmpty())
				r.message = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
		} else if (!r.body.isEmpty() && !r.json() && !QJsonDocument::fromJson(r.body).isArray()) {
			r.kind = DeviceFailureKind::Protocol;
			r.message = QStringLiteral("unparseable response from %1 %2").arg(QString::fromLatin1(verb), url.path());
		}

		if (!r.ok())
			qCDebug(LC_ORCH) << "[DeviceClient]" << verb << url.toString() << "->" << r.errorString();

		reply->deleteLater();
		cb(r);
	});
}
