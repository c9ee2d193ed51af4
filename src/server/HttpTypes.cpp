#include "HttpTypes.hpp"

#include <QJsonDocument>
#include <QList>

bool HttpRequest::isWebSocketUpgrade() const
{
    return header("upgrade").toLower().contains("websocket");
}

HttpResponse HttpResponse::json(int status, const QJsonObject& obj)
{
    HttpResponse r;
    r.status = status;
    r.body = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    r.headers.insert("Content-Type", "application/json");
    return r;
}

HttpResponse HttpResponse::jsonBody(int status, const QByteArray& encoded)
{
    HttpResponse r;
    r.status = status;
    r.body = encoded;
    r.headers.insert("Content-Type", "application/json");
    return r;
}

HttpResponse HttpResponse::html(int status, const QByteArray& page)
{
    HttpResponse r;
    r.status = status;
    r.body = page;
    r.headers.insert("Content-Type", "text/html; charset=utf-8");
    return r;
}

bool HttpResponse::hasHeader(const QByteArray& name) const
{
    const QByteArray lower = name.toLower();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        if (it.key().toLower() == lower) return true;
    }
    return false;
}

QByteArray HttpResponse::serialize() const
{
    QByteArray out;
    out += "HTTP/1.1 " + QByteArray::number(status) + ' ' + HttpWire::reasonPhrase(status) + "\r\n";
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        if (it.key().compare("Content-Length", Qt::CaseInsensitive) == 0) continue;
        out += it.key() + ": " + it.value() + "\r\n";
    }
    out += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    out += "\r\n";
    out += body;
    return out;
}

namespace HttpWire {

HeadParse parseHead(const QByteArray& buffered)
{
    HeadParse p;
    const int headerEnd = buffered.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (buffered.size() > kMaxHeaderBytes) {
            p.state = HeadParse::State::Invalid;
            p.error = QStringLiteral("header section too large");
        }
        return p;
    }

    const QList<QByteArray> lines = buffered.left(headerEnd).split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    if (requestLine.size() < 3 || !requestLine[2].startsWith("HTTP/")) {
        p.state = HeadParse::State::Invalid;
        p.error = QStringLiteral("malformed request line");
        return p;
    }

    p.request.method = QString::fromLatin1(requestLine[0]).toUpper();
    const QString target = QString::fromUtf8(requestLine[1]);
    const int q = target.indexOf(QLatin1Char('?'));
    p.request.path  = q < 0 ? target : target.left(q);
    p.request.query = q < 0 ? QString() : target.mid(q + 1);

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty()) continue;
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            p.state = HeadParse::State::Invalid;
            p.error = QStringLiteral("malformed header line");
            return p;
        }
        p.request.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    const QByteArray cl = p.request.headers.value("content-length");
    if (!cl.isEmpty()) {
        bool ok = false;
        p.contentLength = cl.toLongLong(&ok);
        if (!ok || p.contentLength < 0 || p.contentLength > kMaxBodyBytes) {
            p.state = HeadParse::State::Invalid;
            p.error = QStringLiteral("bad Content-Length");
            return p;
        }
    }

    p.headerBytes = headerEnd + 4;
    p.state = HeadParse::State::Complete;
    return p;
}

QByteArray reasonPhrase(int status)
{
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

} // namespace HttpWire
