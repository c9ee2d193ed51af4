#pragma once
#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <optional>

struct HttpRequest {
    QString method;                      // upper case
    QString path;                        // query string stripped
    QString query;
    QHash<QByteArray, QByteArray> headers;   // keys lower-cased
    QByteArray body;
    QString peer;

    QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    bool hasBody() const { return !body.trimmed().isEmpty(); }
    bool isWebSocketUpgrade() const;
};

struct HttpResponse {
    int status = 200;
    QHash<QByteArray, QByteArray> headers;
    QByteArray body;

    static HttpResponse json(int status, const QJsonObject& obj);
    static HttpResponse jsonBody(int status, const QByteArray& encoded);
    static HttpResponse html(int status, const QByteArray& page);

    void setHeader(const QByteArray& name, const QByteArray& value) { headers.insert(name, value); }
    bool hasHeader(const QByteArray& name) const;

    // Status line, headers (Content-Length added) and body.
    QByteArray serialize() const;
};

namespace HttpWire {

// Result of inspecting the bytes buffered on a socket so far.
struct HeadParse {
    enum class State { NeedMore, Complete, Invalid } state = State::NeedMore;
    HttpRequest request;       // body not filled
    int headerBytes = 0;       // including the blank line
    qint64 contentLength = 0;
    QString error;
};

inline constexpr int kMaxHeaderBytes = 16 * 1024;
inline constexpr qint64 kMaxBodyBytes = 1024 * 1024;

HeadParse parseHead(const QByteArray& buffered);
QByteArray reasonPhrase(int status);

} // namespace HttpWire
