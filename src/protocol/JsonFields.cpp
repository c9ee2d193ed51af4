#include "JsonFields.hpp"
#include "ApiError.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace JsonFields {

namespace {

QJsonValue present(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        throw ApiError::invalidRequest(QStringLiteral("missing field '%1'").arg(QLatin1String(key)));
    return v;
}

[[noreturn]] void wrongType(const char* key, const char* expected)
{
    throw ApiError::invalidRequest(QStringLiteral("field '%1' must be %2")
                                       .arg(QLatin1String(key), QLatin1String(expected)));
}

qint64 asInt(const QJsonValue& v, const char* key)
{
    if (!v.isDouble()) wrongType(key, "an integer");
    const double d = v.toDouble();
    if (std::floor(d) != d) wrongType(key, "an integer");
    return v.toInteger();
}

void checkFinite(const QJsonValue& v, const QString& where)
{
    if (v.isDouble() && !std::isfinite(v.toDouble()))
        throw ApiError::encodingFailed(QStringLiteral("non-finite number at '%1'").arg(where));
    if (v.isObject()) {
        const QJsonObject o = v.toObject();
        for (auto it = o.begin(); it != o.end(); ++it)
            checkFinite(it.value(), where.isEmpty() ? it.key() : where + QLatin1Char('.') + it.key());
    } else if (v.isArray()) {
        const QJsonArray a = v.toArray();
        for (int i = 0; i < a.size(); ++i)
            checkFinite(a.at(i), QStringLiteral("%1[%2]").arg(where).arg(i));
    }
}

} // namespace

QByteArray encodeCompact(const QJsonObject& o)
{
    checkFinite(QJsonValue(o), QString());
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

QJsonObject parseObject(const QByteArray& body)
{
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
    if (perr.error != QJsonParseError::NoError)
        throw ApiError::invalidRequest(QStringLiteral("malformed JSON (%1 at offset %2)")
                                           .arg(perr.errorString()).arg(perr.offset));
    if (!doc.isObject())
        throw ApiError::invalidRequest(QStringLiteral("body must be a JSON object"));
    return doc.object();
}

QString requireString(const QJsonObject& o, const char* key)
{
    const QJsonValue v = present(o, key);
    if (!v.isString()) wrongType(key, "a string");
    return v.toString();
}

qint64 requireInt(const QJsonObject& o, const char* key)
{
    return asInt(present(o, key), key);
}

double requireDouble(const QJsonObject& o, const char* key)
{
    const QJsonValue v = present(o, key);
    if (!v.isDouble()) wrongType(key, "a number");
    return v.toDouble();
}

bool requireBool(const QJsonObject& o, const char* key)
{
    const QJsonValue v = present(o, key);
    if (!v.isBool()) wrongType(key, "a boolean");
    return v.toBool();
}

QJsonObject requireObject(const QJsonObject& o, const char* key)
{
    const QJsonValue v = present(o, key);
    if (!v.isObject()) wrongType(key, "an object");
    return v.toObject();
}

QJsonArray requireArray(const QJsonObject& o, const char* key)
{
    const QJsonValue v = present(o, key);
    if (!v.isArray()) wrongType(key, "an array");
    return v.toArray();
}

std::optional<QString> optionalString(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isString()) wrongType(key, "a string");
    return v.toString();
}

std::optional<qint64> optionalInt(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    return asInt(v, key);
}

std::optional<double> optionalDouble(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isDouble()) wrongType(key, "a number");
    return v.toDouble();
}

std::optional<bool> optionalBool(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isBool()) wrongType(key, "a boolean");
    return v.toBool();
}

std::optional<QJsonObject> optionalObject(const QJsonObject& o, const char* key)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isObject()) wrongType(key, "an object");
    return v.toObject();
}

std::optional<QString> optionalEnum(const QJsonObject& o, const char* key,
                                    const QStringList& allowed)
{
    const auto s = optionalString(o, key);
    if (s && !allowed.contains(*s)) {
        throw ApiError::invalidRequest(QStringLiteral("field '%1' must be one of: %2")
                                           .arg(QLatin1String(key), allowed.join(QStringLiteral(", "))));
    }
    return s;
}

} // namespace JsonFields
