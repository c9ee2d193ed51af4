#pragma once
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

// Typed field access for request/response decoding.
// Every failure throws ApiError::invalidRequest naming the field.
namespace JsonFields {

QJsonObject parseObject(const QByteArray& body);

QString requireString(const QJsonObject& o, const char* key);
qint64 requireInt(const QJsonObject& o, const char* key);
double requireDouble(const QJsonObject& o, const char* key);
bool requireBool(const QJsonObject& o, const char* key);
QJsonObject requireObject(const QJsonObject& o, const char* key);
QJsonArray requireArray(const QJsonObject& o, const char* key);

// Absent or null yields nullopt; a present value of the wrong type throws.
std::optional<QString> optionalString(const QJsonObject& o, const char* key);
std::optional<qint64> optionalInt(const QJsonObject& o, const char* key);
std::optional<double> optionalDouble(const QJsonObject& o, const char* key);
std::optional<bool> optionalBool(const QJsonObject& o, const char* key);
std::optional<QJsonObject> optionalObject(const QJsonObject& o, const char* key);

// Restricts a string to a fixed vocabulary, e.g. {"auto", "manual"}.
std::optional<QString> optionalEnum(const QJsonObject& o, const char* key,
                                    const QStringList& allowed);

// Compact serialization; non-finite numbers throw ApiError (ENCODING_FAILED).
QByteArray encodeCompact(const QJsonObject& o);

template <typename T>
void putOptional(QJsonObject& o, const char* key, const std::optional<T>& v)
{
    if (v) o.insert(QLatin1String(key), *v);
}

} // namespace JsonFields
