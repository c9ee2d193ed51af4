#include "ApiError.hpp"

#include <QJsonDocument>

ApiError::ApiError(ApiErrorKind kind, QString code, QString message, int httpStatus)
    : std::runtime_error(QStringLiteral("%1: %2").arg(code, message).toStdString())
    , kind_(kind)
    , code_(std::move(code))
    , message_(std::move(message))
    , httpStatus_(httpStatus)
{
}

QJsonObject ApiError::toJson() const
{
    return QJsonObject{{"code", code_}, {"message", message_}};
}

QByteArray ApiError::toBody() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

ApiError ApiError::unauthorized()
{
    return ApiError(ApiErrorKind::Auth, ErrorCode::Unauthorized,
                    QStringLiteral("Invalid or missing bearer token"), 401);
}

ApiError ApiError::invalidRequest(const QString& detail)
{
    return ApiError(ApiErrorKind::Validation, ErrorCode::InvalidRequest,
                    QStringLiteral("Invalid request: %1").arg(detail), 400);
}

ApiError ApiError::missingBody()
{
    return ApiError(ApiErrorKind::Validation, ErrorCode::MissingBody,
                    QStringLiteral("Request body is required"), 400);
}

ApiError ApiError::invalidAlias(const QString& detail)
{
    return ApiError(ApiErrorKind::Validation, ErrorCode::InvalidAlias, detail, 400);
}

ApiError ApiError::notFound(const QString& detail)
{
    return ApiError(ApiErrorKind::NotFound, ErrorCode::NotFound,
                    QStringLiteral("Resource not found: %1").arg(detail), 404);
}

ApiError ApiError::rateLimited(qint64 waitMs)
{
    return ApiError(ApiErrorKind::RateLimit, ErrorCode::RateLimited,
                    QStringLiteral("Too many requests, wait %1ms").arg(waitMs), 429);
}

ApiError ApiError::upstream(const char* code, const QString& detail)
{
    return ApiError(ApiErrorKind::Upstream, QString::fromLatin1(code), detail, 500);
}

ApiError ApiError::internal(const QString& detail)
{
    return ApiError(ApiErrorKind::Upstream, ErrorCode::InternalError,
                    QStringLiteral("Internal server error: %1").arg(detail), 500);
}

ApiError ApiError::timeout(const QString& detail)
{
    return ApiError(ApiErrorKind::Timeout, ErrorCode::Timeout, detail, 408);
}

ApiError ApiError::encodingFailed(const QString& detail)
{
    return ApiError(ApiErrorKind::Encoding, ErrorCode::EncodingFailed,
                    QStringLiteral("Failed to encode response: %1").arg(detail), 500);
}

ApiError ApiError::notImplemented(const QString& detail)
{
    return ApiError(ApiErrorKind::NotImplemented, ErrorCode::NotImplemented, detail, 501);
}
