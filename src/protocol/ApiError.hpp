#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <stdexcept>

// Error vocabulary shared by the control server and the console client.
enum class ApiErrorKind {
    Auth,
    Validation,
    NotFound,
    RateLimit,
    Upstream,
    Timeout,
    Encoding,
    NotImplemented,
};

namespace ErrorCode {
    inline constexpr const char* Unauthorized          = "UNAUTHORIZED";
    inline constexpr const char* InvalidRequest        = "INVALID_REQUEST";
    inline constexpr const char* MissingBody           = "MISSING_BODY";
    inline constexpr const char* InvalidAlias          = "INVALID_ALIAS";
    inline constexpr const char* NotFound              = "NOT_FOUND";
    inline constexpr const char* RateLimited           = "RATE_LIMITED";
    inline constexpr const char* StreamStartFailed     = "STREAM_START_FAILED";
    inline constexpr const char* StreamStopFailed      = "STREAM_STOP_FAILED";
    inline constexpr const char* CameraUpdateFailed    = "CAMERA_UPDATE_FAILED";
    inline constexpr const char* VideoSettingsFailed   = "VIDEO_SETTINGS_UPDATE_FAILED";
    inline constexpr const char* KeyframeFailed        = "KEYFRAME_FAILED";
    inline constexpr const char* BrightnessFailed      = "BRIGHTNESS_UPDATE_FAILED";
    inline constexpr const char* AliasUpdateFailed     = "ALIAS_UPDATE_FAILED";
    inline constexpr const char* MeasureFailed         = "MEASURE_FAILED";
    inline constexpr const char* TorchUpdateFailed     = "TORCH_UPDATE_FAILED";
    inline constexpr const char* InternalError         = "INTERNAL_ERROR";
    inline constexpr const char* Timeout               = "TIMEOUT";
    inline constexpr const char* EncodingFailed        = "ENCODING_FAILED";
    inline constexpr const char* NotImplemented        = "NOT_IMPLEMENTED";
}

class ApiError : public std::runtime_error {
public:
    ApiError(ApiErrorKind kind, QString code, QString message, int httpStatus);

    ApiErrorKind kind() const { return kind_; }
    const QString& code() const { return code_; }
    const QString& message() const { return message_; }
    int httpStatus() const { return httpStatus_; }

    QJsonObject toJson() const;
    QByteArray toBody() const;

    static ApiError unauthorized();
    static ApiError invalidRequest(const QString& detail);
    static ApiError missingBody();
    static ApiError invalidAlias(const QString& detail);
    static ApiError notFound(const QString& detail);
    static ApiError rateLimited(qint64 waitMs);
    static ApiError upstream(const char* code, const QString& detail);
    static ApiError internal(const QString& detail);
    static ApiError timeout(const QString& detail);
    static ApiError encodingFailed(const QString& detail);
    static ApiError notImplemented(const QString& detail);

private:
    ApiErrorKind kind_;
    QString code_;
    QString message_;
    int httpStatus_;
};
