#pragma once
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <optional>

// Wire structs of the /api/v1 control protocol (snake_case JSON).
// fromJson() throws ApiError (INVALID_REQUEST) on schema violations.

enum class NdiState { Idle, Streaming };
enum class ChargingState { Unplugged, Charging, Full };

QString ndiStateName(NdiState s);
NdiState ndiStateFromName(const QString& s);
QString chargingStateName(ChargingState s);
ChargingState chargingStateFromName(const QString& s);

struct CurrentSettings {
    QString resolution = QStringLiteral("1920x1080");
    int fps = 30;
    qint64 bitrate = 10000000;
    QString codec = QStringLiteral("h264");
    QString wbMode = QStringLiteral("auto");
    std::optional<qint64> wbKelvin;
    std::optional<double> wbTint;
    QString isoMode = QStringLiteral("auto");
    int iso = 100;
    QString shutterMode = QStringLiteral("auto");
    double shutterS = 1.0 / 60.0;
    QString focusMode = QStringLiteral("auto");
    double zoomFactor = 1.0;
    QString cameraPosition = QStringLiteral("back");
    QString lens = QStringLiteral("wide");

    QJsonObject toJson() const;
    static CurrentSettings fromJson(const QJsonObject& o);
};

struct Telemetry {
    double fps = 0.0;
    qint64 bitrate = 0;
    double battery = 0.0;       // 0..1
    double tempC = 0.0;
    int wifiRssi = 0;
    double cpuUsage = 0.0;      // percent
    std::optional<qint64> queueMs;
    std::optional<qint64> droppedFrames;
    std::optional<ChargingState> chargingState;

    QJsonObject toJson() const;
    static Telemetry fromJson(const QJsonObject& o);
};

struct Capability {
    QString resolution;
    QList<int> fps;
    QStringList codec;
    std::optional<QString> lens;
    std::optional<double> maxZoom;

    QJsonObject toJson() const;
    static Capability fromJson(const QJsonObject& o);
};

QJsonArray capabilitiesToJson(const QList<Capability>& caps);

struct StatusResponse {
    QString alias;
    NdiState ndiState = NdiState::Idle;
    CurrentSettings current;
    Telemetry telemetry;
    QList<Capability> capabilities;

    QJsonObject toJson() const;
    static StatusResponse fromJson(const QJsonObject& o);
};

struct StreamStartRequest {
    QString resolution;
    int framerate = 0;
    qint64 bitrate = 0;
    QString codec;

    bool operator==(const StreamStartRequest& o) const {
        return resolution == o.resolution && framerate == o.framerate
            && bitrate == o.bitrate && codec == o.codec;
    }

    QJsonObject toJson() const;
    static StreamStartRequest fromJson(const QJsonObject& o);
    static StreamStartRequest defaults();   // 1920x1080 / 30 / 10 Mbps / h264
};

struct CameraSettingsRequest {
    std::optional<QString> wbMode;
    std::optional<qint64> wbKelvin;
    std::optional<double> wbTint;
    std::optional<QString> isoMode;
    std::optional<qint64> iso;
    std::optional<QString> shutterMode;
    std::optional<double> shutterS;
    std::optional<QString> focusMode;
    std::optional<double> zoomFactor;
    std::optional<QString> lens;
    std::optional<QString> cameraPosition;
    std::optional<QString> orientationLock;
    std::optional<double> torchLevel;

    bool isEmpty() const;
    // Fields set in other override ours.
    void mergeFrom(const CameraSettingsRequest& other);

    QJsonObject toJson() const;
    static CameraSettingsRequest fromJson(const QJsonObject& o);
};

struct VideoPreset {
    QString id;
    QString name;
    QString resolution;
    int fps = 30;
    QString codec;
    qint64 bitrate = 0;

    QJsonObject toJson() const;
    static VideoPreset fromJson(const QJsonObject& o);
    static QList<VideoPreset> builtin();
};

struct VideoSettings {
    std::optional<QString> selectedPresetId;
    std::optional<QString> customResolution;
    std::optional<qint64> customFps;
    std::optional<QString> customCodec;
    std::optional<qint64> customBitrate;

    // Preset wins when it resolves; otherwise all four custom fields are needed.
    std::optional<StreamStartRequest> effective(const QList<VideoPreset>& presets) const;

    QJsonObject toJson() const;
    QJsonObject toResponseJson(const QList<VideoPreset>& presets) const;
    static VideoSettings fromJson(const QJsonObject& o);
    static VideoSettings fromStream(const StreamStartRequest& s);
};

struct ScreenBrightnessRequest {
    bool dimmed = false;

    QJsonObject toJson() const { return QJsonObject{{"dimmed", dimmed}}; }
    static ScreenBrightnessRequest fromJson(const QJsonObject& o);
};

struct AliasUpdateRequest {
    QString alias;     // trimmed, 1..64 chars

    static AliasUpdateRequest fromJson(const QJsonObject& o);
};

// One-shot auto white balance result; the camera is left in auto mode.
struct WhiteBalanceMeasurement {
    qint64 sceneCctK = 0;
    double tint = 0.0;

    QJsonObject toJson() const;
    static WhiteBalanceMeasurement fromJson(const QJsonObject& o);
};

struct TorchLevelRequest {
    double level = 0.0;   // 0..1, 0 = off

    QJsonObject toJson() const { return QJsonObject{{"level", level}}; }
    static TorchLevelRequest fromJson(const QJsonObject& o);
};

struct TorchLevelResponse {
    double currentLevel = 0.0;

    QJsonObject toJson() const { return QJsonObject{{"current_level", currentLevel}}; }
    static TorchLevelResponse fromJson(const QJsonObject& o);
};

// Pushed to every WebSocket client once per telemetry tick.
struct TelemetryFrame {
    double fps = 0.0;
    qint64 bitrate = 0;
    qint64 queueMs = 0;
    double battery = 0.0;
    double tempC = 0.0;
    int wifiRssi = 0;
    double cpuUsage = 0.0;
    NdiState ndiState = NdiState::Idle;
    qint64 droppedFrames = 0;
    ChargingState chargingState = ChargingState::Unplugged;

    static TelemetryFrame from(const Telemetry& t, NdiState state);

    QJsonObject toJson() const;
    static TelemetryFrame fromJson(const QJsonObject& o);
};

// Named profile payload: optional stream settings plus camera settings.
struct SettingsBundle {
    std::optional<StreamStartRequest> stream;
    CameraSettingsRequest camera;

    QJsonObject toJson() const;
    static SettingsBundle fromJson(const QJsonObject& o);
};

QJsonObject successJson(const QString& message);

Q_DECLARE_METATYPE(TelemetryFrame)
Q_DECLARE_METATYPE(StatusResponse)
