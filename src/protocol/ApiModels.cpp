#include "ApiModels.hpp"
#include "ApiError.hpp"
#include "JsonFields.hpp"

#include <QJsonArray>

using namespace JsonFields;

namespace {
const QStringList kAutoManual{QStringLiteral("auto"), QStringLiteral("manual")};
const QStringList kCameraPositions{QStringLiteral("front"), QStringLiteral("back")};
const QStringList kLenses{QStringLiteral("ultra_wide"), QStringLiteral("wide"), QStringLiteral("telephoto")};
const QStringList kCodecs{QStringLiteral("h264"), QStringLiteral("hevc")};
}

QString ndiStateName(NdiState s)
{
    return s == NdiState::Streaming ? QStringLiteral("streaming") : QStringLiteral("idle");
}

NdiState ndiStateFromName(const QString& s)
{
    if (s == QLatin1String("streaming")) return NdiState::Streaming;
    if (s == QLatin1String("idle")) return NdiState::Idle;
    throw ApiError::invalidRequest(QStringLiteral("unknown ndi_state '%1'").arg(s));
}

QString chargingStateName(ChargingState s)
{
    switch (s) {
        case ChargingState::Charging:  return QStringLiteral("charging");
        case ChargingState::Full:      return QStringLiteral("full");
        case ChargingState::Unplugged: return QStringLiteral("unplugged");
    }
    return QStringLiteral("unplugged");
}

ChargingState chargingStateFromName(const QString& s)
{
    if (s == QLatin1String("charging")) return ChargingState::Charging;
    if (s == QLatin1String("full")) return ChargingState::Full;
    if (s == QLatin1String("unplugged")) return ChargingState::Unplugged;
    throw ApiError::invalidRequest(QStringLiteral("unknown charging_state '%1'").arg(s));
}

// ---------- CurrentSettings ----------
QJsonObject CurrentSettings::toJson() const
{
    QJsonObject o;
    o["resolution"]      = resolution;
    o["fps"]             = fps;
    o["bitrate"]         = bitrate;
    o["codec"]           = codec;
    o["wb_mode"]         = wbMode;
    putOptional(o, "wb_kelvin", wbKelvin);
    putOptional(o, "wb_tint", wbTint);
    o["iso_mode"]        = isoMode;
    o["iso"]             = iso;
    o["shutter_mode"]    = shutterMode;
    o["shutter_s"]       = shutterS;
    o["focus_mode"]      = focusMode;
    o["zoom_factor"]     = zoomFactor;
    o["camera_position"] = cameraPosition;
    o["lens"]            = lens;
    return o;
}

CurrentSettings CurrentSettings::fromJson(const QJsonObject& o)
{
    CurrentSettings c;
    c.resolution = requireString(o, "resolution");
    c.fps        = static_cast<int>(requireInt(o, "fps"));
    c.bitrate    = requireInt(o, "bitrate");
    c.codec      = requireString(o, "codec");
    c.wbMode     = requireString(o, "wb_mode");
    c.wbKelvin   = optionalInt(o, "wb_kelvin");
    c.wbTint     = optionalDouble(o, "wb_tint");
    c.iso        = static_cast<int>(requireInt(o, "iso"));
    c.shutterS   = requireDouble(o, "shutter_s");
    c.focusMode  = requireString(o, "focus_mode");
    c.zoomFactor = requireDouble(o, "zoom_factor");
    // older firmware omits these
    c.isoMode        = optionalString(o, "iso_mode").value_or(c.isoMode);
    c.shutterMode    = optionalString(o, "shutter_mode").value_or(c.shutterMode);
    c.cameraPosition = optionalString(o, "camera_position").value_or(c.cameraPosition);
    c.lens           = optionalString(o, "lens").value_or(c.lens);
    return c;
}

// ---------- Telemetry ----------
QJsonObject Telemetry::toJson() const
{
    QJsonObject o;
    o["fps"]       = fps;
    o["bitrate"]   = bitrate;
    o["battery"]   = battery;
    o["temp_c"]    = tempC;
    o["wifi_rssi"] = wifiRssi;
    o["cpu_usage"] = cpuUsage;
    putOptional(o, "queue_ms", queueMs);
    putOptional(o, "dropped_frames", droppedFrames);
    if (chargingState) o["charging_state"] = chargingStateName(*chargingState);
    return o;
}

Telemetry Telemetry::fromJson(const QJsonObject& o)
{
    Telemetry t;
    t.fps           = requireDouble(o, "fps");
    t.bitrate       = requireInt(o, "bitrate");
    t.battery       = requireDouble(o, "battery");
    t.tempC         = requireDouble(o, "temp_c");
    t.wifiRssi      = static_cast<int>(requireInt(o, "wifi_rssi"));
    t.cpuUsage      = optionalDouble(o, "cpu_usage").value_or(0.0);
    t.queueMs       = optionalInt(o, "queue_ms");
    t.droppedFrames = optionalInt(o, "dropped_frames");
    if (const auto cs = optionalString(o, "charging_state"))
        t.chargingState = chargingStateFromName(*cs);
    return t;
}

// ---------- Capability ----------
QJsonObject Capability::toJson() const
{
    QJsonArray fpsArr;
    for (int f : fps) fpsArr.append(f);
    QJsonObject o;
    o["resolution"] = resolution;
    o["fps"]        = fpsArr;
    o["codec"]      = QJsonArray::fromStringList(codec);
    putOptional(o, "lens", lens);
    putOptional(o, "max_zoom", maxZoom);
    return o;
}

Capability Capability::fromJson(const QJsonObject& o)
{
    Capability c;
    c.resolution = requireString(o, "resolution");
    for (const auto& v : requireArray(o, "fps")) {
        if (!v.isDouble()) throw ApiError::invalidRequest(QStringLiteral("field 'fps' must hold integers"));
        c.fps.append(v.toInt());
    }
    for (const auto& v : requireArray(o, "codec")) {
        if (!v.isString()) throw ApiError::invalidRequest(QStringLiteral("field 'codec' must hold strings"));
        c.codec.append(v.toString());
    }
    c.lens    = optionalString(o, "lens");
    c.maxZoom = optionalDouble(o, "max_zoom");
    return c;
}

QJsonArray capabilitiesToJson(const QList<Capability>& caps)
{
    QJsonArray arr;
    for (const auto& c : caps) arr.append(c.toJson());
    return arr;
}

// ---------- StatusResponse ----------
QJsonObject StatusResponse::toJson() const
{
    QJsonObject o;
    o["alias"]        = alias;
    o["ndi_state"]    = ndiStateName(ndiState);
    o["current"]      = current.toJson();
    o["telemetry"]    = telemetry.toJson();
    o["capabilities"] = capabilitiesToJson(capabilities);
    return o;
}

StatusResponse StatusResponse::fromJson(const QJsonObject& o)
{
    StatusResponse s;
    s.alias     = requireString(o, "alias");
    s.ndiState  = ndiStateFromName(requireString(o, "ndi_state"));
    s.current   = CurrentSettings::fromJson(requireObject(o, "current"));
    s.telemetry = Telemetry::fromJson(requireObject(o, "telemetry"));
    for (const auto& v : requireArray(o, "capabilities")) {
        if (!v.isObject()) throw ApiError::invalidRequest(QStringLiteral("field 'capabilities' must hold objects"));
        s.capabilities.append(Capability::fromJson(v.toObject()));
    }
    return s;
}

// ---------- StreamStartRequest ----------
QJsonObject StreamStartRequest::toJson() const
{
    return QJsonObject{
        {"resolution", resolution},
        {"framerate", framerate},
        {"bitrate", bitrate},
        {"codec", codec},
    };
}

StreamStartRequest StreamStartRequest::fromJson(const QJsonObject& o)
{
    StreamStartRequest r;
    r.resolution = requireString(o, "resolution");
    r.framerate  = static_cast<int>(requireInt(o, "framerate"));
    r.bitrate    = requireInt(o, "bitrate");
    r.codec      = requireString(o, "codec");
    if (r.framerate <= 0) throw ApiError::invalidRequest(QStringLiteral("field 'framerate' must be positive"));
    if (r.bitrate <= 0) throw ApiError::invalidRequest(QStringLiteral("field 'bitrate' must be positive"));
    return r;
}

StreamStartRequest StreamStartRequest::defaults()
{
    return StreamStartRequest{QStringLiteral("1920x1080"), 30, 10000000, QStringLiteral("h264")};
}

// ---------- CameraSettingsRequest ----------
bool CameraSettingsRequest::isEmpty() const
{
    return !wbMode && !wbKelvin && !wbTint && !isoMode && !iso && !shutterMode
        && !shutterS && !focusMode && !zoomFactor && !lens && !cameraPosition
        && !orientationLock && !torchLevel;
}

void CameraSettingsRequest::mergeFrom(const CameraSettingsRequest& other)
{
    if (other.wbMode)          wbMode = other.wbMode;
    if (other.wbKelvin)        wbKelvin = other.wbKelvin;
    if (other.wbTint)          wbTint = other.wbTint;
    if (other.isoMode)         isoMode = other.isoMode;
    if (other.iso)             iso = other.iso;
    if (other.shutterMode)     shutterMode = other.shutterMode;
    if (other.shutterS)        shutterS = other.shutterS;
    if (other.focusMode)       focusMode = other.focusMode;
    if (other.zoomFactor)      zoomFactor = other.zoomFactor;
    if (other.lens)            lens = other.lens;
    if (other.cameraPosition)  cameraPosition = other.cameraPosition;
    if (other.orientationLock) orientationLock = other.orientationLock;
    if (other.torchLevel)      torchLevel = other.torchLevel;
}

QJsonObject CameraSettingsRequest::toJson() const
{
    QJsonObject o;
    putOptional(o, "wb_mode", wbMode);
    putOptional(o, "wb_kelvin", wbKelvin);
    putOptional(o, "wb_tint", wbTint);
    putOptional(o, "iso_mode", isoMode);
    putOptional(o, "iso", iso);
    putOptional(o, "shutter_mode", shutterMode);
    putOptional(o, "shutter_s", shutterS);
    putOptional(o, "focus_mode", focusMode);
    putOptional(o, "zoom_factor", zoomFactor);
    putOptional(o, "lens", lens);
    putOptional(o, "camera_position", cameraPosition);
    putOptional(o, "orientation_lock", orientationLock);
    putOptional(o, "torch_level", torchLevel);
    return o;
}

CameraSettingsRequest CameraSettingsRequest::fromJson(const QJsonObject& o)
{
    CameraSettingsRequest r;
    r.wbMode          = optionalEnum(o, "wb_mode", kAutoManual);
    r.wbKelvin        = optionalInt(o, "wb_kelvin");
    r.wbTint          = optionalDouble(o, "wb_tint");
    r.isoMode         = optionalEnum(o, "iso_mode", kAutoManual);
    r.iso             = optionalInt(o, "iso");
    r.shutterMode     = optionalEnum(o, "shutter_mode", kAutoManual);
    r.shutterS        = optionalDouble(o, "shutter_s");
    r.focusMode       = optionalEnum(o, "focus_mode", kAutoManual);
    r.zoomFactor      = optionalDouble(o, "zoom_factor");
    r.lens            = optionalEnum(o, "lens", kLenses);
    r.cameraPosition  = optionalEnum(o, "camera_position", kCameraPositions);
    r.orientationLock = optionalString(o, "orientation_lock");
    r.torchLevel      = optionalDouble(o, "torch_level");

    if (r.wbKelvin && (*r.wbKelvin < 2000 || *r.wbKelvin > 10000))
        throw ApiError::invalidRequest(QStringLiteral("field 'wb_kelvin' must be within 2000..10000"));
    if (r.iso && *r.iso <= 0)
        throw ApiError::invalidRequest(QStringLiteral("field 'iso' must be positive"));
    if (r.shutterS && *r.shutterS <= 0.0)
        throw ApiError::invalidRequest(QStringLiteral("field 'shutter_s' must be positive"));
    if (r.zoomFactor && *r.zoomFactor < 1.0)
        throw ApiError::invalidRequest(QStringLiteral("field 'zoom_factor' must be >= 1.0"));
    if (r.torchLevel && (*r.torchLevel < 0.0 || *r.torchLevel > 1.0))
        throw ApiError::invalidRequest(QStringLiteral("field 'torch_level' must be within 0..1"));
    return r;
}

// ---------- VideoPreset / VideoSettings ----------
QJsonObject VideoPreset::toJson() const
{
    return QJsonObject{
        {"id", id}, {"name", name}, {"resolution", resolution},
        {"fps", fps}, {"codec", codec}, {"bitrate", bitrate},
    };
}

VideoPreset VideoPreset::fromJson(const QJsonObject& o)
{
    VideoPreset p;
    p.id         = requireString(o, "id");
    p.name       = requireString(o, "name");
    p.resolution = requireString(o, "resolution");
    p.fps        = static_cast<int>(requireInt(o, "fps"));
    p.codec      = requireString(o, "codec");
    p.bitrate    = requireInt(o, "bitrate");
    return p;
}

QList<VideoPreset> VideoPreset::builtin()
{
    return {
        {"low_power_1080p",    "Low Power 1080p",    "1920x1080", 30, "h264",  5000000},
        {"smooth_1080p60",     "Smooth 1080p60",     "1920x1080", 60, "h264", 10000000},
        {"high_quality_1080p", "High Quality 1080p", "1920x1080", 30, "hevc",  3500000},
        {"2k_cinematic",       "2K Cinematic",       "2560x1440", 30, "hevc",  7000000},
        {"2k_performance",     "2K Performance",     "2560x1440", 60, "hevc", 12000000},
        {"4k_standard",        "4K Standard",        "3840x2160", 30, "h264", 26000000},
        {"4k_efficient",       "4K Efficient",       "3840x2160", 30, "hevc", 16000000},
        {"4k_high_fps",        "4K High FPS",        "3840x2160", 60, "hevc", 30000000},
    };
}

std::optional<StreamStartRequest> VideoSettings::effective(const QList<VideoPreset>& presets) const
{
    if (selectedPresetId) {
        for (const auto& p : presets) {
            if (p.id == *selectedPresetId)
                return StreamStartRequest{p.resolution, p.fps, p.bitrate, p.codec};
        }
    }
    if (customResolution && customFps && customCodec && customBitrate)
        return StreamStartRequest{*customResolution, static_cast<int>(*customFps),
                                  *customBitrate, *customCodec};
    return std::nullopt;
}

QJsonObject VideoSettings::toJson() const
{
    QJsonObject o;
    putOptional(o, "selected_preset_id", selectedPresetId);
    putOptional(o, "custom_resolution", customResolution);
    putOptional(o, "custom_fps", customFps);
    putOptional(o, "custom_codec", customCodec);
    putOptional(o, "custom_bitrate", customBitrate);
    return o;
}

QJsonObject VideoSettings::toResponseJson(const QList<VideoPreset>& presets) const
{
    QJsonObject o = toJson();
    QJsonArray arr;
    for (const auto& p : presets) arr.append(p.toJson());
    o["available_presets"] = arr;
    return o;
}

VideoSettings VideoSettings::fromJson(const QJsonObject& o)
{
    VideoSettings v;
    v.selectedPresetId = optionalString(o, "selected_preset_id");
    v.customResolution = optionalString(o, "custom_resolution");
    v.customFps        = optionalInt(o, "custom_fps");
    v.customCodec      = optionalEnum(o, "custom_codec", kCodecs);
    v.customBitrate    = optionalInt(o, "custom_bitrate");
    if (v.customFps && *v.customFps <= 0)
        throw ApiError::invalidRequest(QStringLiteral("field 'custom_fps' must be positive"));
    if (v.customBitrate && *v.customBitrate <= 0)
        throw ApiError::invalidRequest(QStringLiteral("field 'custom_bitrate' must be positive"));
    return v;
}

VideoSettings VideoSettings::fromStream(const StreamStartRequest& s)
{
    VideoSettings v;
    v.customResolution = s.resolution;
    v.customFps        = s.framerate;
    v.customCodec      = s.codec;
    v.customBitrate    = s.bitrate;
    return v;
}

// ---------- small requests ----------
ScreenBrightnessRequest ScreenBrightnessRequest::fromJson(const QJsonObject& o)
{
    return ScreenBrightnessRequest{requireBool(o, "dimmed")};
}

AliasUpdateRequest AliasUpdateRequest::fromJson(const QJsonObject& o)
{
    const QString trimmed = requireString(o, "alias").trimmed();
    if (trimmed.isEmpty() || trimmed.size() > 64)
        throw ApiError::invalidAlias(QStringLiteral("Alias must be 1-64 characters"));
    return AliasUpdateRequest{trimmed};
}

// ---------- White balance / torch ----------
QJsonObject WhiteBalanceMeasurement::toJson() const
{
    return QJsonObject{{"scene_cct_k", sceneCctK}, {"tint", tint}};
}

WhiteBalanceMeasurement WhiteBalanceMeasurement::fromJson(const QJsonObject& o)
{
    return WhiteBalanceMeasurement{requireInt(o, "scene_cct_k"), requireDouble(o, "tint")};
}

TorchLevelRequest TorchLevelRequest::fromJson(const QJsonObject& o)
{
    const double level = requireDouble(o, "level");
    if (level < 0.0 || level > 1.0)
        throw ApiError::invalidRequest(QStringLiteral("field 'level' must be within 0..1"));
    return TorchLevelRequest{level};
}

TorchLevelResponse TorchLevelResponse::fromJson(const QJsonObject& o)
{
    return TorchLevelResponse{requireDouble(o, "current_level")};
}

// ---------- TelemetryFrame ----------
TelemetryFrame TelemetryFrame::from(const Telemetry& t, NdiState state)
{
    TelemetryFrame f;
    f.fps           = t.fps;
    f.bitrate       = t.bitrate;
    f.queueMs       = t.queueMs.value_or(0);
    f.battery       = t.battery;
    f.tempC         = t.tempC;
    f.wifiRssi      = t.wifiRssi;
    f.cpuUsage      = t.cpuUsage;
    f.ndiState      = state;
    f.droppedFrames = t.droppedFrames.value_or(0);
    f.chargingState = t.chargingState.value_or(ChargingState::Unplugged);
    return f;
}

QJsonObject TelemetryFrame::toJson() const
{
    QJsonObject o;
    o["fps"]            = fps;
    o["bitrate"]        = bitrate;
    o["queue_ms"]       = queueMs;
    o["battery"]        = battery;
    o["temp_c"]         = tempC;
    o["wifi_rssi"]      = wifiRssi;
    o["cpu_usage"]      = cpuUsage;
    o["ndi_state"]      = ndiStateName(ndiState);
    o["dropped_frames"] = droppedFrames;
    o["charging_state"] = chargingStateName(chargingState);
    return o;
}

TelemetryFrame TelemetryFrame::fromJson(const QJsonObject& o)
{
    TelemetryFrame f;
    f.fps           = requireDouble(o, "fps");
    f.bitrate       = requireInt(o, "bitrate");
    f.queueMs       = optionalInt(o, "queue_ms").value_or(0);
    f.battery       = requireDouble(o, "battery");
    f.tempC         = requireDouble(o, "temp_c");
    f.wifiRssi      = static_cast<int>(requireInt(o, "wifi_rssi"));
    f.cpuUsage      = optionalDouble(o, "cpu_usage").value_or(0.0);
    f.ndiState      = ndiStateFromName(requireString(o, "ndi_state"));
    f.droppedFrames = optionalInt(o, "dropped_frames").value_or(0);
    if (const auto cs = optionalString(o, "charging_state"))
        f.chargingState = chargingStateFromName(*cs);
    return f;
}

// ---------- SettingsBundle ----------
QJsonObject SettingsBundle::toJson() const
{
    QJsonObject o;
    if (stream) o["stream"] = stream->toJson();
    o["camera"] = camera.toJson();
    return o;
}

SettingsBundle SettingsBundle::fromJson(const QJsonObject& o)
{
    SettingsBundle b;
    if (const auto s = optionalObject(o, "stream"))
        b.stream = StreamStartRequest::fromJson(*s);
    b.camera = CameraSettingsRequest::fromJson(optionalObject(o, "camera").value_or(QJsonObject()));
    return b;
}

QJsonObject successJson(const QString& message)
{
    return QJsonObject{{"success", true}, {"message", message}};
}
