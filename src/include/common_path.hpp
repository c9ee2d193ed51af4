#pragma once

// Device daemon
#define DEVICE_ROOT								"/var/lib/camfleet/"
#define DEVICE_CONFIG_FILE						"/etc/camfleet/device.json"
#define DEVICE_LOG_DB_PATH						DEVICE_ROOT "db/"
#define DEVICE_LOG_DB							"camfleet-device.db"

// Host sensors read by the stand-in transport
#define THERMAL_ZONE_TEMP						"/sys/class/thermal/thermal_zone0/temp"
#define POWER_SUPPLY_PATH						"/sys/class/power_supply/"
#define PROC_NET_WIRELESS						"/proc/net/wireless"
#define PROC_STAT								"/proc/stat"
#define BACKLIGHT_PATH							"/sys/class/backlight/"

// Console (relative to QStandardPaths::AppDataLocation unless overridden)
#define CONSOLE_APP_NAME						"camfleet"
#define CONSOLE_SETTINGS_FILE					"settings.json"
#define CONSOLE_DEVICES_FILE					"devices.json"
#define CONSOLE_PROFILES_FILE					"profiles.json"
#define CONSOLE_LOG_DB							"camfleet-console.db"

// Network defaults
#define DEFAULT_CONTROL_PORT					8888
#define DEFAULT_DISCOVERY_PORT					53530
#define DISCOVERY_SERVICE_TYPE					"_camfleet._tcp"
#define DISCOVERY_PROTOCOL						"camfleet-v1"
#define DISCOVERY_VERSION						"1.0"
