#include "include/fleet_logging.hpp"

Q_LOGGING_CATEGORY(LC_HTTP,      "camfleet.http")
Q_LOGGING_CATEGORY(LC_WS,        "camfleet.ws")
Q_LOGGING_CATEGORY(LC_AUTH,      "camfleet.auth")
Q_LOGGING_CATEGORY(LC_CAMERA,    "camfleet.camera")
Q_LOGGING_CATEGORY(LC_REGISTRY,  "camfleet.registry")
Q_LOGGING_CATEGORY(LC_DISCOVERY, "camfleet.discovery")
Q_LOGGING_CATEGORY(LC_ORCH,      "camfleet.orchestrator")
Q_LOGGING_CATEGORY(LC_PROFILES,  "camfleet.profiles")
