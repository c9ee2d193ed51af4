#pragma once
#include <QLoggingCategory>

// Filter with QLoggingCategory rules, e.g. "camfleet.http.debug=false"
Q_DECLARE_LOGGING_CATEGORY(LC_HTTP)
Q_DECLARE_LOGGING_CATEGORY(LC_WS)
Q_DECLARE_LOGGING_CATEGORY(LC_AUTH)
Q_DECLARE_LOGGING_CATEGORY(LC_CAMERA)
Q_DECLARE_LOGGING_CATEGORY(LC_REGISTRY)
Q_DECLARE_LOGGING_CATEGORY(LC_DISCOVERY)
Q_DECLARE_LOGGING_CATEGORY(LC_ORCH)
Q_DECLARE_LOGGING_CATEGORY(LC_PROFILES)
