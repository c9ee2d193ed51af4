#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>
#include <memory>

#include "config/DeviceConfig.hpp"
#include "device/CameraService.hpp"
#include "device/HostStreamTransport.hpp"
#include "logger.hpp"
#include "log/SystemLogger.hpp"
#include "server/DeviceControlServer.hpp"
#include "server/ServiceAdvertiser.hpp"
#include "services/LogDatabase.hpp"
#include "services/SqlCommon.hpp"

static QString firstBacklight()
{
		const QDir dir(QStringLiteral(BACKLIGHT_PATH));
		const QStringList entries = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
		return entries.isEmpty() ? QString() : dir.absoluteFilePath(entries.first());
}

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("camfleet-device"));
				QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));

				DeviceConfig cfg;
				QString err;
				if (!cfg.parseArguments(app, err)) {
						LOG_CRITICAL(QStringLiteral("configuration error: %1").arg(err));
						return 2;
				}
				if (!cfg.logRules.isEmpty())
						QLoggingCategory::setFilterRules(QString(cfg.logRules).replace(QLatin1Char(';'), QLatin1Char('\n')));

				// DB 준비
				SqlCommon::setDbFilePath(cfg.logDbPath);
				LogDatabase logDb;
				if (!logDb.initializeDatabase()) {
						LOG_CRITICAL(QStringLiteral("log database initialization failed: %1").arg(cfg.logDbPath));
						return -1;
				}

				// 시스템로거 준비
				SystemLogger::init();
				SystemLogger::info("APP", QStringLiteral("camfleet-device starting, alias=%1 port=%2").arg(cfg.alias).arg(cfg.port));

				CameraService camera(std::make_unique<HostStreamTransport>(), cfg.alias);
				camera.setStatePath(cfg.statePath);
				camera.setBacklightPath(cfg.backlightPath.isEmpty() ? firstBacklight() : cfg.backlightPath);

				ControlServerOptions opts;
				opts.authEnabled         = cfg.authEnabled;
				opts.bearerToken         = cfg.bearerToken;
				opts.rateLimitIntervalMs = cfg.rateLimitIntervalMs;
				opts.telemetryIntervalMs = cfg.telemetryIntervalMs;

				DeviceControlServer server(camera, opts, &logDb);
				if (!server.start(QHostAddress::Any, cfg.port, err)) {
						LOG_CRITICAL(err);
						SystemLogger::critical("APP", err);
						SystemLogger::shutdown();
						return -1;
				}

				ServiceAdvertiser advertiser;
				if (cfg.advertise) {
						if (advertiser.start(camera.alias(), server.port(), cfg.discoveryPort,
						                     cfg.advertiseIntervalMs, err)) {
								QObject::connect(&camera, &CameraService::aliasChanged,
								                 &advertiser, &ServiceAdvertiser::setAlias);
						} else {
								// 광고 실패는 치명적이지 않음
								LOG_WARN(QStringLiteral("advertiser disabled: %1").arg(err));
								SystemLogger::warn("DISCOVERY", err);
						}
				}

				QObject::connect(&app, &QCoreApplication::aboutToQuit, &server, [&server, &advertiser]{
						advertiser.stop();
						server.stop();
						SystemLogger::info("APP", "aboutToQuit");
						SystemLogger::shutdown();
				});

				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
