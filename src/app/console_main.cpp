#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>

#include "config/ConsoleConfig.hpp"
#include "console/ConsoleCommands.hpp"
#include "logger.hpp"
#include "log/SystemLogger.hpp"
#include "services/LogDatabase.hpp"
#include "services/SqlCommon.hpp"

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral(CONSOLE_APP_NAME));
				QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));

				QCommandLineParser parser;
				parser.setApplicationDescription(QStringLiteral("camfleet console\n\n") + ConsoleCommands::usage());
				parser.addHelpOption();
				parser.addVersionOption();
				const QCommandLineOption dataOpt("data-dir", "Console data directory.", "dir");
				const QCommandLineOption timeoutOpt("timeout", "Per-request timeout in ms.", "ms");
				const QCommandLineOption tokenOpt("token", "Bearer token used when claiming.", "token");
				const QCommandLineOption jsonOpt("json", "JSON payload for the command.", "json");
				const QCommandLineOption rulesOpt("log-rules", "QLoggingCategory filter rules (';' separated).", "rules");
				parser.addOptions({dataOpt, timeoutOpt, tokenOpt, jsonOpt, rulesOpt});
				parser.addPositionalArgument("command", "One of: " + ConsoleCommands::commandNames().join(", "));
				parser.addPositionalArgument("args", "Command arguments.", "[args...]");
				parser.process(app);

				const QStringList positional = parser.positionalArguments();
				if (positional.isEmpty()) {
						parser.showHelp(2);
				}

				ConsoleConfig cfg;
				if (parser.isSet(dataOpt)) cfg.dataDir = parser.value(dataOpt);

				QString err;
				if (!cfg.load(err)) {
						LOG_CRITICAL(QStringLiteral("settings: %1").arg(err));
						return 2;
				}
				if (parser.isSet(timeoutOpt)) {
						bool ok = false;
						const int ms = parser.value(timeoutOpt).toInt(&ok);
						if (!ok || ms <= 0) {
								qCritical() << "[main] invalid --timeout" << parser.value(timeoutOpt);
								return 2;
						}
						cfg.requestTimeoutMs = ms;
				}
				if (parser.isSet(rulesOpt)) cfg.logRules = parser.value(rulesOpt);
				if (!cfg.logRules.isEmpty())
						QLoggingCategory::setFilterRules(QString(cfg.logRules).replace(QLatin1Char(';'), QLatin1Char('\n')));

				ConsoleOptions options;
				options.token = parser.value(tokenOpt);
				if (parser.isSet(jsonOpt)) {
						QJsonParseError perr;
						const QJsonDocument doc = QJsonDocument::fromJson(parser.value(jsonOpt).toUtf8(), &perr);
						if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
								qCritical() << "[main] --json must be a JSON object:" << perr.errorString();
								return 2;
						}
						options.payload = doc.object();
				}

				// DB 준비
				SqlCommon::setDbFilePath(cfg.filePath(CONSOLE_LOG_DB));
				LogDatabase logDb;
				if (logDb.initializeDatabase()) {
						SystemLogger::init();
				} else {
						LOG_WARN("console log database unavailable, continuing without it");
				}

				ConsoleCommands commands(cfg);
				if (!commands.initialize(err)) {
						qCritical() << "[main]" << err;
						SystemLogger::shutdown();
						return 2;
				}

				int exitCode = 0;
				QObject::connect(&commands, &ConsoleCommands::finished, &app, [&exitCode](int code) {
						exitCode = code;
						QCoreApplication::exit(code);
				});
				commands.execute(positional.first(), positional.mid(1), options);

				app.exec();
				SystemLogger::shutdown();
				return exitCode;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
