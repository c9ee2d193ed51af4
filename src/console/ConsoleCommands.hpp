#pragma once
#include <QByteArray>
#include <QFile>
#include <QHash>
#include <QList>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "config/ConsoleConfig.hpp"
#include "console/CommandOrchestrator.hpp"
#include "console/DeviceClient.hpp"
#include "console/DeviceRegistry.hpp"
#include "console/DiscoveryService.hpp"
#include "console/ProfileStore.hpp"
#include "console/SettingsDebouncer.hpp"
#include "console/TelemetryLink.hpp"
#include "console/UdpServiceBrowser.hpp"

class QSocketNotifier;
class QTextStream;

struct ConsoleOptions {
	QString token;                          // --token, used by claim
	std::optional<QJsonObject> payload;     // --json
};

// Subcommands of camfleet-console. Each one runs asynchronously on the event
// loop and ends with finished(exitCode): 0 all ok, 1 some device failed,
// 2 usage/local error.
class ConsoleCommands : public QObject {
	Q_OBJECT
public:
	explicit ConsoleCommands(const ConsoleConfig& config, QObject* parent = nullptr);
	~ConsoleCommands() override;

	// Loads devices.json / profiles.json.
	bool initialize(QString& errorString);

	void execute(const QString& command, const QStringList& args, const ConsoleOptions& options);

	static QStringList commandNames();
	static QString usage();

	// Removes every complete line from pending (without its line break) and
	// leaves a trailing partial line in place.
	static QList<QByteArray> takeLines(QByteArray& pending);

	DeviceRegistry& registry() { return registry_; }
	CommandOrchestrator& orchestrator() { return orchestrator_; }
	ProfileStore& profiles() { return profiles_; }

signals:
	void finished(int exitCode);

private:
	using Command = std::function<void(const QStringList& args)>;
	void registerCommands_();

	// commands
	void cmdDevices(const QStringList& args);
	void cmdClaim(const QStringList& args);
	void cmdUnclaim(const QStringList& args);
	void cmdClear(const QStringList& args);
	void cmdRefresh(const QStringList& args);
	void cmdDiscover(const QStringList& args);
	void cmdStart(const QStringList& args);
	void cmdStop(const QStringList& args);
	void cmdCamera(const QStringList& args);
	void cmdVideo(const QStringList& args);
	void cmdKeyframe(const QStringList& args);
	void cmdDim(const QStringList& args);
	void cmdAlias(const QStringList& args);
	void cmdWbMeasure(const QStringList& args);
	void cmdTorch(const QStringList& args);
	void cmdTune(const QStringList& args);
	void cmdWatch(const QStringList& args);
	void cmdProfileList(const QStringList& args);
	void cmdProfileSave(const QStringList& args);
	void cmdProfileDelete(const QStringList& args);
	void cmdProfileApply(const QStringList& args);

	// helpers
	QStringList resolveTargets_(const QStringList& args) const;
	void printResults_(const GroupResults& results);
	void fail_(const QString& message, int code = 2);
	void done_(int code);
	void readTuneInput_();
	void handleTuneLine_(const QByteArray& line);
	void finishTuneIfIdle_();

private:
	ConsoleConfig config_;
	ConsoleOptions options_;

	DeviceClient client_;
	DeviceRegistry registry_;
	UdpServiceBrowser browser_;
	DiscoveryService discovery_;
	CommandOrchestrator orchestrator_;
	ProfileStore profiles_;
	SettingsDebouncer debouncer_;
	TelemetryLink telemetry_;

	QHash<QString, Command> commands_;

	// tune state
	QSocketNotifier* stdinNotifier_ = nullptr;
	QFile tuneInput_;
	QByteArray tuneBuffer_;
	QStringList tuneTargets_;
	int tuneInFlight_ = 0;
	bool tuneEof_ = false;
	bool tuneFailed_ = false;
};
