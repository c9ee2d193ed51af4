#include "ConsoleCommands.hpp"

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSocketNotifier>
#include <QTextStream>
#include <QTimer>
#include <QDebug>
#include <cstdio>
#include <memory>

#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"

namespace {

QTextStream& out()
{
	static QTextStream s(stdout);
	return s;
}

QTextStream& err()
{
	static QTextStream s(stderr);
	return s;
}

void printJson(const QJsonObject& o)
{
	out() << QJsonDocument(o).toJson(QJsonDocument::Indented);
	out().flush();
}

QJsonObject deviceJson(const Device& d)
{
	QJsonObject o = d.toJson();
	o.remove("token");
	o.insert("liveness", livenessName(d.liveness));
	if (d.status) {
		o.insert("ndi_state", ndiStateName(d.status->ndiState));
		o.insert("current", d.status->current.toJson());
	}
	if (d.telemetry) o.insert("telemetry", d.telemetry->toJson());
	return o;
}

QJsonObject candidateJson(const DiscoveredCandidate& c)
{
	return QJsonObject{
		{"id", c.id()}, {"alias", c.alias}, {"host", c.host}, {"port", int(c.port)},
		{"txt", QJsonObject{{"alias", c.alias}, {"version", c.version}, {"protocol", c.protocol}}},
	};
}

} // namespace

ConsoleCommands::ConsoleCommands(const ConsoleConfig& config, QObject* parent)
	: QObject(parent)
	, config_(config)
	, client_(config.requestTimeoutMs)
	, registry_(client_, config.filePath(CONSOLE_DEVICES_FILE), config.offlineAfterFailures)
	, browser_(config.discoveryPort, config.discoveryWindowMs)
	, discovery_(browser_, registry_)
	, orchestrator_(registry_, client_)
	, profiles_(config.filePath(CONSOLE_PROFILES_FILE))
	, debouncer_(config.debounceMs)
	, telemetry_(registry_, config.alerts)
{
	registerCommands_();
}

ConsoleCommands::~ConsoleCommands() = default;

bool ConsoleCommands::initialize(QString& errorString)
{
	if (!registry_.load(errorString)) return false;
	if (!profiles_.load(errorString)) return false;
	return true;
}

QStringList ConsoleCommands::commandNames()
{
	return {"devices", "claim", "unclaim", "clear", "refresh", "discover",
	        "start", "stop", "camera", "video", "keyframe", "dim", "alias", "wb-measure", "torch",
	        "tune", "watch",
	        "profile-list", "profile-save", "profile-delete", "profile-apply"};
}

QString ConsoleCommands::usage()
{
	return QStringLiteral(
		"commands:\n"
		"  devices                         list claimed devices\n"
		"  claim <host> [port]             query and claim a device (--token)\n"
		"  unclaim <id>                    forget a device\n"
		"  clear                           forget every device\n"
		"  refresh                         re-query status of every device\n"
		"  discover                        browse once and list new candidates\n"
		"  start <ids...|all>              start streaming (--json stream settings)\n"
		"  stop <ids...|all>               stop streaming\n"
		"  camera <ids...|all>             apply camera settings (--json)\n"
		"  video <ids...|all>              apply video settings (--json)\n"
		"  keyframe <ids...|all>           request a keyframe\n"
		"  dim <on|off> <ids...|all>       dim or restore the device screen\n"
		"  alias <id> <alias>              rename a device\n"
		"  wb-measure <ids...|all>         one-shot auto white balance, print scene CCT/tint\n"
		"  torch <level> <ids...|all>      set torch level 0..1\n"
		"  tune <ids...|all>               read camera JSON edits from stdin, debounced\n"
		"  watch [seconds]                 print telemetry frames\n"
		"  profile-list\n"
		"  profile-save <name>             store --json {stream?, camera}\n"
		"  profile-delete <name>\n"
		"  profile-apply <name> <ids...|all>\n");
}

void ConsoleCommands::registerCommands_()
{
	auto bind = [this](void (ConsoleCommands::*fn)(const QStringList&)) {
		return [this, fn](const QStringList& args) { (this->*fn)(args); };
	};
	commands_.insert("devices",        bind(&ConsoleCommands::cmdDevices));
	commands_.insert("claim",          bind(&ConsoleCommands::cmdClaim));
	commands_.insert("unclaim",        bind(&ConsoleCommands::cmdUnclaim));
	commands_.insert("clear",          bind(&ConsoleCommands::cmdClear));
	commands_.insert("refresh",        bind(&ConsoleCommands::cmdRefresh));
	commands_.insert("discover",       bind(&ConsoleCommands::cmdDiscover));
	commands_.insert("start",          bind(&ConsoleCommands::cmdStart));
	commands_.insert("stop",           bind(&ConsoleCommands::cmdStop));
	commands_.insert("camera",         bind(&ConsoleCommands::cmdCamera));
	commands_.insert("video",          bind(&ConsoleCommands::cmdVideo));
	commands_.insert("keyframe",       bind(&ConsoleCommands::cmdKeyframe));
	commands_.insert("dim",            bind(&ConsoleCommands::cmdDim));
	commands_.insert("alias",          bind(&ConsoleCommands::cmdAlias));
	commands_.insert("wb-measure",     bind(&ConsoleCommands::cmdWbMeasure));
	commands_.insert("torch",          bind(&ConsoleCommands::cmdTorch));
	commands_.insert("tune",           bind(&ConsoleCommands::cmdTune));
	commands_.insert("watch",          bind(&ConsoleCommands::cmdWatch));
	commands_.insert("profile-list",   bind(&ConsoleCommands::cmdProfileList));
	commands_.insert("profile-save",   bind(&ConsoleCommands::cmdProfileSave));
	commands_.insert("profile-delete", bind(&ConsoleCommands::cmdProfileDelete));
	commands_.insert("profile-apply",  bind(&ConsoleCommands::cmdProfileApply));
}

void ConsoleCommands::execute(const QString& command, const QStringList& args, const ConsoleOptions& options)
{
	options_ = options;
	const auto it = commands_.constFind(command);
	if (it == commands_.constEnd()) {
		fail_(QStringLiteral("unknown command '%1'\n%2").arg(command, usage()));
		return;
	}

	try {
		it.value()(args);
	} catch (const ApiError& e) {
		// --json 페이로드 검증 실패
		fail_(QStringLiteral("%1: %2").arg(e.code(), e.message()));
	}
}

// ---------- helpers ----------
QStringList ConsoleCommands::resolveTargets_(const QStringList& args) const
{
	if (args.size() == 1 && args.first() == QLatin1String("all"))
		return registry_.ids();
	return args;
}

void ConsoleCommands::printResults_(const GroupResults& results)
{
	QJsonArray arr;
	int failed = 0;
	for (const auto& r : results) {
		arr.append(r.toJson());
		failed += r.success ? 0 : 1;
	}
	printJson(QJsonObject{{"results", arr}, {"failed", failed}});
	done_(failed == 0 ? 0 : 1);
}

void ConsoleCommands::fail_(const QString& message, int code)
{
	err() << message << '\n';
	err().flush();
	done_(code);
}

void ConsoleCommands::done_(int code)
{
	// execute() 안에서 동기적으로 끝나도 이벤트 루프가 돈 뒤에 알림
	QTimer::singleShot(0, this, [this, code]() { emit finished(code); });
}

// ---------- registry ----------
void ConsoleCommands::cmdDevices(const QStringList&)
{
	QJsonArray arr;
	for (const auto& d : registry_.devices()) arr.append(deviceJson(d));
	printJson(QJsonObject{{"devices", arr}});
	done_(0);
}

void ConsoleCommands::cmdClaim(const QStringList& args)
{
	if (args.isEmpty()) {
		fail_(QStringLiteral("usage: claim <host> [port]"));
		return;
	}
	QString host = args.value(0);
	int port = DEFAULT_CONTROL_PORT;
	if (args.size() > 1) {
		bool ok = false;
		port = args[1].toInt(&ok);
		if (!ok || port <= 0 || port > 65535) {
			fail_(QStringLiteral("invalid port '%1'").arg(args[1]));
			return;
		}
	}

	registry_.claim(host, static_cast<quint16>(port), options_.token, [this](bool ok, const QString& idOrError) {
		if (!ok) {
			fail_(QStringLiteral("claim failed: %1").arg(idOrError), 1);
			return;
		}
		const std::optional<Device> d = registry_.device(idOrError);
		printJson(d ? deviceJson(*d) : QJsonObject{{"id", idOrError}});
		done_(0);
	});
}

void ConsoleCommands::cmdUnclaim(const QStringList& args)
{
	if (args.size() != 1) {
		fail_(QStringLiteral("usage: unclaim <id>"));
		return;
	}
	QString e;
	if (!registry_.unclaim(args.first(), e)) {
		fail_(e, 1);
		return;
	}
	done_(0);
}

void ConsoleCommands::cmdClear(const QStringList&)
{
	QString e;
	if (!registry_.clear(e)) {
		fail_(e, 1);
		return;
	}
	done_(0);
}

void ConsoleCommands::cmdRefresh(const QStringList&)
{
	auto conn = std::make_shared<QMetaObject::Connection>();
	*conn = connect(&registry_, &DeviceRegistry::refreshFinished, this, [this, conn]() {
		disconnect(*conn);
		cmdDevices({});
	});
	registry_.refreshAll();
}

void ConsoleCommands::cmdDiscover(const QStringList&)
{
	auto okConn = std::make_shared<QMetaObject::Connection>();
	auto failConn = std::make_shared<QMetaObject::Connection>();
	*okConn = connect(&browser_, &ServiceBrowser::cycleFinished, this, [this, okConn, failConn]() {
		disconnect(*okConn);
		disconnect(*failConn);
		QJsonArray fresh;
		for (const auto& c : discovery_.newCandidates()) fresh.append(candidateJson(c));
		printJson(QJsonObject{{"candidates", fresh}, {"seen", discovery_.candidates().size()}});
		done_(0);
	});
	*failConn = connect(&browser_, &ServiceBrowser::browseFailed, this, [this, okConn, failConn](const QString& e) {
		disconnect(*okConn);
		disconnect(*failConn);
		fail_(QStringLiteral("discovery failed: %1").arg(e), 1);
	});
	discovery_.browseNow();
}

// ---------- commands over the orchestrator ----------
void ConsoleCommands::cmdStart(const QStringList& args)
{
	auto print = [this](const GroupResults& r) { printResults_(r); };
	if (!options_.payload && args.size() == 1 && args.first() == QLatin1String("all")) {
		orchestrator_.startAll(print);
		return;
	}
	const QStringList ids = resolveTargets_(args);
	if (ids.isEmpty()) {
		fail_(QStringLiteral("usage: start <ids...|all> [--json stream]"));
		return;
	}
	const StreamStartRequest req = options_.payload ? StreamStartRequest::fromJson(*options_.payload)
	                                                : StreamStartRequest::defaults();
	orchestrator_.startStreamGroup(ids, req, print);
}

void ConsoleCommands::cmdStop(const QStringList& args)
{
	if (args.size() == 1 && args.first() == QLatin1String("all")) {
		orchestrator_.stopAll([this](const GroupResults& r) { printResults_(r); });
		return;
	}
	if (args.isEmpty()) {
		fail_(QStringLiteral("usage: stop <ids...|all>"));
		return;
	}
	orchestrator_.stopStreamGroup(args, [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdCamera(const QStringList& args)
{
	const QStringList ids = resolveTargets_(args);
	if (ids.isEmpty() || !options_.payload) {
		fail_(QStringLiteral("usage: camera <ids...|all> --json '{\"iso\":400}'"));
		return;
	}
	const CameraSettingsRequest req = CameraSettingsRequest::fromJson(*options_.payload);
	orchestrator_.updateCameraSettingsGroup(ids, req, [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdVideo(const QStringList& args)
{
	const QStringList ids = resolveTargets_(args);
	if (ids.isEmpty() || !options_.payload) {
		fail_(QStringLiteral("usage: video <ids...|all> --json '{\"selected_preset_id\":\"smooth_1080p60\"}'"));
		return;
	}
	const VideoSettings settings = VideoSettings::fromJson(*options_.payload);
	orchestrator_.updateVideoSettingsGroup(ids, settings, [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdKeyframe(const QStringList& args)
{
	const QStringList ids = resolveTargets_(args);
	if (ids.isEmpty()) {
		fail_(QStringLiteral("usage: keyframe <ids...|all>"));
		return;
	}
	orchestrator_.forceKeyframeGroup(ids, [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdDim(const QStringList& args)
{
	const QString mode = args.value(0);
	if (args.size() < 2 || (mode != QLatin1String("on") && mode != QLatin1String("off"))) {
		fail_(QStringLiteral("usage: dim <on|off> <ids...|all>"));
		return;
	}
	orchestrator_.setScreenDimmedGroup(resolveTargets_(args.mid(1)), mode == QLatin1String("on"),
	                                   [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdAlias(const QStringList& args)
{
	if (args.size() != 2) {
		fail_(QStringLiteral("usage: alias <id> <alias>"));
		return;
	}
	orchestrator_.updateAlias(args[0], args[1], [this](const GroupOperationResult& r) {
		printResults_(GroupResults{r});
	});
}

void ConsoleCommands::cmdWbMeasure(const QStringList& args)
{
	const QStringList ids = resolveTargets_(args);
	if (ids.isEmpty()) {
		fail_(QStringLiteral("usage: wb-measure <ids...|all>"));
		return;
	}
	orchestrator_.measureWhiteBalanceGroup(ids, [this](const GroupResults& r) { printResults_(r); });
}

void ConsoleCommands::cmdTorch(const QStringList& args)
{
	bool ok = false;
	const double level = args.value(0).toDouble(&ok);
	if (args.size() < 2 || !ok) {
		fail_(QStringLiteral("usage: torch <level> <ids...|all>"));
		return;
	}
	orchestrator_.setTorchLevelGroup(resolveTargets_(args.mid(1)), level,
	                                 [this](const GroupResults& r) { printResults_(r); });
}

// Each stdin line is a camera settings JSON object. Edits are debounced per
// device so a burst of slider moves becomes one request with the last value.
void ConsoleCommands::cmdTune(const QStringList& args)
{
	tuneTargets_ = CommandOrchestrator::distinctIds(resolveTargets_(args));
	if (tuneTargets_.isEmpty()) {
		fail_(QStringLiteral("usage: tune <ids...|all>"));
		return;
	}

	// unbuffered: each read returns what the pipe holds right now
	if (!tuneInput_.open(stdin, QIODevice::ReadOnly | QIODevice::Unbuffered)) {
		fail_(QStringLiteral("cannot read stdin: %1").arg(tuneInput_.errorString()));
		return;
	}
	stdinNotifier_ = new QSocketNotifier(fileno(stdin), QSocketNotifier::Read, this);
	connect(stdinNotifier_, &QSocketNotifier::activated, this, &ConsoleCommands::readTuneInput_);
	connect(&debouncer_, &SettingsDebouncer::fired, this, &ConsoleCommands::finishTuneIfIdle_);
}

QList<QByteArray> ConsoleCommands::takeLines(QByteArray& pending)
{
	QList<QByteArray> lines;
	qsizetype from = 0;
	qsizetype nl = 0;
	while ((nl = pending.indexOf('\n', from)) >= 0) {
		QByteArray line = pending.mid(from, nl - from);
		if (line.endsWith('\r')) line.chop(1);
		lines.append(line);
		from = nl + 1;
	}
	pending.remove(0, from);
	return lines;
}

// One activation may carry many lines; all of them are handled here since
// the notifier stays quiet until new bytes arrive.
void ConsoleCommands::readTuneInput_()
{
	char buf[16 * 1024];
	const qint64 n = tuneInput_.read(buf, sizeof(buf));
	if (n <= 0) {
		if (n < 0) {
			err() << "stdin: " << tuneInput_.errorString() << '\n';
			err().flush();
			tuneFailed_ = true;
		}
		stdinNotifier_->setEnabled(false);
		if (!tuneBuffer_.trimmed().isEmpty()) handleTuneLine_(tuneBuffer_);
		tuneBuffer_.clear();
		tuneEof_ = true;
		debouncer_.flush();
		finishTuneIfIdle_();
		return;
	}

	tuneBuffer_.append(buf, qsizetype(n));
	for (const QByteArray& line : takeLines(tuneBuffer_))
		handleTuneLine_(line);
}

void ConsoleCommands::handleTuneLine_(const QByteArray& line)
{
	if (line.trimmed().isEmpty()) return;

	CameraSettingsRequest req;
	try {
		req = CameraSettingsRequest::fromJson(JsonFields::parseObject(line));
	} catch (const ApiError& e) {
		err() << "ignored: " << e.message() << '\n';
		err().flush();
		return;
	}

	for (const QString& id : tuneTargets_) {
		debouncer_.submit(id, QStringLiteral("camera"), [this, id, req]() {
			++tuneInFlight_;
			orchestrator_.updateCameraSettings(id, req, [this](const GroupOperationResult& r) {
				--tuneInFlight_;
				if (!r.success) tuneFailed_ = true;
				printJson(r.toJson());
				finishTuneIfIdle_();
			});
		});
	}
}

void ConsoleCommands::finishTuneIfIdle_()
{
	if (tuneEof_ && tuneInFlight_ == 0 && debouncer_.pendingCount() == 0)
		done_(tuneFailed_ ? 1 : 0);
}

void ConsoleCommands::cmdWatch(const QStringList& args)
{
	connect(&telemetry_, &TelemetryLink::frameReceived, this, [](const QString& id, const TelemetryFrame& f) {
		QJsonObject o = f.toJson();
		o.insert("device_id", id);
		out() << QJsonDocument(o).toJson(QJsonDocument::Compact) << '\n';
		out().flush();
	});
	connect(&telemetry_, &TelemetryLink::temperatureAlert, this, [](const QString& id, double tempC) {
		err() << "ALERT " << id << " temperature " << tempC << " C\n";
		err().flush();
	});

	registry_.startAutoRefresh(config_.refreshIntervalMs);
	telemetry_.start();

	bool ok = false;
	const int seconds = args.value(0).toInt(&ok);
	if (ok && seconds > 0) {
		QTimer::singleShot(seconds * 1000, this, [this]() {
			telemetry_.stop();
			registry_.stopAutoRefresh();
			done_(0);
		});
	}
}

// ---------- profiles ----------
void ConsoleCommands::cmdProfileList(const QStringList&)
{
	QJsonArray arr;
	for (const auto& p : profiles_.list()) arr.append(p.toJson());
	printJson(QJsonObject{{"profiles", arr}});
	done_(0);
}

void ConsoleCommands::cmdProfileSave(const QStringList& args)
{
	if (args.size() != 1 || !options_.payload) {
		fail_(QStringLiteral("usage: profile-save <name> --json '{\"stream\":{...},\"camera\":{...}}'"));
		return;
	}
	const SettingsBundle bundle = SettingsBundle::fromJson(*options_.payload);
	QString e;
	if (!profiles_.save(args.first(), bundle, e)) {
		fail_(e, 1);
		return;
	}
	done_(0);
}

void ConsoleCommands::cmdProfileDelete(const QStringList& args)
{
	if (args.size() != 1) {
		fail_(QStringLiteral("usage: profile-delete <name>"));
		return;
	}
	QString e;
	if (!profiles_.remove(args.first(), e)) {
		fail_(e, 1);
		return;
	}
	done_(0);
}

void ConsoleCommands::cmdProfileApply(const QStringList& args)
{
	if (args.size() < 2) {
		fail_(QStringLiteral("usage: profile-apply <name> <ids...|all>"));
		return;
	}
	profiles_.apply(args.first(), resolveTargets_(args.mid(1)), orchestrator_,
	                [this](const GroupResults& r) { printResults_(r); });
}
