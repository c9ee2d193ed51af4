#include "ProfileStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QDebug>

#include "include/fleet_logging.hpp"
#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"

QJsonObject Profile::toJson() const
{
	return QJsonObject{{"name", name}, {"settings", settings.toJson()}};
}

Profile Profile::fromJson(const QJsonObject& o)
{
	Profile p;
	p.name = JsonFields::requireString(o, "name");
	p.settings = SettingsBundle::fromJson(JsonFields::requireObject(o, "settings"));
	return p;
}

ProfileStore::ProfileStore(const QString& storePath, QObject* parent)
	: QObject(parent)
	, storePath_(storePath)
{
}

bool ProfileStore::load(QString& errorString)
{
	QFile f(storePath_);
	if (!f.exists()) {
		profiles_.clear();
		return true;
	}
	if (!f.open(QIODevice::ReadOnly)) {
		errorString = QStringLiteral("cannot open %1: %2").arg(storePath_, f.errorString());
		return false;
	}

	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
		errorString = QStringLiteral("%1: invalid JSON (%2)").arg(storePath_, perr.errorString());
		return false;
	}

	QList<Profile> loaded;
	for (const QJsonValue& v : doc.object().value("profiles").toArray()) {
		try {
			loaded.append(Profile::fromJson(v.toObject()));
		} catch (const ApiError& e) {
			qCWarning(LC_PROFILES) << "[ProfileStore] skipping stored profile:" << e.message();
		}
	}
	profiles_ = loaded;
	qCInfo(LC_PROFILES) << "[ProfileStore] loaded" << profiles_.size() << "profile(s)";
	return true;
}

bool ProfileStore::write_(QString& errorString) const
{
	QJsonArray arr;
	for (const auto& p : profiles_) arr.append(p.toJson());

	QDir().mkpath(QFileInfo(storePath_).absolutePath());
	QSaveFile sf(storePath_);
	if (!sf.open(QIODevice::WriteOnly)) {
		errorString = QStringLiteral("cannot write %1: %2").arg(storePath_, sf.errorString());
		return false;
	}
	sf.write(QJsonDocument(QJsonObject{{"profiles", arr}}).toJson(QJsonDocument::Indented));
	if (!sf.commit()) {
		errorString = QStringLiteral("commit %1 failed: %2").arg(storePath_, sf.errorString());
		return false;
	}
	return true;
}

bool ProfileStore::save(const QString& name, const SettingsBundle& bundle, QString& errorString)
{
	const QString trimmed = name.trimmed();
	if (trimmed.isEmpty()) {
		errorString = QStringLiteral("profile name must not be empty");
		return false;
	}

	const QList<Profile> previous = profiles_;
	bool replaced = false;
	for (auto& p : profiles_) {
		if (p.name == trimmed) {
			p.settings = bundle;
			replaced = true;
			break;
		}
	}
	if (!replaced) profiles_.append(Profile{trimmed, bundle});

	if (!write_(errorString)) {
		profiles_ = previous;
		return false;
	}
	qCInfo(LC_PROFILES) << "[ProfileStore]" << (replaced ? "updated" : "saved") << trimmed;
	emit profilesChanged();
	return true;
}

bool ProfileStore::remove(const QString& name, QString& errorString)
{
	const QList<Profile> previous = profiles_;
	const auto removed = profiles_.removeIf([&name](const Profile& p) { return p.name == name; });
	if (removed == 0) return true;

	if (!write_(errorString)) {
		profiles_ = previous;
		return false;
	}
	emit profilesChanged();
	return true;
}

QStringList ProfileStore::names() const
{
	QStringList out;
	for (const auto& p : profiles_) out.append(p.name);
	return out;
}

std::optional<Profile> ProfileStore::find(const QString& name) const
{
	for (const auto& p : profiles_) {
		if (p.name == name) return p;
	}
	return std::nullopt;
}

void ProfileStore::apply(const QString& name, const QStringList& deviceIds,
                         CommandOrchestrator& orchestrator, CommandOrchestrator::GroupCallback done) const
{
	const std::optional<Profile> profile = find(name);
	if (!profile) {
		qCInfo(LC_PROFILES) << "[ProfileStore] apply of unknown profile" << name;
		GroupResults results;
		for (const QString& id : CommandOrchestrator::distinctIds(deviceIds))
			results.append(CommandOrchestrator::failed(id, DeviceFailureKind::NotFound,
			                                           QStringLiteral("Profile not found: %1").arg(name)));
		done(results);
		return;
	}
	orchestrator.applyBundleGroup(deviceIds, profile->settings, std::move(done));
}
