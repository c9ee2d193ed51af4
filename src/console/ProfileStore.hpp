#pragma once
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>

#include "console/CommandOrchestrator.hpp"

struct Profile {
	QString name;
	SettingsBundle settings;

	QJsonObject toJson() const;
	static Profile fromJson(const QJsonObject& o);
};

// Named settings bundles persisted as profiles.json.
class ProfileStore : public QObject {
	Q_OBJECT
public:
	explicit ProfileStore(const QString& storePath, QObject* parent = nullptr);

	bool load(QString& errorString);

	// Upsert by name; the file is rewritten before returning.
	bool save(const QString& name, const SettingsBundle& bundle, QString& errorString);
	// Unknown names are a successful no-op.
	bool remove(const QString& name, QString& errorString);

	QList<Profile> list() const { return profiles_; }
	QStringList names() const;
	std::optional<Profile> find(const QString& name) const;

	// Same contract as the orchestrator's group operations. An unknown
	// profile yields one failed entry per requested id.
	void apply(const QString& name, const QStringList& deviceIds,
	           CommandOrchestrator& orchestrator, CommandOrchestrator::GroupCallback done) const;

signals:
	void profilesChanged();

private:
	bool write_(QString& errorString) const;

private:
	QString storePath_;
	QList<Profile> profiles_;
};
