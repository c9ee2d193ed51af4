#pragma once
#include <QHash>
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>

// Coalesces rapid edits per (device, command). Each submit restarts that key's
// window and replaces its pending action; only the last one runs.
class SettingsDebouncer : public QObject {
	Q_OBJECT
public:
	using Action = std::function<void()>;

	explicit SettingsDebouncer(int windowMs = 300, QObject* parent = nullptr);
	~SettingsDebouncer() override;

	void submit(const QString& deviceId, const QString& command, Action action);

	int windowMs() const { return windowMs_; }
	int pendingCount() const;
	bool isPending(const QString& deviceId, const QString& command) const;

	// Runs every pending action now.
	void flush();
	// Drops pending actions without running them.
	void cancelAll();

signals:
	void fired(const QString& deviceId, const QString& command);

private:
	struct Pending {
		QTimer* timer = nullptr;
		Action action;
	};
	static QString key(const QString& deviceId, const QString& command);
	void fire_(const QString& k);

private:
	int windowMs_;
	QHash<QString, Pending> pending_;
};
