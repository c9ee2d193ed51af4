#include "SettingsDebouncer.hpp"

#include <QStringList>
#include <QDebug>

#include "include/fleet_logging.hpp"

SettingsDebouncer::SettingsDebouncer(int windowMs, QObject* parent)
	: QObject(parent)
	, windowMs_(qMax(0, windowMs))
{
}

SettingsDebouncer::~SettingsDebouncer()
{
	cancelAll();
}

QString SettingsDebouncer::key(const QString& deviceId, const QString& command)
{
	return deviceId + QLatin1Char('\x1f') + command;
}

void SettingsDebouncer::submit(const QString& deviceId, const QString& command, Action action)
{
	const QString k = key(deviceId, command);
	Pending& p = pending_[k];
	if (!p.timer) {
		p.timer = new QTimer(this);
		p.timer->setSingleShot(true);
		connect(p.timer, &QTimer::timeout, this, [this, k]() { fire_(k); });
	}
	p.action = std::move(action);

	// 누적이 아니라 재시작
	p.timer->stop();
	p.timer->start(windowMs_);
}

int SettingsDebouncer::pendingCount() const
{
	int n = 0;
	for (auto it = pending_.constBegin(); it != pending_.constEnd(); ++it)
		n += it->timer && it->timer->isActive() ? 1 : 0;
	return n;
}

bool SettingsDebouncer::isPending(const QString& deviceId, const QString& command) const
{
	const auto it = pending_.constFind(key(deviceId, command));
	return it != pending_.constEnd() && it->timer && it->timer->isActive();
}

void SettingsDebouncer::fire_(const QString& k)
{
	auto it = pending_.find(k);
	if (it == pending_.end()) return;

	Action action = std::move(it->action);
	it->timer->deleteLater();
	pending_.erase(it);

	const int sep = k.indexOf(QLatin1Char('\x1f'));
	const QString deviceId = k.left(sep);
	const QString command = k.mid(sep + 1);
	qCDebug(LC_ORCH) << "[SettingsDebouncer] firing" << command << "for" << deviceId;

	// The action may submit again for the same key; the entry is already gone.
	if (action) action();
	emit fired(deviceId, command);
}

void SettingsDebouncer::flush()
{
	const QStringList keys = pending_.keys();
	for (const QString& k : keys)
		fire_(k);
}

void SettingsDebouncer::cancelAll()
{
	for (auto it = pending_.begin(); it != pending_.end(); ++it) {
		if (it->timer) it->timer->deleteLater();
	}
	pending_.clear();
}
