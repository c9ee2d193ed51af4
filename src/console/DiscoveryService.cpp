#include "DiscoveryService.hpp"

#include <QSet>
#include <QDebug>

#include "console/DeviceRegistry.hpp"
#include "console/ServiceBrowser.hpp"
#include "include/fleet_logging.hpp"

DiscoveryService::DiscoveryService(ServiceBrowser& browser, DeviceRegistry& registry, QObject* parent)
	: QObject(parent)
	, browser_(browser)
	, registry_(registry)
{
	connect(&timer_, &QTimer::timeout, this, &DiscoveryService::browseNow);
	connect(&browser_, &ServiceBrowser::cycleFinished, this, &DiscoveryService::handleCycleFinished);
	connect(&browser_, &ServiceBrowser::browseFailed, this, &DiscoveryService::handleBrowseFailed);
	// 등록 목록이 바뀌면 새 후보도 다시 계산
	connect(&registry_, &DeviceRegistry::deviceAdded, this, [this]() { emit candidatesChanged(newCandidates()); });
	connect(&registry_, &DeviceRegistry::deviceRemoved, this, [this]() { emit candidatesChanged(newCandidates()); });
}

void DiscoveryService::start(int intervalMs)
{
	timer_.start(qMax(1000, intervalMs));
	browseNow();
}

void DiscoveryService::stop()
{
	timer_.stop();
}

void DiscoveryService::browseNow()
{
	if (browser_.isBrowsing()) return;
	browser_.startCycle();
}

QList<DiscoveredCandidate> DiscoveryService::reconcile(const QList<DiscoveredCandidate>& candidates,
                                                      const QStringList& claimedAliases)
{
	const QSet<QString> claimed(claimedAliases.cbegin(), claimedAliases.cend());
	QList<DiscoveredCandidate> out;
	for (const auto& c : candidates) {
		if (claimed.contains(c.alias)) continue;
		out.append(c);
	}
	return out;
}

QList<DiscoveredCandidate> DiscoveryService::newCandidates() const
{
	return reconcile(candidates_, registry_.claimedAliases());
}

void DiscoveryService::handleCycleFinished(const QList<DiscoveredCandidate>& found)
{
	// 매 사이클 전체 교체
	candidates_ = found;
	const QList<DiscoveredCandidate> fresh = newCandidates();
	qCDebug(LC_DISCOVERY) << "[DiscoveryService]" << found.size() << "seen," << fresh.size() << "new";
	emit candidatesChanged(fresh);
}

void DiscoveryService::handleBrowseFailed(const QString& error)
{
	// 다음 주기에 재시도
	qCWarning(LC_DISCOVERY) << "[DiscoveryService] browse failed, retrying next cycle:" << error;
	emit browseFailed(error);
}
