#pragma once
#include <QList>
#include <QObject>
#include <QStringList>
#include <QTimer>

#include "console/FleetTypes.hpp"

class DeviceRegistry;
class ServiceBrowser;

// Periodic browse cycles reconciled against the registry: a candidate whose
// alias matches a claimed device is not offered as new.
class DiscoveryService : public QObject {
	Q_OBJECT
public:
	explicit DiscoveryService(ServiceBrowser& browser, DeviceRegistry& registry,
	                          QObject* parent = nullptr);

	void start(int intervalMs);
	void stop();
	void browseNow();

	// Everything seen in the last completed cycle.
	QList<DiscoveredCandidate> candidates() const { return candidates_; }
	// Last cycle minus claimed aliases, evaluated against the registry as it is now.
	QList<DiscoveredCandidate> newCandidates() const;

	static QList<DiscoveredCandidate> reconcile(const QList<DiscoveredCandidate>& candidates,
	                                            const QStringList& claimedAliases);

signals:
	void candidatesChanged(const QList<DiscoveredCandidate>& fresh);
	void browseFailed(const QString& error);

private slots:
	void handleCycleFinished(const QList<DiscoveredCandidate>& found);
	void handleBrowseFailed(const QString& error);

private:
	ServiceBrowser& browser_;
	DeviceRegistry& registry_;
	QTimer timer_;
	QList<DiscoveredCandidate> candidates_;
};
