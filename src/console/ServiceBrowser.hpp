#pragma once
#include <QList>
#include <QObject>
#include <QString>

#include "console/FleetTypes.hpp"

// One browse cycle yields the complete candidate set seen during that cycle;
// nothing carries over between cycles.
class ServiceBrowser : public QObject {
	Q_OBJECT
public:
	using QObject::QObject;
	~ServiceBrowser() override = default;

	virtual void startCycle() = 0;
	virtual bool isBrowsing() const = 0;

signals:
	void cycleFinished(const QList<DiscoveredCandidate>& candidates);
	void browseFailed(const QString& error);
};
