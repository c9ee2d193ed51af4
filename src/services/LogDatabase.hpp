#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "include/LogDtos.hpp"

// SQLite system_logs table. Each calling thread gets its own connection.
class LogDatabase {
public:
    bool initializeDatabase();

    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

	// keep the newest maxRows rows
	bool pruneSystemLogs(int maxRows);
	bool deleteSysLogs();

private:
	QMutex dbMutex;
};
