#include "LogDatabase.hpp"
#include "services/SqlCommon.hpp"
#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>

static QSqlDatabase ensureOpenConnectionForThisThread() {
    const QString name = SqlCommon::connectionNameForCurrentThread();
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(SqlCommon::dbFilePath());
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
        // 경로가 바뀐 경우 (테스트, 설정 재적용) 다시 연다
        const QString wanted = SqlCommon::dbFilePath();
        if (db.databaseName() != wanted) {
            if (db.isOpen()) db.close();
            db.setDatabaseName(wanted);
        }
    }

    if (!db.isOpen() && !db.open()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text()
                    << " path=" << db.databaseName()
                    << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}


bool LogDatabase::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qWarning() << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qWarning() << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
    }

    QSqlQuery q(db);
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS system_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "tag TEXT, "
        "message TEXT NOT NULL, "
        "timestamp TEXT NOT NULL, "
        "extra TEXT)"
    )) {
        qCritical() << "Failed to create system_logs:" << q.lastError().text();
        return false;
    }

    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)",
        "CREATE INDEX IF NOT EXISTS idx_sys_tag   ON system_logs(tag)",
    };
    for (const char* sql : indexes) {
        if (!q.exec(QString::fromLatin1(sql)))
            qWarning() << "[SQL] index creation failed (ignored):" << q.lastError().text();
    }

    qDebug() << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

bool LogDatabase::insertSystemLog(int level, const QString& tag, const QString& message,
                                  const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    const QString timeSafe = timestamp.isValid()
                    ? timestamp.toString(Qt::ISODateWithMs)
                    : QDateTime::currentDateTime().toString(Qt::ISODateWithMs);

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message.isNull() ? QString("") : message);
    q.addBindValue(timeSafe);
    q.addBindValue(extra);

    if (!q.exec()) {
        qCritical() << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool LogDatabase::selectSystemLogs(int offset, int limit,
                                   int minLevel, const QString& tagLike, const QString& sinceIso,
                                   QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";      binds << ("%" + tagLike + "%"); }
    if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?";  binds << sinceIso; }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (const auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) {
        qWarning() << "[SQL] count system_logs failed:" << qc.lastError().text();
        return false;
    }
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (const auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) {
        qWarning() << "[SQL] select system_logs failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}

bool LogDatabase::pruneSystemLogs(int maxRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("DELETE FROM system_logs WHERE id NOT IN "
              "(SELECT id FROM system_logs ORDER BY id DESC LIMIT ?)");
    q.addBindValue(qMax(0, maxRows));
    if (!q.exec()) {
        qCritical() << "[SQL] prune system_logs failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool LogDatabase::deleteSysLogs()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec("DELETE FROM system_logs;")) {
        qCritical() << "[SQL] DELETE FROM system_logs failed:" << q.lastError().text();
        return false;
    }

    if (!q.exec("DELETE FROM sqlite_sequence WHERE name='system_logs';")) {
        qWarning() << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
    }

    QSqlQuery vacuum(db);
    if (!vacuum.exec("VACUUM;")) {
        qWarning() << "[SQL] VACUUM failed (ignored):" << vacuum.lastError().text();
    }

    return true;
}
