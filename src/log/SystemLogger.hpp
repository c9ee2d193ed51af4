#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// Persists tagged events into the system_logs table from a dedicated thread.
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(int maxRows = 5000);   // 앱 시작시 1회, DB 경로 설정 이후
    static void shutdown();
    static bool isRunning();

    // Blocks until every entry posted so far has been written.
    static void flush();

    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e);

private:
	QThread* th_ = nullptr;
	syslog_detail::SystemLogWriter* wr_ = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
