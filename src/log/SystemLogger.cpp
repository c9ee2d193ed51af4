#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>
#include "services/LogDatabase.hpp"
#include "log/SystemLogTypes.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(int maxRows) : maxRows_(maxRows) {}

public slots:
    void open() {
        ready_ = db_.initializeDatabase();
        if (!ready_)
            qCritical() << "[SystemLogWriter] log database unavailable, entries will be dropped";
    }

    void append(const SystemLogEntry& e) {
        if (!ready_) return;
        if (!db_.insertSystemLog(static_cast<int>(e.level),
                                 e.tag,
                                 e.message,
                                 e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
                                 e.extra)) {
            return;
        }
        // 주기적으로 오래된 행 정리
        if (maxRows_ > 0 && ++sincePrune_ >= 200) {
            sincePrune_ = 0;
            db_.pruneSystemLogs(maxRows_);
        }
    }

    void sync() {}

private:
    LogDatabase db_;
    int maxRows_ = 0;
    int sincePrune_ = 0;
    bool ready_ = false;
};
} // namespace

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(int maxRows)
{
	auto& inst = instance();
	if (inst.th_) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th_ = new QThread;
	inst.th_->setObjectName(QStringLiteral("SystemLogWriter"));
	inst.wr_ = new syslog_detail::SystemLogWriter(maxRows);
	inst.wr_->moveToThread(inst.th_);

    QObject::connect(inst.th_, &QThread::started,
                     inst.wr_, &syslog_detail::SystemLogWriter::open);
    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr_, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th_, &QThread::finished, inst.wr_, &QObject::deleteLater);
    inst.th_->start();
}

bool SystemLogger::isRunning()
{
	return instance().th_ != nullptr;
}

void SystemLogger::flush()
{
	auto& inst = instance();
	if (!inst.th_ || !inst.wr_) return;
	QMetaObject::invokeMethod(inst.wr_, "sync", Qt::BlockingQueuedConnection);
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th_) return;

	inst.th_->quit();
    if (!inst.th_->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not stop in time";
        inst.th_->terminate();
        inst.th_->wait();
    }

    delete inst.th_;
    inst.th_ = nullptr;
	inst.wr_ = nullptr;
}

static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit SystemLogger::instance().appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
