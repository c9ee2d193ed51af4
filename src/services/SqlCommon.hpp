#pragma once
#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QThread>

#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("camfleet_logs"); }

	namespace detail {
		inline QMutex& pathMutex() { static QMutex m; return m; }
		inline QString& pathStorage() {
			static QString p = QStringLiteral(DEVICE_LOG_DB_PATH DEVICE_LOG_DB);
			return p;
		}
	}

	// main()에서 설정 로드 직후 1회 호출
	inline void setDbFilePath(const QString& path)
	{
		QMutexLocker lock(&detail::pathMutex());
		detail::pathStorage() = path;
	}

    inline QString dbFilePath()
    {
		QString path;
		{
			QMutexLocker lock(&detail::pathMutex());
			path = detail::pathStorage();
		}
        QDir().mkpath(QFileInfo(path).absolutePath());
        return path;
    }

    inline QString connectionNameForCurrentThread()
    {
        return QString("%1_%2").arg(baseConnName())
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }
} // namespace SqlCommon
