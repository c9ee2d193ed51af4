// logger.hpp
#pragma once
#include <QString>
#include <QDebug>
#include <QtGlobal>

namespace GlobalLogger {

inline QString decorate(const char* functionName, const QString& message)
{
		return QString("[%1] %2").arg(QString::fromLatin1(functionName), message);
}

inline void logMessage(QtMsgType type, const char* functionName, const QString& message)
{
		const QString fullMsg = decorate(functionName, message);

		switch (type) {
			case QtDebugMsg:
					qDebug().noquote() << fullMsg;
					break;
			case QtInfoMsg:
					qInfo().noquote() << fullMsg;
					break;
			case QtWarningMsg:
					qWarning().noquote() << fullMsg;
					break;
			case QtCriticalMsg:
			case QtFatalMsg:
					qCritical().noquote() << fullMsg;
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)			GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)			GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg) GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)

