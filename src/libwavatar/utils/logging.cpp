// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/utils/logging.h"
#include "cmake-config/config.h"
#include <QDateTime>
#include <QFile>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QSettings>

namespace utils {

static QMutex logmutex;
static QFile *logfile;
static QtMessageHandler defaultLogger;

static void logToFile(
	QtMsgType type, const QMessageLogContext &ctx, const QString &msg)
{
	QString label;
	switch(type) {
	case QtDebugMsg:
		label = QStringLiteral("DEBUG");
		break;
	case QtInfoMsg:
		label = QStringLiteral("INFO");
		break;
	case QtWarningMsg:
		label = QStringLiteral("WARNING");
		break;
	case QtCriticalMsg:
		label = QStringLiteral("CRITICAL");
		break;
	case QtFatalMsg:
		label = QStringLiteral("FATAL");
		break;
	default:
		label = QStringLiteral("UNKNOWN");
		break;
	}

	QString ts = QDateTime::currentDateTime().toString("hh:mm:ss");
	QByteArray line =
		QStringLiteral("[%1 %2] %3\n").arg(ts, label, msg).toUtf8();

	{
		QMutexLocker locker{&logmutex};
		if(logfile) {
			logfile->write(line);
			logfile->flush();
		}
	}

	if(defaultLogger) {
		defaultLogger(type, ctx, msg);
	}
}

bool enableLogFile(const QString &path)
{
	disableLogFile();

	QFile *f = new QFile(path);
	if(!f->open(QIODevice::WriteOnly | QIODevice::Append)) {
		qWarning(
			"Unable to open log file %s: %s", qUtf8Printable(path),
			qUtf8Printable(f->errorString()));
		delete f;
		return false;
	}

	{
		QMutexLocker locker{&logmutex};
		logfile = f;
	}
	defaultLogger = qInstallMessageHandler(logToFile);
	qInfo("Wavatar %s file logging started.", cmake_config::version());
	return true;
}

void disableLogFile()
{
	if(!isLogFileEnabled()) {
		return;
	}

	qInfo("File logging stopped.");
	qInstallMessageHandler(defaultLogger);
	defaultLogger = nullptr;

	QFile *f;
	{
		QMutexLocker locker{&logmutex};
		f = logfile;
		logfile = nullptr;
	}
	delete f;
}

bool isLogFileEnabled()
{
	QMutexLocker locker{&logmutex};
	return logfile != nullptr;
}

LogConfig LogConfig::load(QSettings &settings)
{
	LogConfig config;
	settings.beginGroup(QStringLiteral("log"));
	config.rules = settings.value(QStringLiteral("rules")).toString();
	config.file = settings.value(QStringLiteral("file")).toString();
	settings.endGroup();
	return config;
}

void LogConfig::save(QSettings &settings) const
{
	settings.beginGroup(QStringLiteral("log"));
	settings.setValue(QStringLiteral("rules"), rules);
	settings.setValue(QStringLiteral("file"), file);
	settings.endGroup();
}

bool applyLogConfig(const LogConfig &config)
{
	if(!config.rules.isEmpty()) {
		// Rules are separated by newlines, but INI files can't easily hold
		// those, so semicolons work as well.
		QString rules = config.rules;
		rules.replace(';', '\n');
		QLoggingCategory::setFilterRules(rules);
	}

	if(config.file.isEmpty()) {
		disableLogFile();
		return true;
	} else {
		return enableLogFile(config.file);
	}
}

}
