// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_UTILS_LOGGING_H
#define LIBWAVATAR_UTILS_LOGGING_H
#include <QString>

class QSettings;

namespace utils {

/**
 * @brief Start appending log messages to the given file
 *
 * Messages are still passed on to the previously installed handler. If a
 * log file is already open, it is closed first.
 *
 * @return false if the file couldn't be opened
 */
bool enableLogFile(const QString &path);

//! Stop writing to the log file, if one is open
void disableLogFile();

bool isLogFileEnabled();

//! Logging settings, stored in the "log" group
struct LogConfig {
	//! QLoggingCategory filter rules, e.g. "wavatar.*.debug=true"
	QString rules;

	//! Log file path. No log file is written if empty
	QString file;

	static LogConfig load(QSettings &settings);
	void save(QSettings &settings) const;
};

//! Apply the filter rules and open or close the log file
bool applyLogConfig(const LogConfig &config);

}

#endif
