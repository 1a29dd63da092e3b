/** \file   util.h
 *  \brief  Logging and command-line helpers shared by all of our programs.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2014-2020 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <mutex>
#include <string>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>


#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)


/** \class Logger
 *  \brief Writes timestamped diagnostics to stderr.  Safe to use from multiple threads.
 *  \note  The environment variable MIN_LOG_LEVEL sets the initial minimum log level.  LOGGER_FORMAT may contain
 *         "strip_call_site" and "no_decorations", in any combination, e.g. separated by commas.
 */
class Logger {
public:
    enum LogLevel { LL_ERROR = 1, LL_WARNING = 2, LL_INFO = 3, LL_DEBUG = 4 };

private:
    static const std::string FUNCTION_NAME_SEPARATOR;

    std::mutex mutex_;
    bool log_no_decorations_, log_strip_call_site_;
    LogLevel min_log_level_;

public:
    Logger();

    void setMinimumLogLevel(const LogLevel min_log_level) { min_log_level_ = min_log_level; }
    LogLevel getMinimumLogLevel() const { return min_log_level_; }

    // Emits "msg" and exits.  A call stack is appended if the environment variable BACKTRACE has been set.
    [[noreturn]] void error(const std::string &function_name, const std::string &msg);
    void warning(const std::string &function_name, const std::string &msg);
    void info(const std::string &function_name, const std::string &msg);

    /** \note Only writes actual log messages if the minimum log level is LL_DEBUG or the environment variable
     *        "UTIL_LOG_DEBUG" is set to "true"!
     */
    void debug(const std::string &function_name, const std::string &msg);

    //* \note Aborts if "level_candidate" is not one of "ERROR", "WARNING", "INFO" or "DEBUG".
    static LogLevel StringToLogLevel(const std::string &level_candidate);

private:
    static bool ParseLogLevel(const std::string &level_candidate, LogLevel * const log_level);
    std::string formatMessage(const std::string &level, const std::string &function_name, const std::string &msg) const;

    // Callers must hold "mutex_".
    void writeString(const std::string &s);
};
extern Logger *logger;


#define LOG_ERROR(message) logger->error(__PRETTY_FUNCTION__, message), __builtin_unreachable()
#define LOG_WARNING(message) logger->warning(__PRETTY_FUNCTION__, message)
#define LOG_INFO(message) logger->info(__PRETTY_FUNCTION__, message)
#define LOG_DEBUG(message) logger->debug(__PRETTY_FUNCTION__, message)


/** Must be set to point to argv[0] in main(). */
extern char *progname;


// \note A single newline will be appended to the message that is emitted on stderr.  Furthermore, "[--min-log-level] " will be prepended.
//       Programs that print their usage on request, e.g. for "--help", should pass EXIT_SUCCESS as "exit_code".
[[noreturn]] void Usage(const std::string &usage_message, const int exit_code = EXIT_FAILURE);
