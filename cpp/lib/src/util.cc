/** \file    util.cc
 *  \brief   Implementation of our logger and other command-line helpers.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
    Copyright (C) 2015-2020 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "util.h"
#include <iostream>
#include <vector>
#include <cstdlib>
#include "MiscUtil.h"
#include "StringUtil.h"
#include "TimeUtil.h"


char *progname; // Must be set in main() with "progname = argv[0];";


const std::string Logger::FUNCTION_NAME_SEPARATOR(" --> ");


Logger::Logger(): log_no_decorations_(false), log_strip_call_site_(false), min_log_level_(LL_INFO) {
    // We can't use LOG_ERROR here as "logger" hasn't been initialised yet.
    const std::string min_log_level(MiscUtil::SafeGetEnv("MIN_LOG_LEVEL"));
    if (not min_log_level.empty() and not ParseLogLevel(min_log_level, &min_log_level_))
        writeString("ignoring invalid MIN_LOG_LEVEL \"" + min_log_level + "\"!\n");

    const std::string logger_format(MiscUtil::SafeGetEnv("LOGGER_FORMAT"));
    log_no_decorations_ = logger_format.find("no_decorations") != std::string::npos;
    log_strip_call_site_ = logger_format.find("strip_call_site") != std::string::npos;
}


void Logger::error(const std::string &function_name, const std::string &msg) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    std::string error_message_string;
    if (errno != 0)
        error_message_string = " (last errno error code: " + std::string(std::strerror(errno)) + ")";
    writeString(formatMessage("SEVERE", function_name, msg + error_message_string));

    if (not MiscUtil::SafeGetEnv("BACKTRACE").empty()) {
        writeString("Backtrace:\n");
        for (const auto &stack_entry : MiscUtil::GetCallStack())
            writeString("  " + stack_entry + "\n");
    }

    std::exit(EXIT_FAILURE);
}


void Logger::warning(const std::string &function_name, const std::string &msg) {
    if (min_log_level_ < LL_WARNING)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString(formatMessage("WARN", function_name, msg));
}


void Logger::info(const std::string &function_name, const std::string &msg) {
    if (min_log_level_ < LL_INFO)
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString(formatMessage("INFO", function_name, msg));
}


void Logger::debug(const std::string &function_name, const std::string &msg) {
    if (min_log_level_ < LL_DEBUG and MiscUtil::SafeGetEnv("UTIL_LOG_DEBUG") != "true")
        return;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    writeString(formatMessage("DEBUG", function_name, msg));
}


Logger *logger(new Logger());


bool Logger::ParseLogLevel(const std::string &level_candidate, LogLevel * const log_level) {
    if (level_candidate == "ERROR")
        *log_level = LL_ERROR;
    else if (level_candidate == "WARNING")
        *log_level = LL_WARNING;
    else if (level_candidate == "INFO")
        *log_level = LL_INFO;
    else if (level_candidate == "DEBUG")
        *log_level = LL_DEBUG;
    else
        return false;

    return true;
}


Logger::LogLevel Logger::StringToLogLevel(const std::string &level_candidate) {
    LogLevel log_level;
    if (ParseLogLevel(level_candidate, &log_level))
        return log_level;
    LOG_ERROR("not a valid minimum log level: \"" + level_candidate + "\"! (Use ERROR, WARNING, INFO or DEBUG)");
}


std::string Logger::formatMessage(const std::string &level, const std::string &function_name, const std::string &msg) const {
    std::string formatted_message(log_strip_call_site_ ? msg : "in " + function_name + FUNCTION_NAME_SEPARATOR + msg);
    if (not log_no_decorations_)
        formatted_message = TimeUtil::GetCurrentDateAndTime(TimeUtil::ISO_8601_FORMAT) + " " + level + " "
                            + std::string(::program_invocation_name) + ": " + formatted_message;

    return formatted_message + '\n';
}


void Logger::writeString(const std::string &s) {
    if (unlikely(::write(STDERR_FILENO, s.data(), s.size()) == -1))
        _exit(EXIT_FAILURE);
}


[[noreturn]] void Usage(const std::string &usage_message, const int exit_code) {
    std::vector<std::string> lines;
    StringUtil::SplitThenTrimWhite(usage_message, '\n', &lines, /* suppress_empty_words */ false);
    auto line(lines.begin());
    if (unlikely(line == lines.cend()))
        LOG_ERROR("missing usage message!");

    std::cerr << "Usage: " << ::program_invocation_name << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] " << *line << '\n';
    const std::string padding(__builtin_strlen("Usage: ") + __builtin_strlen(::program_invocation_name) + 1, ' ');
    for (++line; line != lines.cend(); ++line)
        std::cerr << padding << *line << '\n';

    std::exit(exit_code);
}
