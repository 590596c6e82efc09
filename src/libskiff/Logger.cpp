/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libskiff/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <unistd.h>

#include <boost/algorithm/string/case_conv.hpp>

#include "libskiff/utility/process.hpp"

namespace libskiff {

namespace {

const char* levelTag(LogLevel logLevel) {
    switch(logLevel) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::GENERAL: return "";
    }
    return "";
}

}

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

void Logger::log(const std::string& message, const std::string& sysName, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) {
    if(logLevel < level) {
        return;
    }
    auto& stream = (logLevel == LogLevel::WARN || logLevel == LogLevel::ERROR) ? errStream : outStream;
    stream << makePrefix(logLevel, sysName) << message << std::endl;
}

void Logger::log(const boost::format& message, const std::string& sysName, LogLevel logLevel,
                 std::ostream& outStream, std::ostream& errStream) {
    log(message.str(), sysName, logLevel, outStream, errStream);
}

void Logger::logErrorTrace(const libskiff::Error& error, const std::string& sysName, std::ostream& errStream) {
    if(error.getLogLevel() < level) {
        return;
    }

    auto header = boost::format("Error trace (most nested error last, error code %s):")
        % errorCodeToString(error.getCode());
    log(header, sysName, LogLevel::ERROR, std::cout, errStream);

    const auto& trace = error.getErrorTrace();
    for(size_t i = 0; i < trace.size(); ++i) {
        const auto& entry = trace[trace.size() - i - 1];
        auto line = entry.fileLine != -1 ? std::to_string(entry.fileLine) : std::string{};
        errStream << boost::format("#%-3d %s at %s:%s %s\n")
            % i % entry.functionName % entry.fileName % line % entry.errorMessage;
    }
}

std::string Logger::makePrefix(LogLevel logLevel, const std::string& sysName) const {
    if(logLevel == LogLevel::GENERAL) {
        return "";
    }

    auto tp = timespec{};
    if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
        auto message = boost::format("logger failed to retrieve monotonic time (%s)") % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }

    auto prefix = boost::format("[%d.%09d] [%s-%d] [%s] [%s] ")
        % tp.tv_sec % tp.tv_nsec
        % libskiff::process::getHostname() % getpid()
        % sysName
        % levelTag(logLevel);
    return prefix.str();
}

LogLevel parseLogLevel(const std::string& name) {
    auto lower = boost::algorithm::to_lower_copy(name);
    if(lower == "debug") {
        return LogLevel::DEBUG;
    }
    if(lower == "info") {
        return LogLevel::INFO;
    }
    if(lower == "warn" || lower == "warning") {
        return LogLevel::WARN;
    }
    if(lower == "error") {
        return LogLevel::ERROR;
    }
    auto message = boost::format("Invalid log level '%s'. Expected one of: debug, info, warn, error") % name;
    SKIFF_THROW_ERROR(message.str(), LogLevel::INFO);
}

}
