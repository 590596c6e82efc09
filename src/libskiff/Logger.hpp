/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_Logger_hpp
#define libskiff_Logger_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libskiff/LogLevel.hpp"
#include "libskiff/Error.hpp"

namespace libskiff {

/**
 * Process-wide logger. Each line is prefixed with a monotonic timestamp,
 * the host and pid of the process, the name of the logging subsystem and
 * the level. WARN and ERROR lines go to the error stream.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, LogLevel logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void logErrorTrace(const libskiff::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(LogLevel logLevel) { level = logLevel; }
    LogLevel getLevel() const { return level; }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string makePrefix(LogLevel logLevel, const std::string& sysName) const;

private:
    LogLevel level = LogLevel::INFO;
};

}

#endif
