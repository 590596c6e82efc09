/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "logging.hpp"

#include "libskiff/Logger.hpp"

namespace libskiff {

static const std::string utilitySysName = "Utility";

void logMessage(const std::string& message, LogLevel level, std::ostream& out, std::ostream& err) {
    Logger::getInstance().log(message, utilitySysName, level, out, err);
}

void logMessage(const boost::format& message, LogLevel level, std::ostream& out, std::ostream& err) {
    Logger::getInstance().log(message, utilitySysName, level, out, err);
}

}
