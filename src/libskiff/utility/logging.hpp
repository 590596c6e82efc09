/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_logging_hpp
#define libskiff_utility_logging_hpp

#include <iostream>
#include <string>

#include <boost/format.hpp>

#include "libskiff/LogLevel.hpp"

namespace libskiff {

// logs on behalf of the utility functions, which have no subsystem of their own
void logMessage(const std::string&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);
void logMessage(const boost::format&, LogLevel, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}

#endif
