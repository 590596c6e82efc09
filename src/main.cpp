/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <memory>
#include <chrono>
#include <clocale>
#include <csignal>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/CLIArguments.hpp"
#include "cli/CLI.hpp"

using namespace skiff;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    // a remote end closing its pipe early must surface as a write error, not kill skiff
    std::signal(SIGPIPE, SIG_IGN);

    auto& logger = libskiff::Logger::getInstance();

    try {
        auto programStart = std::chrono::high_resolution_clock::now();

        // Initialize Config object
        auto config = std::make_shared<common::Config>();
        config->programStart = programStart;
        config->directories.installationPrefix = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();

        // Process command
        auto args = libskiff::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libskiff::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libskiff::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
