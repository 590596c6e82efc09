/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CLI_hpp
#define skiff_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>
#include <boost/format.hpp>

#include "libskiff/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace skiff {
namespace cli {

/**
 * Parses the command line into the run configuration and returns the
 * command to execute. Command-line options override the values of the
 * configuration file given with --config.
 */
class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libskiff::CLIArguments&, std::shared_ptr<common::Config>) const;

// these methods are public for test purpose
public:
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    void applyOptions(const boost::program_options::variables_map& values, common::Config& conf) const;
    void validateAddresses(const common::Config& conf) const;
    void throwUsageError(const std::string& message) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
    boost::program_options::options_description hiddenOptionsDescription{};
    boost::program_options::options_description allOptionsDescription{};
    boost::program_options::positional_options_description positionalOptionsDescription{};
};

}
}

#endif
