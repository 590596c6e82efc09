/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandVersion_hpp
#define skiff_cli_CommandVersion_hpp

#include <memory>

#include "libskiff/Logger.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace skiff {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion(std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {}

    void execute() override {
        libskiff::Logger::getInstance().log(conf->buildTime.version, "CommandVersion", libskiff::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the skiff version information";
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
