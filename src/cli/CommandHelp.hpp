/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandHelp_hpp
#define skiff_cli_CommandHelp_hpp

#include <iostream>

#include <boost/program_options.hpp>

#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"


namespace skiff {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp(const boost::program_options::options_description& optionsDescription)
        : optionsDescription{optionsDescription}
    {}

    void execute() override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff [OPTIONS] SOURCE_IMAGE TARGET_IMAGE")
            .setDescription("Transport a container image between two hosts, shipping only the layers"
                            " that the destination does not have yet")
            .setAddressFormats(
                "Image addresses:\n"
                "  NAME[:TAG]                                            image on the local host\n"
                "  [USER[:PASSWORD]@]HOST[:PORT]/NAME[:TAG][?proxy=HOPS] image on a remote host,\n"
                "                                                        reached through the\n"
                "                                                        comma-separated jump hosts\n"
                "                                                        HOPS ([USER@]HOST[:PORT])\n"
                "  @HOST[:PORT]/NAME[:TAG]                               image on a remote host,\n"
                "                                                        logging in as the current user\n"
                "At least one of the two images must be on a remote host.")
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

    std::string getBriefDescription() const override {
        return "Print help";
    }

private:
    boost::program_options::options_description optionsDescription;
};

}
}

#endif
