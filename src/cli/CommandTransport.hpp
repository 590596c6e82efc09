/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandTransport_hpp
#define skiff_cli_CommandTransport_hpp

#include <memory>
#include <tuple>

#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "endpoint/EndpointResolver.hpp"
#include "transport/Orchestrator.hpp"


namespace skiff {
namespace cli {

class CommandTransport : public Command {
public:
    CommandTransport(std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {}

    void execute() override {
        auto resolver = endpoint::EndpointResolver{*conf};
        // the endpoints outlive the orchestrator: sessions close after the workdirs are removed
        auto source = resolver.resolve(conf->endpoints.sourceAddress);
        auto target = resolver.resolve(conf->endpoints.targetAddress);

        auto orchestrator = transport::Orchestrator{*conf,
                                                    std::get<0>(source).getChannel(), std::get<1>(source),
                                                    std::get<0>(target).getChannel(), std::get<1>(target)};
        orchestrator.run();
    }

    std::string getBriefDescription() const override {
        return "Transport an image from the source host to the destination host";
    }

    const common::Config& getConfig() const { return *conf; }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
