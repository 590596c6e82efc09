/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_endpoint_EndpointResolver_hpp
#define skiff_endpoint_EndpointResolver_hpp

#include <string>
#include <tuple>
#include <vector>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libskiff/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ConnectionDescriptor.hpp"
#include "common/ImageReference.hpp"
#include "endpoint/Endpoint.hpp"


namespace skiff {
namespace endpoint {

struct ParsedAddress {
    boost::optional<common::ConnectionDescriptor> connection;
    common::ImageReference image;
};

/**
 * Parses an image address:
 *
 *     image[:tag]                                                   (local)
 *     [user[:password]@]host[:port]/image[:tag][?proxy=<hops>]      (remote)
 *
 * where <hops> is a comma-separated list of [user@]host[:port] jump hosts,
 * traversed in order. An address is remote when it carries user information
 * or a query; anything else is a local image reference, which may itself
 * contain registry and namespace components.
 */
ParsedAddress parseAddress(const std::string& address, const std::string& defaultUsername);
std::vector<common::JumpHost> parseJumpChain(const std::string& proxyValue);

class EndpointResolver {
public:
    EndpointResolver(const common::Config& config);
    std::tuple<Endpoint, common::ImageReference> resolve(const std::string& address) const;

private:
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    const common::Config& config;
    const std::string sysname = "EndpointResolver";
};

}
}

#endif
