/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "endpoint/EndpointResolver.hpp"

#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/process.hpp"
#include "libskiff/utility/string.hpp"
#include "channel/LocalChannel.hpp"
#include "channel/RemoteChannel.hpp"


namespace skiff {
namespace endpoint {

namespace {

// [[user][:password]@]host[:port]/image[?query], an empty user stands for the default one
const boost::regex remoteAddress{
    "^(?:([^:@/?]*)(?::([^/?]*))?@)?([^:@/?]+)(?::([0-9]+))?/([^?]+)(?:\\?(.*))?$"
};

// [user@]host[:port]
const boost::regex jumpHost{"^(?:([^:@/?]+)@)?([^:@/?]+)(?::([0-9]+))?$"};

unsigned int parsePort(const std::string& input, const std::string& address) {
    auto port = unsigned{};
    try {
        port = boost::lexical_cast<unsigned int>(input);
    }
    catch(const boost::bad_lexical_cast&) {
        port = 0;
    }
    if(port == 0 || port > 65535) {
        auto message = boost::format("Invalid port '%s' in address '%s'") % input % address;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
    }
    return port;
}

bool isRemoteAddress(const std::string& address) {
    auto firstSlash = address.find('/');
    auto at = address.find('@');
    bool hasUserInfo = at != std::string::npos && (firstSlash == std::string::npos || at < firstSlash);
    bool hasQuery = address.find('?') != std::string::npos;
    return hasUserInfo || hasQuery;
}

}

std::vector<common::JumpHost> parseJumpChain(const std::string& proxyValue) {
    auto hops = std::vector<std::string>{};
    boost::split(hops, proxyValue, boost::is_any_of(","));

    auto chain = std::vector<common::JumpHost>{};
    for(const auto& hop : hops) {
        boost::smatch matches;
        if(!boost::regex_match(hop, matches, jumpHost)) {
            auto message = boost::format("Invalid jump host '%s' in proxy list '%s'") % hop % proxyValue;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
        }
        auto jump = common::JumpHost{};
        jump.username = matches[1].matched ? matches[1].str() : common::JumpHost::DEFAULT_USERNAME;
        jump.host = matches[2].str();
        jump.port = matches[3].matched ? parsePort(matches[3].str(), proxyValue)
                                       : common::ConnectionDescriptor::DEFAULT_PORT;
        chain.push_back(jump);
    }
    return chain;
}

ParsedAddress parseAddress(const std::string& address, const std::string& defaultUsername) {
    if(!isRemoteAddress(address)) {
        return ParsedAddress{ {}, common::ImageReference::parse(address) };
    }

    boost::smatch matches;
    if(!boost::regex_match(address, matches, remoteAddress)) {
        auto message = boost::format("Invalid address '%s': expected"
                                     " [[user][:password]@]host[:port]/image[:tag][?proxy=[user@]host[:port]]")
            % address;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
    }

    auto descriptor = common::ConnectionDescriptor{};
    descriptor.username = matches[1].length() > 0 ? matches[1].str() : defaultUsername;
    if(matches[2].matched) {
        descriptor.password = matches[2].str();
    }
    descriptor.host = matches[3].str();
    descriptor.port = matches[4].matched ? parsePort(matches[4].str(), address)
                                         : common::ConnectionDescriptor::DEFAULT_PORT;

    if(matches[6].matched) {
        auto query = std::unordered_map<std::string, std::string>{};
        try {
            query = libskiff::string::parseMap(matches[6].str(), '&', '=');
        }
        catch(const libskiff::Error& e) {
            auto message = boost::format("Invalid query in address '%s': %s") % address % e.what();
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
        }
        for(const auto& parameter : query) {
            if(parameter.first != "proxy") {
                auto message = boost::format("Unsupported parameter '%s' in address '%s'")
                    % parameter.first % address;
                SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
            }
            descriptor.jumpChain = parseJumpChain(parameter.second);
        }
    }

    return ParsedAddress{ descriptor, common::ImageReference::parse(matches[5].str()) };
}

EndpointResolver::EndpointResolver(const common::Config& config)
    : config{config}
{}

std::tuple<Endpoint, common::ImageReference> EndpointResolver::resolve(const std::string& address) const {
    auto parsed = parseAddress(address, libskiff::process::getUsername());

    if(!parsed.connection) {
        log(boost::format("Resolved '%s' to local image %s") % address % parsed.image, libskiff::LogLevel::DEBUG);
        auto endpoint = Endpoint{std::unique_ptr<channel::ExecutionChannel>{new channel::LocalChannel{}}};
        return std::make_tuple(std::move(endpoint), parsed.image);
    }

    log(boost::format("Resolved '%s' to image %s on %s") % address % parsed.image % *parsed.connection,
        libskiff::LogLevel::DEBUG);
    auto session = std::make_shared<channel::SshSession>(*parsed.connection, config.transport);
    auto remoteChannel = std::unique_ptr<channel::ExecutionChannel>{new channel::RemoteChannel{session}};
    auto endpoint = Endpoint{*parsed.connection, std::move(session), std::move(remoteChannel)};
    return std::make_tuple(std::move(endpoint), parsed.image);
}

void EndpointResolver::log(const boost::format& message, libskiff::LogLevel level,
                           std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
