/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ConnectionDescriptor.hpp"

#include <boost/format.hpp>


namespace skiff {
namespace common {

const std::string JumpHost::DEFAULT_USERNAME{"root"};
const unsigned int ConnectionDescriptor::DEFAULT_PORT{22};

std::string JumpHost::string() const {
    auto format = boost::format{"%s@%s:%d"} % username % host % port;
    return format.str();
}

// never includes the password, the result ends up in logs
std::string ConnectionDescriptor::string() const {
    auto format = boost::format{"%s@%s:%d"} % username % host % port;
    auto output = format.str();
    for(const auto& hop : jumpChain) {
        output += " via " + hop.string();
    }
    return output;
}

bool operator==(const JumpHost& lhs, const JumpHost& rhs) {
    return lhs.username == rhs.username
        && lhs.host == rhs.host
        && lhs.port == rhs.port;
}

bool operator==(const ConnectionDescriptor& lhs, const ConnectionDescriptor& rhs) {
    return lhs.host == rhs.host
        && lhs.port == rhs.port
        && lhs.username == rhs.username
        && lhs.password == rhs.password
        && lhs.jumpChain == rhs.jumpChain;
}

std::ostream& operator<<(std::ostream& os, const ConnectionDescriptor& descriptor) {
    os << descriptor.string();
    return os;
}

}
}
