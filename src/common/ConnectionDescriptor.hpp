/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_ConnectionDescriptor_hpp
#define skiff_common_ConnectionDescriptor_hpp

#include <string>
#include <vector>
#include <ostream>

#include <boost/optional.hpp>


namespace skiff {
namespace common {

/**
 * An intermediate host through which the connection to the real target
 * host is tunneled.
 */
struct JumpHost {
    std::string username;
    std::string host;
    unsigned int port;

    std::string string() const;

    static const std::string DEFAULT_USERNAME;
};

/**
 * Everything needed to open a session with a remote host.
 * The jump chain is ordered: the first hop is connected to first.
 */
struct ConnectionDescriptor {
    std::string host;
    unsigned int port;
    std::string username;
    boost::optional<std::string> password;
    std::vector<JumpHost> jumpChain;

    std::string string() const;

    static const unsigned int DEFAULT_PORT;
};

bool operator==(const JumpHost&, const JumpHost&);
bool operator==(const ConnectionDescriptor&, const ConnectionDescriptor&);

std::ostream& operator<<(std::ostream&, const ConnectionDescriptor&);

}
}

#endif
