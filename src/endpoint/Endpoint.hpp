/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_endpoint_Endpoint_hpp
#define skiff_endpoint_Endpoint_hpp

#include <memory>

#include <boost/optional.hpp>

#include "common/ConnectionDescriptor.hpp"
#include "channel/ExecutionChannel.hpp"
#include "channel/SshSession.hpp"


namespace skiff {
namespace endpoint {

/**
 * One end of a transport. A remote endpoint owns the live SSH session to its
 * host (through its channel) for as long as the endpoint exists; a local
 * endpoint owns none.
 */
class Endpoint {
public:
    Endpoint(std::unique_ptr<channel::ExecutionChannel> channel);
    Endpoint(const common::ConnectionDescriptor& descriptor,
             std::shared_ptr<channel::SshSession> session,
             std::unique_ptr<channel::ExecutionChannel> channel);

    bool isRemote() const { return static_cast<bool>(descriptor); }
    const boost::optional<common::ConnectionDescriptor>& getDescriptor() const { return descriptor; }
    channel::ExecutionChannel& getChannel() const { return *channel; }

private:
    boost::optional<common::ConnectionDescriptor> descriptor;
    std::shared_ptr<channel::SshSession> session;
    std::unique_ptr<channel::ExecutionChannel> channel;
};

}
}

#endif
