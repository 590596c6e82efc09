/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "endpoint/Endpoint.hpp"


namespace skiff {
namespace endpoint {

Endpoint::Endpoint(std::unique_ptr<channel::ExecutionChannel> channel)
    : channel{std::move(channel)}
{}

Endpoint::Endpoint(const common::ConnectionDescriptor& descriptor,
                   std::shared_ptr<channel::SshSession> session,
                   std::unique_ptr<channel::ExecutionChannel> channel)
    : descriptor{descriptor}
    , session{std::move(session)}
    , channel{std::move(channel)}
{}

}
}
