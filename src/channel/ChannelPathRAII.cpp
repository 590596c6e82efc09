/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "channel/ChannelPathRAII.hpp"

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"


namespace skiff {
namespace channel {

ChannelPathRAII::ChannelPathRAII(ExecutionChannel& channel, const boost::filesystem::path& path)
    : channel{&channel}
    , path{path}
{}

ChannelPathRAII::ChannelPathRAII(ChannelPathRAII&& rhs)
    : channel{rhs.channel}
    , path{std::move(rhs.path)}
{
    rhs.release();
}

ChannelPathRAII& ChannelPathRAII::operator=(ChannelPathRAII&& rhs) {
    removePath();
    channel = rhs.channel;
    path = std::move(rhs.path);
    rhs.release();
    return *this;
}

ChannelPathRAII::~ChannelPathRAII() {
    removePath();
}

const boost::filesystem::path& ChannelPathRAII::getPath() const {
    return path.value();
}

void ChannelPathRAII::release() {
    path.reset();
}

// Runs from destructors, possibly while an error is unwinding the stack:
// a failed removal is only reported.
void ChannelPathRAII::removePath() noexcept {
    if(!path || channel == nullptr) {
        return;
    }
    try {
        auto message = boost::format("Removing %s on %s") % *path % channel->describe();
        libskiff::Logger::getInstance().log(message.str(), "ChannelPathRAII", libskiff::LogLevel::DEBUG);
        channel->remove(*path, true);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to remove %s: %s") % *path % e.what();
        libskiff::Logger::getInstance().log(message.str(), "ChannelPathRAII", libskiff::LogLevel::WARN);
    }
    path.reset();
}

}
}
