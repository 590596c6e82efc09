/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_channel_ChannelPathRAII_hpp
#define skiff_channel_ChannelPathRAII_hpp

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "channel/ExecutionChannel.hpp"


namespace skiff {
namespace channel {

// RAII wrapper for a path on the host driven by a channel: the path is
// recursively removed through the channel by the destructor of this class,
// unless released first.
class ChannelPathRAII {
public:
    ChannelPathRAII() = default;
    ChannelPathRAII(ExecutionChannel& channel, const boost::filesystem::path& path);
    ChannelPathRAII(const ChannelPathRAII&) = delete;
    ChannelPathRAII(ChannelPathRAII&&);
    ChannelPathRAII& operator=(const ChannelPathRAII&) = delete;
    ChannelPathRAII& operator=(ChannelPathRAII&&);
    ~ChannelPathRAII();

    const boost::filesystem::path& getPath() const;
    void release();

private:
    void removePath() noexcept;

    ExecutionChannel* channel = nullptr;
    boost::optional<boost::filesystem::path> path;
};

}
}

#endif
