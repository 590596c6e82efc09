/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_channel_LocalChannel_hpp
#define skiff_channel_LocalChannel_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libskiff/LogLevel.hpp"
#include "channel/ExecutionChannel.hpp"


namespace skiff {
namespace channel {

/**
 * Drives the machine skiff runs on: commands go through the host shell
 * (so pipe operators work), files are accessed directly.
 */
class LocalChannel : public ExecutionChannel {
public:
    LocalChannel() = default;
    CommandOutput run(const std::string& command, const OutputEcho& echo = OutputEcho{}) override;
    FileStatus stat(const boost::filesystem::path& path) override;
    std::unique_ptr<ByteSource> openRead(const boost::filesystem::path& path) override;
    std::unique_ptr<ByteSink> openWrite(const boost::filesystem::path& path) override;
    std::vector<std::string> listDirectory(const boost::filesystem::path& path) override;
    void remove(const boost::filesystem::path& path, bool recursive) override;
    std::string describe() const override;

private:
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void log(const std::string& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    const std::string sysname = "LocalChannel";
};

}
}

#endif
