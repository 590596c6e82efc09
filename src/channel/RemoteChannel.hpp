/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_channel_RemoteChannel_hpp
#define skiff_channel_RemoteChannel_hpp

#include <memory>
#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libskiff/LogLevel.hpp"
#include "channel/ExecutionChannel.hpp"
#include "channel/SshSession.hpp"


namespace skiff {
namespace channel {

/**
 * Drives a remote host through an established SshSession.
 *
 * Commands run through the session's exec facility. File operations are
 * fixed coreutils invocations (stat, cat, find, rm) whose only variable
 * parts are shell-quoted paths, so no generated code crosses the wire.
 * File contents are streamed through pipes, never buffered as a whole.
 */
class RemoteChannel : public ExecutionChannel {
public:
    RemoteChannel(std::shared_ptr<SshSession> session);
    CommandOutput run(const std::string& command, const OutputEcho& echo = OutputEcho{}) override;
    FileStatus stat(const boost::filesystem::path& path) override;
    std::unique_ptr<ByteSource> openRead(const boost::filesystem::path& path) override;
    std::unique_ptr<ByteSink> openWrite(const boost::filesystem::path& path) override;
    std::vector<std::string> listDirectory(const boost::filesystem::path& path) override;
    void remove(const boost::filesystem::path& path, bool recursive) override;
    std::string describe() const override;

    // these methods are public for test purpose
    static FileStatus parseStatOutput(const std::string& output);

private:
    CommandOutput runFileCommand(const std::string& command, const boost::filesystem::path& path);
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void log(const std::string& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<SshSession> session;
    const std::string sysname = "RemoteChannel";
};

}
}

#endif
