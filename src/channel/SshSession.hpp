/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_channel_SshSession_hpp
#define skiff_channel_SshSession_hpp

#include <memory>
#include <string>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libskiff/CLIArguments.hpp"
#include "libskiff/LogLevel.hpp"
#include "libskiff/utility/process.hpp"
#include "common/Config.hpp"
#include "common/ConnectionDescriptor.hpp"


namespace skiff {
namespace channel {

/**
 * A live, authenticated connection to a remote host.
 *
 * The session is an OpenSSH control master running as a child process of
 * skiff: every command and file operation on the host is multiplexed over it
 * through the control socket, so authentication (and the traversal of the
 * jump chain) happens exactly once.
 *
 * Construction blocks until the master is ready or the connect timeout
 * expires; destruction closes the master. Copying is not allowed.
 */
class SshSession {
public:
    SshSession(const common::ConnectionDescriptor& descriptor,
               const common::Config::Transport& transport);
    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;
    ~SshSession();

    libskiff::CLIArguments makeCommandArgs(const std::string& command) const;
    const common::ConnectionDescriptor& getDescriptor() const { return descriptor; }
    const boost::filesystem::path& getControlPath() const { return controlPath; }

    // these methods are public for test purpose
    static libskiff::CLIArguments makeMasterArgs(const common::ConnectionDescriptor& descriptor,
                                                 const common::Config::Transport& transport,
                                                 const boost::filesystem::path& controlPath);
    static std::string makeJumpChainOption(const std::vector<common::JumpHost>& jumpChain);

private:
    void establish();
    bool isMasterReady() const;
    void close();
    libskiff::CLIArguments makeControlArgs(const std::string& controlCommand) const;
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void log(const std::string& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    common::ConnectionDescriptor descriptor;
    common::Config::Transport transport;
    boost::filesystem::path controlPath;
    std::unique_ptr<libskiff::process::Subprocess> master;
    const std::string sysname = "SshSession";
};

}
}

#endif
