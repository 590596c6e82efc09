/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "channel/SshSession.hpp"

#include <chrono>
#include <thread>
#include <cstdlib>

#include <boost/algorithm/string/join.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/string.hpp"


namespace skiff {
namespace channel {

SshSession::SshSession(const common::ConnectionDescriptor& descriptor,
                       const common::Config::Transport& transport)
    : descriptor{descriptor}
    , transport{transport}
{
    const size_t sizeOfRandomSuffix = 16;
    controlPath = transport.controlDirectory
        / ("skiff-" + libskiff::string::generateRandom(sizeOfRandomSuffix) + ".sock");
    establish();
}

SshSession::~SshSession() {
    close();
}

libskiff::CLIArguments SshSession::makeCommandArgs(const std::string& command) const {
    return libskiff::CLIArguments{
        transport.sshPath.string(),
        "-S", controlPath.string(),
        "-o", "ControlMaster=no",
        "-o", "BatchMode=yes",
        "-T",
        "-p", std::to_string(descriptor.port),
        descriptor.username + "@" + descriptor.host,
        "--",
        command
    };
}

libskiff::CLIArguments SshSession::makeMasterArgs(const common::ConnectionDescriptor& descriptor,
                                                  const common::Config::Transport& transport,
                                                  const boost::filesystem::path& controlPath) {
    auto args = libskiff::CLIArguments{};
    if(descriptor.password) {
        // the password reaches sshpass through the SSHPASS environment variable,
        // never through the command line
        args += libskiff::CLIArguments{transport.sshpassPath.string(), "-e"};
    }

    args += libskiff::CLIArguments{
        transport.sshPath.string(),
        "-M", "-N", "-T",
        "-S", controlPath.string(),
        "-o", "ControlPersist=no",
        "-o", "ConnectTimeout=" + std::to_string(transport.connectTimeout.count()),
        "-o", "ServerAliveInterval=15",
        "-o", "StrictHostKeyChecking=accept-new"
    };

    if(descriptor.password) {
        args += libskiff::CLIArguments{"-o", "NumberOfPasswordPrompts=1",
                                       "-o", "PreferredAuthentications=password,keyboard-interactive"};
    }
    else {
        args += libskiff::CLIArguments{"-o", "BatchMode=yes"};
    }

    if(!descriptor.jumpChain.empty()) {
        args += libskiff::CLIArguments{"-J", makeJumpChainOption(descriptor.jumpChain)};
    }

    args += libskiff::CLIArguments{"-p", std::to_string(descriptor.port),
                                   descriptor.username + "@" + descriptor.host};
    return args;
}

std::string SshSession::makeJumpChainOption(const std::vector<common::JumpHost>& jumpChain) {
    auto hops = std::vector<std::string>{};
    for(const auto& hop : jumpChain) {
        hops.push_back(hop.string());
    }
    return boost::algorithm::join(hops, ",");
}

void SshSession::establish() {
    log(boost::format("Establishing session with %s") % descriptor, libskiff::LogLevel::INFO);

    auto args = makeMasterArgs(descriptor, transport, controlPath);
    auto password = descriptor.password;
    auto preExecChildActions = boost::optional<std::function<void()>>{};
    if(password) {
        preExecChildActions = std::function<void()>{[password]() {
            if(setenv("SSHPASS", password->c_str(), 1) != 0) {
                SKIFF_THROW_ERROR("Failed to set SSHPASS in the environment of the session process");
            }
        }};
    }

    try {
        master.reset(new libskiff::process::Subprocess{args, libskiff::process::Subprocess::Mode::ReadStdout,
                                                       preExecChildActions});
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to start session process for %s") % descriptor;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::SessionEstablishmentFailure,
                                message.str() + ": " + e.what());
    }

    const auto pollInterval = std::chrono::milliseconds{100};
    auto deadline = std::chrono::steady_clock::now() + transport.connectTimeout;

    while(true) {
        auto exitStatus = master->tryWait();
        if(exitStatus) {
            auto message = boost::format("Failed to establish session with %s."
                                         " The connection or the authentication failed (status %d):\n%s")
                % descriptor % *exitStatus % master->getStderr();
            master.reset();
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::SessionEstablishmentFailure, message.str());
        }

        if(boost::filesystem::exists(controlPath) && isMasterReady()) {
            break;
        }

        if(std::chrono::steady_clock::now() > deadline) {
            auto message = boost::format("Failed to establish session with %s within %d seconds")
                % descriptor % transport.connectTimeout.count();
            master.reset();
            boost::system::error_code ec;
            boost::filesystem::remove(controlPath, ec);
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::SessionEstablishmentFailure, message.str());
        }

        std::this_thread::sleep_for(pollInterval);
    }

    log(boost::format("Session with %s established (control socket %s)") % descriptor % controlPath,
        libskiff::LogLevel::INFO);
}

bool SshSession::isMasterReady() const {
    auto result = libskiff::process::forkExecCapture(makeControlArgs("check"));
    return result.status == 0;
}

void SshSession::close() {
    if(!master) {
        return;
    }

    log(boost::format("Closing session with %s") % descriptor, libskiff::LogLevel::DEBUG);

    try {
        auto result = libskiff::process::forkExecCapture(makeControlArgs("exit"));
        if(result.status == 0) {
            master->wait();
        }
        else {
            log(boost::format("Failed to request the exit of the session with %s (status %d): %s")
                    % descriptor % result.status % result.stderrBytes,
                libskiff::LogLevel::WARN);
        }
    }
    catch(const libskiff::Error& e) {
        log(boost::format("Failed to close the session with %s cleanly: %s") % descriptor % e.what(),
            libskiff::LogLevel::WARN);
    }

    // terminates the master if it did not exit on request
    master.reset();

    boost::system::error_code ec;
    boost::filesystem::remove(controlPath, ec);
}

libskiff::CLIArguments SshSession::makeControlArgs(const std::string& controlCommand) const {
    return libskiff::CLIArguments{
        transport.sshPath.string(),
        "-S", controlPath.string(),
        "-O", controlCommand,
        "-p", std::to_string(descriptor.port),
        descriptor.username + "@" + descriptor.host
    };
}

void SshSession::log(const boost::format& message, libskiff::LogLevel level,
                     std::ostream& outStream, std::ostream& errStream) const {
    log(message.str(), level, outStream, errStream);
}

void SshSession::log(const std::string& message, libskiff::LogLevel level,
                     std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
