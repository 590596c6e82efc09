/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "libskiff/Error.hpp"
#include "channel/SshSession.hpp"
#include "aux/filesystem.hpp"
#include "aux/fakeTools.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace channel {
namespace test {

static common::ConnectionDescriptor makeDescriptor(const std::string& host) {
    auto descriptor = common::ConnectionDescriptor{};
    descriptor.host = host;
    descriptor.port = 2222;
    descriptor.username = "alice";
    return descriptor;
}

TEST_GROUP(SshSessionTestGroup) {
};

TEST(SshSessionTestGroup, makeMasterArgs) {
    auto transport = common::Config::Transport{};
    transport.connectTimeout = std::chrono::seconds{5};
    auto args = SshSession::makeMasterArgs(makeDescriptor("cluster"), transport, "/tmp/skiff-test.sock");
    auto expected = std::string{
        "ssh -M -N -T -S /tmp/skiff-test.sock"
        " -o ControlPersist=no -o ConnectTimeout=5 -o ServerAliveInterval=15"
        " -o StrictHostKeyChecking=accept-new -o BatchMode=yes"
        " -p 2222 alice@cluster"};
    CHECK_EQUAL(args.string(), expected);
}

TEST(SshSessionTestGroup, makeMasterArgsWithPassword) {
    auto transport = common::Config::Transport{};
    auto descriptor = makeDescriptor("cluster");
    descriptor.password = std::string{"secret"};
    auto args = SshSession::makeMasterArgs(descriptor, transport, "/tmp/skiff-test.sock");

    CHECK_EQUAL(std::string{args.argv()[0]}, std::string{"sshpass"});
    CHECK_EQUAL(std::string{args.argv()[1]}, std::string{"-e"});
    CHECK(args.string().find("PreferredAuthentications=password,keyboard-interactive") != std::string::npos);
    CHECK(args.string().find("BatchMode=yes") == std::string::npos);
    // the password never appears on the command line
    CHECK(args.string().find("secret") == std::string::npos);
}

TEST(SshSessionTestGroup, makeMasterArgsWithJumpChain) {
    auto transport = common::Config::Transport{};
    auto descriptor = makeDescriptor("cluster");
    descriptor.jumpChain.push_back(common::JumpHost{"bob", "gateway", 22});
    descriptor.jumpChain.push_back(common::JumpHost{"root", "bastion", 2200});
    auto args = SshSession::makeMasterArgs(descriptor, transport, "/tmp/skiff-test.sock");
    CHECK(args.string().find("-J bob@gateway:22,root@bastion:2200 -p 2222 alice@cluster") != std::string::npos);
}

TEST(SshSessionTestGroup, makeJumpChainOption) {
    CHECK_EQUAL(SshSession::makeJumpChainOption({}), std::string{""});
    CHECK_EQUAL(SshSession::makeJumpChainOption({common::JumpHost{"root", "gateway", 22}}),
                std::string{"root@gateway:22"});
}

TEST(SshSessionTestGroup, establishAndClose) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto transport = common::Config::Transport{};
    transport.sshPath = libskiff::test::aux::fakeTools::createFakeSsh(tmp.getPath());
    transport.controlDirectory = tmp.getPath();

    auto controlPath = boost::filesystem::path{};
    {
        auto session = SshSession{makeDescriptor("cluster"), transport};
        controlPath = session.getControlPath();
        CHECK(controlPath.parent_path() == tmp.getPath());
        CHECK(boost::filesystem::exists(controlPath));

        auto args = session.makeCommandArgs("true");
        auto expected = transport.sshPath.string() + " -S " + controlPath.string()
            + " -o ControlMaster=no -o BatchMode=yes -T -p 2222 alice@cluster -- true";
        CHECK_EQUAL(args.string(), expected);
    }
    CHECK(!boost::filesystem::exists(controlPath));
}

TEST(SshSessionTestGroup, establishFailure) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto transport = common::Config::Transport{};
    transport.sshPath = libskiff::test::aux::fakeTools::createFakeSsh(tmp.getPath());
    transport.controlDirectory = tmp.getPath();

    try {
        SshSession{makeDescriptor("unreachable"), transport};
        FAIL("expected exception");
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::SessionEstablishmentFailure);
        CHECK(std::string{e.what()}.find("Connection refused") != std::string::npos);
    }
}

TEST(SshSessionTestGroup, missingSshExecutable) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto transport = common::Config::Transport{};
    transport.sshPath = tmp.getPath() / "missing-ssh";
    transport.controlDirectory = tmp.getPath();

    try {
        SshSession{makeDescriptor("cluster"), transport};
        FAIL("expected exception");
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::SessionEstablishmentFailure);
    }
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
