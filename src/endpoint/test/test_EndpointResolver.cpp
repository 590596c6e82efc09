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
#include <tuple>

#include "libskiff/Error.hpp"
#include "endpoint/EndpointResolver.hpp"
#include "aux/filesystem.hpp"
#include "aux/fakeTools.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace endpoint {
namespace test {

static void checkInvalidAddress(const std::string& address) {
    try {
        parseAddress(address, "default");
        FAIL(("expected exception for address " + address).c_str());
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::InvalidAddress);
    }
}

TEST_GROUP(EndpointResolverTestGroup) {
};

TEST(EndpointResolverTestGroup, localAddress) {
    auto parsed = parseAddress("app:1.0", "default");
    CHECK(!parsed.connection);
    CHECK_EQUAL(parsed.image.name, std::string{"app"});
    CHECK_EQUAL(parsed.image.tag, std::string{"1.0"});

    // namespaced and registry-qualified images stay local
    parsed = parseAddress("user/app", "default");
    CHECK(!parsed.connection);
    CHECK_EQUAL(parsed.image.string(), std::string{"user/app:latest"});

    parsed = parseAddress("registry:5000/team/app:v2", "default");
    CHECK(!parsed.connection);
    CHECK_EQUAL(parsed.image.name, std::string{"registry:5000/team/app"});
    CHECK_EQUAL(parsed.image.tag, std::string{"v2"});
}

TEST(EndpointResolverTestGroup, remoteAddress) {
    auto parsed = parseAddress("alice@host:2222/app:1.0", "default");
    CHECK(parsed.connection);
    CHECK_EQUAL(parsed.connection->username, std::string{"alice"});
    CHECK_EQUAL(parsed.connection->host, std::string{"host"});
    CHECK_EQUAL(parsed.connection->port, 2222);
    CHECK(!parsed.connection->password);
    CHECK(parsed.connection->jumpChain.empty());
    CHECK_EQUAL(parsed.image.name, std::string{"app"});
    CHECK_EQUAL(parsed.image.tag, std::string{"1.0"});

    // default port and tag
    parsed = parseAddress("alice@host/user/app", "default");
    CHECK_EQUAL(parsed.connection->port, common::ConnectionDescriptor::DEFAULT_PORT);
    CHECK_EQUAL(parsed.image.string(), std::string{"user/app:latest"});
}

TEST(EndpointResolverTestGroup, remoteAddressWithDefaultUser) {
    auto parsed = parseAddress("@host:2222/app:1.0", "default");
    CHECK(parsed.connection);
    CHECK_EQUAL(parsed.connection->username, std::string{"default"});
    CHECK_EQUAL(parsed.connection->host, std::string{"host"});
    CHECK_EQUAL(parsed.connection->port, 2222);
    CHECK(!parsed.connection->password);
    CHECK_EQUAL(parsed.image.string(), std::string{"app:1.0"});

    // without the marker the same address names a registry-qualified local image
    parsed = parseAddress("host:2222/app:1.0", "default");
    CHECK(!parsed.connection);

    parsed = parseAddress(":s3cret@host/app", "default");
    CHECK_EQUAL(parsed.connection->username, std::string{"default"});
    CHECK_EQUAL(*parsed.connection->password, std::string{"s3cret"});
}

TEST(EndpointResolverTestGroup, remoteAddressWithPassword) {
    auto parsed = parseAddress("alice:s3cret@host/app", "default");
    CHECK_EQUAL(parsed.connection->username, std::string{"alice"});
    CHECK(parsed.connection->password);
    CHECK_EQUAL(*parsed.connection->password, std::string{"s3cret"});
    CHECK_EQUAL(parsed.connection->host, std::string{"host"});
}

TEST(EndpointResolverTestGroup, remoteAddressWithProxy) {
    auto parsed = parseAddress("host/app:1.0?proxy=bob@jump", "default");
    CHECK(parsed.connection);
    CHECK_EQUAL(parsed.connection->username, std::string{"default"});
    CHECK_EQUAL(parsed.connection->host, std::string{"host"});
    CHECK_EQUAL(parsed.connection->jumpChain.size(), 1);
    CHECK(parsed.connection->jumpChain[0] == (common::JumpHost{"bob", "jump", 22}));
    CHECK_EQUAL(parsed.image.string(), std::string{"app:1.0"});

    parsed = parseAddress("alice@host/app?proxy=gw1:2200,carol@gw2", "default");
    CHECK_EQUAL(parsed.connection->jumpChain.size(), 2);
    CHECK(parsed.connection->jumpChain[0] == (common::JumpHost{common::JumpHost::DEFAULT_USERNAME, "gw1", 2200}));
    CHECK(parsed.connection->jumpChain[1] == (common::JumpHost{"carol", "gw2", 22}));
}

TEST(EndpointResolverTestGroup, parseJumpChain) {
    auto chain = parseJumpChain("a,b@c:2,d");
    CHECK_EQUAL(chain.size(), 3);
    CHECK(chain[0] == (common::JumpHost{"root", "a", 22}));
    CHECK(chain[1] == (common::JumpHost{"b", "c", 2}));
    CHECK(chain[2] == (common::JumpHost{"root", "d", 22}));

    CHECK_THROWS(libskiff::Error, parseJumpChain(""));
    CHECK_THROWS(libskiff::Error, parseJumpChain("a,,b"));
    CHECK_THROWS(libskiff::Error, parseJumpChain("a:0"));
    CHECK_THROWS(libskiff::Error, parseJumpChain("a:70000"));
}

TEST(EndpointResolverTestGroup, invalidAddresses) {
    checkInvalidAddress("");
    checkInvalidAddress("alice@host");
    checkInvalidAddress("alice@host/");
    checkInvalidAddress("alice@host:0/app");
    checkInvalidAddress("alice@host:65536/app");
    checkInvalidAddress("alice@host:port/app");
    checkInvalidAddress("alice@host/app?user=bob");
    checkInvalidAddress("alice@host/app?proxy");
    checkInvalidAddress("alice@host/app?proxy=a@b@c");
    checkInvalidAddress("alice@/app");
}

TEST(EndpointResolverTestGroup, resolve) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto config = common::Config{};
    config.transport.sshPath = libskiff::test::aux::fakeTools::createFakeSsh(tmp.getPath());
    config.transport.controlDirectory = tmp.getPath();
    auto resolver = EndpointResolver{config};

    {
        auto resolved = resolver.resolve("app:1.0");
        CHECK(!std::get<0>(resolved).isRemote());
        CHECK_EQUAL(std::get<0>(resolved).getChannel().describe(), std::string{"localhost"});
        CHECK_EQUAL(std::get<1>(resolved).string(), std::string{"app:1.0"});
    }
    {
        auto resolved = resolver.resolve("alice@cluster:2222/app:1.0");
        auto& endpoint = std::get<0>(resolved);
        CHECK(endpoint.isRemote());
        CHECK_EQUAL(endpoint.getDescriptor()->host, std::string{"cluster"});
        CHECK_EQUAL(endpoint.getChannel().describe(), std::string{"alice@cluster:2222"});
        CHECK_EQUAL(endpoint.getChannel().run("printf ok").stdoutBytes, std::string{"ok"});
    }

    CHECK_THROWS(libskiff::Error, resolver.resolve("alice@unreachable/app"));
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
