/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ConnectionDescriptor.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace common {
namespace test {

TEST_GROUP(ConnectionDescriptorTestGroup) {
};

TEST(ConnectionDescriptorTestGroup, string) {
    auto descriptor = ConnectionDescriptor{};
    descriptor.host = "cluster";
    descriptor.port = 2222;
    descriptor.username = "alice";
    CHECK_EQUAL(descriptor.string(), std::string{"alice@cluster:2222"});

    descriptor.jumpChain.push_back(JumpHost{"bob", "gateway", 22});
    descriptor.jumpChain.push_back(JumpHost{"root", "bastion", 2200});
    CHECK_EQUAL(descriptor.string(), std::string{"alice@cluster:2222 via bob@gateway:22 via root@bastion:2200"});
}

TEST(ConnectionDescriptorTestGroup, passwordIsNotPrinted) {
    auto descriptor = ConnectionDescriptor{};
    descriptor.host = "cluster";
    descriptor.port = ConnectionDescriptor::DEFAULT_PORT;
    descriptor.username = "alice";
    descriptor.password = std::string{"secret"};
    CHECK(descriptor.string().find("secret") == std::string::npos);
}

TEST(ConnectionDescriptorTestGroup, comparison) {
    auto lhs = ConnectionDescriptor{"cluster", 22, "alice", {}, {}};
    auto rhs = lhs;
    CHECK(lhs == rhs);

    rhs.password = std::string{"secret"};
    CHECK(!(lhs == rhs));

    rhs = lhs;
    rhs.jumpChain.push_back(JumpHost{JumpHost::DEFAULT_USERNAME, "gateway", 22});
    CHECK(!(lhs == rhs));
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
