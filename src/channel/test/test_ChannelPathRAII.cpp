/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <utility>
#include <vector>

#include "channel/ChannelPathRAII.hpp"
#include "channel/LocalChannel.hpp"
#include "aux/filesystem.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace channel {
namespace test {

TEST_GROUP(ChannelPathRAIITestGroup) {
};

TEST(ChannelPathRAIITestGroup, removesPathOnDestruction) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    auto dir = tmp.getPath() / "workdir";
    libskiff::test::aux::filesystem::createFoldersIfNecessary(dir / "image");
    libskiff::test::aux::filesystem::writeTextFile("", dir / "image/manifest.json");

    {
        auto guard = ChannelPathRAII{channel, dir};
        CHECK(guard.getPath() == dir);
        CHECK(boost::filesystem::exists(dir));
    }
    CHECK(!boost::filesystem::exists(dir));
}

TEST(ChannelPathRAIITestGroup, release) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    auto dir = tmp.getPath() / "workdir";
    libskiff::test::aux::filesystem::createFoldersIfNecessary(dir);

    {
        auto guard = ChannelPathRAII{channel, dir};
        guard.release();
    }
    CHECK(boost::filesystem::exists(dir));
}

TEST(ChannelPathRAIITestGroup, move) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    auto first = tmp.getPath() / "first";
    auto second = tmp.getPath() / "second";
    libskiff::test::aux::filesystem::createFoldersIfNecessary(first);
    libskiff::test::aux::filesystem::createFoldersIfNecessary(second);

    {
        auto guards = std::vector<ChannelPathRAII>{};
        guards.emplace_back(channel, first);
        guards.emplace_back(channel, second);

        // move construction transfers ownership
        auto moved = std::move(guards.front());
        CHECK(moved.getPath() == first);
        guards.erase(guards.begin());
        CHECK(boost::filesystem::exists(first));

        // move assignment removes the path previously owned
        moved = std::move(guards.front());
        CHECK(!boost::filesystem::exists(first));
        CHECK(boost::filesystem::exists(second));
    }
    CHECK(!boost::filesystem::exists(second));
}

TEST(ChannelPathRAIITestGroup, missingPathIsTolerated) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    {
        auto guard = ChannelPathRAII{channel, tmp.getPath() / "never-created"};
    }
    auto empty = ChannelPathRAII{};
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
