/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <string>
#include <vector>

#include <unistd.h>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "channel/LocalChannel.hpp"
#include "transport/LayerInventory.hpp"
#include "aux/filesystem.hpp"
#include "aux/fakeTools.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace transport {
namespace test {

namespace aux = libskiff::test::aux;

TEST_GROUP(LayerInventoryTestGroup) {
    void setup() {
        tmp.reset(new aux::filesystem::TemporaryDirectory{});
        docker = aux::fakeTools::createFakeDocker(tmp->getPath()).string();
    }

    void teardown() {
        tmp.reset();
    }

    void writeRuntimeInfo(const std::string& driver) {
        auto info = boost::format("{\"Driver\": \"%s\", \"DockerRootDir\": \"%s\"}")
            % driver % (tmp->getPath() / "root").string();
        libskiff::test::aux::filesystem::writeTextFile(info.str(), tmp->getPath() / "info.json");
    }

    void writeLayerDatabase(const std::vector<std::string>& diffIds) {
        auto layerdb = tmp->getPath() / "root/image/overlay2/layerdb/sha256";
        for(std::size_t i = 0; i < diffIds.size(); ++i) {
            libskiff::test::aux::filesystem::writeTextFile(diffIds[i], layerdb / ("chain" + std::to_string(i)) / "diff");
        }
        // entries without a diff file are skipped
        libskiff::test::aux::filesystem::createFoldersIfNecessary(layerdb / "tmp");
    }

    std::unique_ptr<aux::filesystem::TemporaryDirectory> tmp;
    std::string docker;
    channel::LocalChannel localChannel;
};

TEST(LayerInventoryTestGroup, parseRuntimeInfo) {
    auto root = boost::filesystem::path{};
    auto result = LayerInventory::parseRuntimeInfo(
        "{\"Driver\": \"overlay2\", \"DockerRootDir\": \"/var/lib/docker\", \"Images\": 3}", root);
    CHECK(result.kind == ProbeResult::Kind::Found);
    CHECK(root == boost::filesystem::path{"/var/lib/docker"});

    result = LayerInventory::parseRuntimeInfo("{\"Driver\": \"btrfs\", \"DockerRootDir\": \"/var/lib/docker\"}", root);
    CHECK(result.kind == ProbeResult::Kind::DriverUnsupported);

    result = LayerInventory::parseRuntimeInfo("{\"Driver\": \"overlay2\"}", root);
    CHECK(result.kind == ProbeResult::Kind::QueryFailed);

    result = LayerInventory::parseRuntimeInfo("not json", root);
    CHECK(result.kind == ProbeResult::Kind::QueryFailed);

    result = LayerInventory::parseRuntimeInfo("[]", root);
    CHECK(result.kind == ProbeResult::Kind::QueryFailed);
}

TEST(LayerInventoryTestGroup, parseLayerList) {
    auto layers = LayerInventory::parseLayerList("[\"sha256:b\", \"sha256:a\", \"sha256:b\"]\n");
    CHECK_EQUAL(layers.size(), 2);
    CHECK(layers.count("sha256:a") == 1);
    CHECK(layers.count("sha256:b") == 1);

    CHECK(LayerInventory::parseLayerList("null").empty());
    CHECK_THROWS(libskiff::Error, LayerInventory::parseLayerList("{}"));
    CHECK_THROWS(libskiff::Error, LayerInventory::parseLayerList("[1]"));
}

TEST(LayerInventoryTestGroup, probeKindToString) {
    CHECK_EQUAL(probeKindToString(ProbeResult::Kind::Found), std::string{"found"});
    CHECK_EQUAL(probeKindToString(ProbeResult::Kind::DriverUnsupported), std::string{"driver unsupported"});
}

TEST(LayerInventoryTestGroup, collectFromStorage) {
    writeRuntimeInfo("overlay2");
    writeLayerDatabase({"sha256:d1\n", "sha256:d2"});

    auto inventory = LayerInventory{localChannel, docker};
    auto layers = inventory.collect(common::ImageReference::parse("app:1.0"));
    CHECK(layers);
    CHECK_EQUAL(layers->size(), 2);
    CHECK(layers->count("sha256:d1") == 1);
    CHECK(layers->count("sha256:d2") == 1);

    // the image probe is not needed
    auto calls = libskiff::test::aux::filesystem::readFile(tmp->getPath() / "calls.log");
    CHECK(calls.find("images") == std::string::npos);
}

TEST(LayerInventoryTestGroup, collectFromEmptyStorage) {
    writeRuntimeInfo("overlay2");
    writeLayerDatabase({});

    auto inventory = LayerInventory{localChannel, docker};
    auto layers = inventory.collect(common::ImageReference::parse("app:1.0"));
    CHECK(layers);
    CHECK(layers->empty());
}

TEST(LayerInventoryTestGroup, collectFromExistingImage) {
    writeRuntimeInfo("vfs");
    libskiff::test::aux::filesystem::writeTextFile("sha256:0123\n", tmp->getPath() / "images.out");
    libskiff::test::aux::filesystem::writeTextFile("[\"sha256:d1\",\"sha256:d3\"]\n", tmp->getPath() / "layers.json");

    auto inventory = LayerInventory{localChannel, docker};
    auto layers = inventory.collect(common::ImageReference::parse("app:1.0"));
    CHECK(layers);
    CHECK(*layers == (LayerSet{"sha256:d1", "sha256:d3"}));

    auto calls = libskiff::test::aux::filesystem::readFile(tmp->getPath() / "calls.log");
    CHECK(calls.find("images --quiet --no-trunc app:1.0") != std::string::npos);
    CHECK(calls.find("inspect --type image --format {{json .RootFS.Layers}} app:1.0") != std::string::npos);
}

TEST(LayerInventoryTestGroup, collectWithoutInventory) {
    writeRuntimeInfo("zfs");

    auto inventory = LayerInventory{localChannel, docker};
    CHECK(!inventory.collect(common::ImageReference::parse("app:1.0")));

    auto result = inventory.probeImage(common::ImageReference::parse("app:1.0"));
    CHECK(result.kind == ProbeResult::Kind::NotFound);
}

TEST(LayerInventoryTestGroup, collectWithUnreachableRuntime) {
    // "info" fails, "images" fails
    libskiff::test::aux::filesystem::writeTextFile("1", tmp->getPath() / "images.status");

    auto inventory = LayerInventory{localChannel, docker};
    CHECK(inventory.probeStorage().kind == ProbeResult::Kind::QueryFailed);
    try {
        inventory.collect(common::ImageReference::parse("app:1.0"));
        FAIL("expected exception");
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::InventoryUnavailable);
    }
}

TEST(LayerInventoryTestGroup, storageWithoutLayerDatabase) {
    writeRuntimeInfo("overlay2");

    auto inventory = LayerInventory{localChannel, docker};
    CHECK(inventory.probeStorage().kind == ProbeResult::Kind::QueryFailed);
}

TEST(LayerInventoryTestGroup, collectWithUnreadableStorageRoot) {
    writeRuntimeInfo("overlay2");
    writeLayerDatabase({"sha256:d1"});
    libskiff::test::aux::filesystem::writeTextFile("sha256:0123\n", tmp->getPath() / "images.out");
    libskiff::test::aux::filesystem::writeTextFile("[\"sha256:d3\"]\n", tmp->getPath() / "layers.json");

    auto root = tmp->getPath() / "root";
    chmod(root.c_str(), 0);

    auto inventory = LayerInventory{localChannel, docker};
    auto storage = inventory.probeStorage();
    auto layers = inventory.collect(common::ImageReference::parse("app:1.0"));

    chmod(root.c_str(), 0700);

    CHECK(layers);
    // root bypasses the permission check
    if(geteuid() != 0) {
        CHECK(storage.kind == ProbeResult::Kind::QueryFailed);
        CHECK(*layers == (LayerSet{"sha256:d3"}));
    }
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
