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
#include "channel/LocalChannel.hpp"
#include "transport/ImageArchive.hpp"
#include "aux/filesystem.hpp"
#include "aux/imageArchive.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace transport {
namespace test {

static void checkMalformedManifest(const std::string& json) {
    try {
        ImageArchive::parseManifest(json);
        FAIL(("expected exception for manifest " + json).c_str());
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::MalformedManifest);
    }
}

TEST_GROUP(ImageArchiveTestGroup) {
};

TEST(ImageArchiveTestGroup, parseManifest) {
    auto entries = ImageArchive::parseManifest(
        "[{\"Config\": \"abc.json\","
        "  \"RepoTags\": [\"app:1.0\", \"app:latest\"],"
        "  \"Layers\": [\"l0/layer.tar\", \"blobs/sha256/l1\"]},"
        " {\"Config\": \"def.json\", \"RepoTags\": null, \"Layers\": []},"
        " {\"Config\": \"ghi.json\"}]");

    CHECK_EQUAL(entries.size(), 3);
    CHECK(entries[0].configPath == boost::filesystem::path{"abc.json"});
    CHECK_EQUAL(entries[0].repoTags.size(), 2);
    CHECK_EQUAL(entries[0].repoTags[1], std::string{"app:latest"});
    CHECK_EQUAL(entries[0].layerPaths.size(), 2);
    CHECK(entries[0].layerPaths[0] == boost::filesystem::path{"l0/layer.tar"});
    CHECK(entries[0].layerPaths[1] == boost::filesystem::path{"blobs/sha256/l1"});

    CHECK(entries[1].repoTags.empty());
    CHECK(entries[1].layerPaths.empty());
    CHECK(entries[2].repoTags.empty());
    CHECK(entries[2].layerPaths.empty());

    CHECK(ImageArchive::parseManifest("[]").empty());
}

TEST(ImageArchiveTestGroup, parseMalformedManifest) {
    checkMalformedManifest("");
    checkMalformedManifest("[{");
    checkMalformedManifest("{}");
    checkMalformedManifest("[1]");
    checkMalformedManifest("[{\"RepoTags\": []}]");
    checkMalformedManifest("[{\"Config\": 1}]");
    checkMalformedManifest("[{\"Config\": \"c.json\", \"Layers\": \"l0/layer.tar\"}]");
    checkMalformedManifest("[{\"Config\": \"c.json\", \"RepoTags\": [1]}]");
}

TEST(ImageArchiveTestGroup, parseConfigDescriptor) {
    auto config = ImageArchive::parseConfigDescriptor(
        "{\"architecture\": \"amd64\", \"rootfs\": {\"type\": \"layers\", \"diff_ids\": [\"sha256:a\", \"sha256:b\"]}}");
    CHECK_EQUAL(config.diffIds.size(), 2);
    CHECK_EQUAL(config.diffIds[0], std::string{"sha256:a"});
    CHECK_EQUAL(config.diffIds[1], std::string{"sha256:b"});

    CHECK(ImageArchive::parseConfigDescriptor("{\"rootfs\": {\"type\": \"layers\"}}").diffIds.empty());

    CHECK_THROWS(libskiff::Error, ImageArchive::parseConfigDescriptor("[]"));
    CHECK_THROWS(libskiff::Error, ImageArchive::parseConfigDescriptor("{}"));
    CHECK_THROWS(libskiff::Error, ImageArchive::parseConfigDescriptor("{\"rootfs\": {\"diff_ids\": {}}}"));
}

TEST(ImageArchiveTestGroup, isTaggedAs) {
    auto entry = ManifestEntry{};
    entry.repoTags = {"user/app:1.0", "registry:5000/app:2.0"};
    CHECK(entry.isTaggedAs(common::ImageReference::parse("docker.io/user/app:1.0")));
    CHECK(entry.isTaggedAs(common::ImageReference::parse("registry:5000/app:2.0")));
    CHECK(!entry.isTaggedAs(common::ImageReference::parse("user/app")));

    CHECK(!ManifestEntry{}.isTaggedAs(common::ImageReference::parse("app")));
}

TEST(ImageArchiveTestGroup, readFromExtractionDir) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = channel::LocalChannel{};
    libskiff::test::aux::imageArchive::createArchiveTree(
        tmp.getPath(), {"app:1.0"}, {{"sha256:d0", "zero"}, {"sha256:d1", "one"}});

    auto archive = ImageArchive{channel, tmp.getPath()};
    auto entries = archive.readManifest();
    CHECK_EQUAL(entries.size(), 1);
    CHECK(entries[0].isTaggedAs(common::ImageReference::parse("app:1.0")));
    CHECK(entries[0].layerPaths[1] == boost::filesystem::path{"layer1/layer.tar"});

    auto config = archive.readConfigDescriptor(entries[0]);
    CHECK_EQUAL(config.diffIds.size(), 2);
    CHECK_EQUAL(config.diffIds[1], std::string{"sha256:d1"});

    auto emptyDir = tmp.getPath() / "empty";
    libskiff::test::aux::filesystem::createFoldersIfNecessary(emptyDir);
    CHECK_THROWS(libskiff::Error, ImageArchive(channel, emptyDir).readManifest());
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
