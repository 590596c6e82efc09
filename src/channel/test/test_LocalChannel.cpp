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
#include <unistd.h>
#include <sys/stat.h>

#include "libskiff/Error.hpp"
#include "channel/LocalChannel.hpp"
#include "aux/filesystem.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace channel {
namespace test {

TEST_GROUP(LocalChannelTestGroup) {
};

TEST(LocalChannelTestGroup, run) {
    auto channel = LocalChannel{};
    auto output = channel.run("printf out; printf err >&2");
    CHECK_EQUAL(output.stdoutBytes, std::string{"out"});
    CHECK_EQUAL(output.stderrBytes, std::string{"err"});
}

TEST(LocalChannelTestGroup, runFailure) {
    auto channel = LocalChannel{};
    try {
        channel.run("echo 'No such image' >&2; exit 2");
        FAIL("expected exception");
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::ExecutionFailure);
        CHECK(std::string{e.what()}.find("No such image") != std::string::npos);
    }
}

TEST(LocalChannelTestGroup, stat) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};

    libskiff::test::aux::filesystem::writeTextFile("12345", tmp.getPath() / "file");
    auto status = channel.stat(tmp.getPath() / "file");
    CHECK(status.type == FileStatus::Type::RegularFile);
    CHECK_EQUAL(status.size, 5);

    status = channel.stat(tmp.getPath());
    CHECK(status.type == FileStatus::Type::Directory);

    try {
        channel.stat(tmp.getPath() / "missing");
        FAIL("expected exception");
    }
    catch(const libskiff::Error& e) {
        CHECK(e.getCode() == libskiff::ErrorCode::IOFailure);
    }
}

TEST(LocalChannelTestGroup, readAndWrite) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    auto content = std::string{"layer\0data", 10};

    writeFile(channel, tmp.getPath() / "file", content);
    CHECK(readFile(channel, tmp.getPath() / "file") == content);

    CHECK_THROWS(libskiff::Error, channel.openRead(tmp.getPath() / "missing"));
    CHECK_THROWS(libskiff::Error, channel.openWrite(tmp.getPath() / "missing/file"));
}

TEST(LocalChannelTestGroup, listDirectory) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    libskiff::test::aux::filesystem::createFoldersIfNecessary(tmp.getPath() / "layer1");
    libskiff::test::aux::filesystem::createFoldersIfNecessary(tmp.getPath() / "layer0");
    libskiff::test::aux::filesystem::writeTextFile("{}", tmp.getPath() / "manifest.json");

    auto names = channel.listDirectory(tmp.getPath());
    CHECK_EQUAL(names.size(), 3);
    CHECK_EQUAL(names[0], std::string{"layer0"});
    CHECK_EQUAL(names[1], std::string{"layer1"});
    CHECK_EQUAL(names[2], std::string{"manifest.json"});

    CHECK_THROWS(libskiff::Error, channel.listDirectory(tmp.getPath() / "missing"));
}

TEST(LocalChannelTestGroup, listUnreadableDirectory) {
    // root bypasses the permission check
    if(geteuid() == 0) {
        return;
    }
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    auto locked = tmp.getPath() / "locked";
    libskiff::test::aux::filesystem::createFoldersIfNecessary(locked / "layerdb");
    chmod(locked.c_str(), 0);

    auto code = libskiff::ErrorCode::Generic;
    try {
        channel.listDirectory(locked / "layerdb");
    }
    catch(const libskiff::Error& e) {
        code = e.getCode();
    }
    chmod(locked.c_str(), 0700);
    CHECK(code == libskiff::ErrorCode::IOFailure);
}

TEST(LocalChannelTestGroup, remove) {
    auto tmp = libskiff::test::aux::filesystem::TemporaryDirectory{};
    auto channel = LocalChannel{};
    libskiff::test::aux::filesystem::createFoldersIfNecessary(tmp.getPath() / "layer0");
    libskiff::test::aux::filesystem::writeTextFile("", tmp.getPath() / "layer0/layer.tar");
    libskiff::test::aux::filesystem::writeTextFile("", tmp.getPath() / "file");

    channel.remove(tmp.getPath() / "file", false);
    CHECK(!boost::filesystem::exists(tmp.getPath() / "file"));

    // non-empty directory requires recursion
    CHECK_THROWS(libskiff::Error, channel.remove(tmp.getPath() / "layer0", false));
    channel.remove(tmp.getPath() / "layer0", true);
    CHECK(!boost::filesystem::exists(tmp.getPath() / "layer0"));

    // removing a missing path is not an error
    channel.remove(tmp.getPath() / "missing", true);
}

TEST(LocalChannelTestGroup, describe) {
    CHECK_EQUAL(LocalChannel{}.describe(), std::string{"localhost"});
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
