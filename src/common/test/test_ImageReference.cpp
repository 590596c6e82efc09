/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libskiff/Error.hpp"
#include "common/ImageReference.hpp"
#include "aux/unitTestMain.hpp"

namespace skiff {
namespace common {
namespace test {

TEST_GROUP(ImageReferenceTestGroup) {
};

TEST(ImageReferenceTestGroup, parse) {
    auto ref = ImageReference::parse("app:1.0");
    CHECK_EQUAL(ref.name, std::string{"app"});
    CHECK_EQUAL(ref.tag, std::string{"1.0"});

    // default tag
    ref = ImageReference::parse("user/app");
    CHECK_EQUAL(ref.name, std::string{"user/app"});
    CHECK_EQUAL(ref.tag, ImageReference::DEFAULT_TAG);

    // registry with port
    ref = ImageReference::parse("registry:5000/app");
    CHECK_EQUAL(ref.name, std::string{"registry:5000/app"});
    CHECK_EQUAL(ref.tag, std::string{"latest"});

    ref = ImageReference::parse("registry:5000/team/app:v2");
    CHECK_EQUAL(ref.name, std::string{"registry:5000/team/app"});
    CHECK_EQUAL(ref.tag, std::string{"v2"});
}

TEST(ImageReferenceTestGroup, parseInvalid) {
    auto inputs = {"", ":tag", "app:", "/app", "app/", "registry:5000/"};
    for(const auto& input : inputs) {
        try {
            ImageReference::parse(input);
            FAIL("expected exception");
        }
        catch(const libskiff::Error& e) {
            CHECK(e.getCode() == libskiff::ErrorCode::InvalidAddress);
        }
    }
}

TEST(ImageReferenceTestGroup, string) {
    CHECK_EQUAL(ImageReference::parse("app").string(), std::string{"app:latest"});
    CHECK_EQUAL(ImageReference::parse("docker.io/library/app:1").string(), std::string{"docker.io/library/app:1"});
}

TEST(ImageReferenceTestGroup, getFamiliarName) {
    CHECK_EQUAL(ImageReference::parse("docker.io/library/alpine:3").getFamiliarName(), std::string{"alpine:3"});
    CHECK_EQUAL(ImageReference::parse("library/alpine").getFamiliarName(), std::string{"alpine:latest"});
    CHECK_EQUAL(ImageReference::parse("docker.io/user/app:1").getFamiliarName(), std::string{"user/app:1"});
    CHECK_EQUAL(ImageReference::parse("quay.io/user/app:1").getFamiliarName(), std::string{"quay.io/user/app:1"});
}

TEST(ImageReferenceTestGroup, matchesRepoTag) {
    auto ref = ImageReference::parse("docker.io/library/alpine:3");
    CHECK(ref.matchesRepoTag("alpine:3"));
    CHECK(ref.matchesRepoTag("docker.io/library/alpine:3"));
    CHECK(!ref.matchesRepoTag("alpine:latest"));
    CHECK(!ref.matchesRepoTag("other/alpine:3"));
    CHECK(!ref.matchesRepoTag(""));

    auto untagged = ImageReference::parse("app");
    CHECK(untagged.matchesRepoTag("app:latest"));
}

TEST(ImageReferenceTestGroup, comparison) {
    CHECK(ImageReference::parse("app") == ImageReference::parse("app:latest"));
    CHECK(ImageReference::parse("app:1") != ImageReference::parse("app:2"));
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
