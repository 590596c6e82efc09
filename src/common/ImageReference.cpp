/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageReference.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libskiff/Error.hpp"


namespace skiff {
namespace common {

const std::string ImageReference::DEFAULT_TAG{"latest"};

static const std::string DEFAULT_DOMAIN_PREFIX{"docker.io/"};
static const std::string OFFICIAL_REPOSITORY_PREFIX{"library/"};

/**
 * Strips the default registry and namespace the same way the container
 * runtime does when it prints repo tags, e.g. "docker.io/library/alpine"
 * becomes "alpine" and "docker.io/user/app" becomes "user/app".
 */
static std::string familiarize(const std::string& name) {
    auto output = name;
    if(boost::starts_with(output, DEFAULT_DOMAIN_PREFIX)) {
        output = output.substr(DEFAULT_DOMAIN_PREFIX.size());
        if(boost::starts_with(output, OFFICIAL_REPOSITORY_PREFIX)
           && output.find('/', OFFICIAL_REPOSITORY_PREFIX.size()) == std::string::npos) {
            output = output.substr(OFFICIAL_REPOSITORY_PREFIX.size());
        }
    }
    else if(boost::starts_with(output, OFFICIAL_REPOSITORY_PREFIX)
            && output.find('/', OFFICIAL_REPOSITORY_PREFIX.size()) == std::string::npos) {
        output = output.substr(OFFICIAL_REPOSITORY_PREFIX.size());
    }
    return output;
}

std::string ImageReference::string() const {
    return name + ":" + tag;
}

std::string ImageReference::getFamiliarName() const {
    return familiarize(name) + ":" + tag;
}

bool ImageReference::matchesRepoTag(const std::string& repoTag) const {
    try {
        return ImageReference::parse(repoTag).getFamiliarName() == getFamiliarName();
    }
    catch(const libskiff::Error&) {
        // an unparsable repo tag cannot name this image
        return false;
    }
}

/**
 * Parses "name[:tag]". The tag separator is the last colon after the last
 * slash, so that registry ports ("registry:5000/app") are kept in the name.
 * A missing tag defaults to "latest".
 */
ImageReference ImageReference::parse(const std::string& input) {
    if(input.empty()) {
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, "Invalid image reference: empty string");
    }

    auto lastSlash = input.rfind('/');
    auto colon = input.rfind(':');
    bool hasTag = colon != std::string::npos && (lastSlash == std::string::npos || colon > lastSlash);

    auto reference = ImageReference{};
    if(hasTag) {
        reference.name = input.substr(0, colon);
        reference.tag = input.substr(colon + 1);
    }
    else {
        reference.name = input;
        reference.tag = DEFAULT_TAG;
    }

    if(reference.name.empty() || reference.tag.empty()
       || reference.name.front() == '/' || reference.name.back() == '/') {
        auto message = boost::format("Invalid image reference '%s'") % input;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InvalidAddress, message.str());
    }

    return reference;
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.name == rhs.name
        && lhs.tag == rhs.tag;
}

bool operator!=(const ImageReference& lhs, const ImageReference& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

}
}
