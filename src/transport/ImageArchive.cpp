/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/ImageArchive.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/json.hpp"


namespace skiff {
namespace transport {

namespace {

const char* const manifestFilename = "manifest.json";

rapidjson::Document parseArchiveJSON(const std::string& json, const std::string& what) {
    try {
        return libskiff::json::parse(json);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to parse %s of image archive: %s") % what % e.what();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest, message.str());
    }
}

std::vector<std::string> getStringArray(const rapidjson::Value& object, const char* key, const std::string& what) {
    auto output = std::vector<std::string>{};
    auto itr = object.FindMember(key);
    if(itr == object.MemberEnd() || itr->value.IsNull()) {
        return output;
    }
    if(!itr->value.IsArray()) {
        auto message = boost::format("Malformed %s: '%s' is not an array") % what % key;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest, message.str());
    }
    for(const auto& element : itr->value.GetArray()) {
        if(!element.IsString()) {
            auto message = boost::format("Malformed %s: '%s' contains a non-string element") % what % key;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest, message.str());
        }
        output.push_back(element.GetString());
    }
    return output;
}

}

bool ManifestEntry::isTaggedAs(const common::ImageReference& reference) const {
    return std::any_of(repoTags.cbegin(), repoTags.cend(), [&reference](const std::string& repoTag) {
        return reference.matchesRepoTag(repoTag);
    });
}

ImageArchive::ImageArchive(channel::ExecutionChannel& channel, const boost::filesystem::path& extractionDir)
    : channel{channel}
    , extractionDir{extractionDir}
{}

std::vector<ManifestEntry> ImageArchive::readManifest() const {
    auto content = channel::readFile(channel, extractionDir / manifestFilename);
    return parseManifest(content);
}

ConfigDescriptor ImageArchive::readConfigDescriptor(const ManifestEntry& entry) const {
    auto content = channel::readFile(channel, extractionDir / entry.configPath);
    try {
        return parseConfigDescriptor(content);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to read image config %s") % entry.configPath;
        SKIFF_RETHROW_ERROR(e, message.str());
    }
}

std::vector<ManifestEntry> ImageArchive::parseManifest(const std::string& json) {
    auto document = parseArchiveJSON(json, manifestFilename);
    if(!document.IsArray()) {
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest,
                                "Malformed manifest.json: top-level value is not an array");
    }

    auto entries = std::vector<ManifestEntry>{};
    for(const auto& value : document.GetArray()) {
        if(!value.IsObject()) {
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest,
                                    "Malformed manifest.json: entry is not an object");
        }
        auto configItr = value.FindMember("Config");
        if(configItr == value.MemberEnd() || !configItr->value.IsString()) {
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest,
                                    "Malformed manifest.json: entry without 'Config'");
        }

        auto entry = ManifestEntry{};
        entry.configPath = configItr->value.GetString();
        entry.repoTags = getStringArray(value, "RepoTags", manifestFilename);
        for(const auto& layer : getStringArray(value, "Layers", manifestFilename)) {
            entry.layerPaths.push_back(layer);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

ConfigDescriptor ImageArchive::parseConfigDescriptor(const std::string& json) {
    auto document = parseArchiveJSON(json, "image config");
    if(!document.IsObject()) {
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest,
                                "Malformed image config: top-level value is not an object");
    }
    auto rootfsItr = document.FindMember("rootfs");
    if(rootfsItr == document.MemberEnd() || !rootfsItr->value.IsObject()) {
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest,
                                "Malformed image config: missing 'rootfs' object");
    }
    auto descriptor = ConfigDescriptor{};
    descriptor.diffIds = getStringArray(rootfsItr->value, "diff_ids", "image config");
    return descriptor;
}

}
}
