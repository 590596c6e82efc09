/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/LayerInventory.hpp"

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/json.hpp"
#include "libskiff/utility/string.hpp"


namespace skiff {
namespace transport {

const std::string LayerInventory::SUPPORTED_STORAGE_DRIVER{"overlay2"};

ProbeResult ProbeResult::found(LayerSet layerIds) {
    return ProbeResult{Kind::Found, std::move(layerIds), ""};
}

ProbeResult ProbeResult::notFound(const std::string& detail) {
    return ProbeResult{Kind::NotFound, LayerSet{}, detail};
}

ProbeResult ProbeResult::driverUnsupported(const std::string& detail) {
    return ProbeResult{Kind::DriverUnsupported, LayerSet{}, detail};
}

ProbeResult ProbeResult::queryFailed(const std::string& detail) {
    return ProbeResult{Kind::QueryFailed, LayerSet{}, detail};
}

std::string probeKindToString(ProbeResult::Kind kind) {
    switch(kind) {
        case ProbeResult::Kind::Found: return "found";
        case ProbeResult::Kind::NotFound: return "not found";
        case ProbeResult::Kind::DriverUnsupported: return "driver unsupported";
        case ProbeResult::Kind::QueryFailed: return "query failed";
    }
    return "unknown";
}

LayerInventory::LayerInventory(channel::ExecutionChannel& channel, const std::string& dockerPath)
    : channel{channel}
    , dockerPath{dockerPath}
{}

boost::optional<LayerSet> LayerInventory::collect(const common::ImageReference& target) const {
    auto storage = probeStorage();
    if(storage.kind == ProbeResult::Kind::Found) {
        log(boost::format("Found %d layers in the storage of %s")
            % storage.layerIds.size() % channel.describe(), libskiff::LogLevel::INFO);
        return storage.layerIds;
    }
    log(boost::format("Storage introspection on %s: %s (%s)")
        % channel.describe() % probeKindToString(storage.kind) % storage.detail,
        storage.kind == ProbeResult::Kind::QueryFailed ? libskiff::LogLevel::WARN : libskiff::LogLevel::INFO);

    auto image = probeImage(target);
    switch(image.kind) {
        case ProbeResult::Kind::Found:
            log(boost::format("Found %d layers of existing image %s on %s")
                % image.layerIds.size() % target % channel.describe(), libskiff::LogLevel::INFO);
            return image.layerIds;
        case ProbeResult::Kind::NotFound:
        case ProbeResult::Kind::DriverUnsupported:
            log(boost::format("No layer inventory available on %s (%s)") % channel.describe() % image.detail,
                libskiff::LogLevel::INFO);
            return boost::none;
        case ProbeResult::Kind::QueryFailed:
            break;
    }

    auto message = boost::format("Failed to determine the layers present on %s: %s")
        % channel.describe() % image.detail;
    SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::InventoryUnavailable, message.str());
}

ProbeResult LayerInventory::probeStorage() const {
    auto output = channel::CommandOutput{};
    try {
        output = channel.run(dockerPath + " info --format '{{json .}}'");
    }
    catch(const std::exception& e) {
        return ProbeResult::queryFailed(e.what());
    }

    auto storageRoot = boost::filesystem::path{};
    auto info = parseRuntimeInfo(output.stdoutBytes, storageRoot);
    if(info.kind != ProbeResult::Kind::Found) {
        return info;
    }
    return scanLayerDatabase(storageRoot);
}

/**
 * Checks the output of "docker info --format '{{json .}}'". On success the
 * result is an empty "Found" and storageRoot is set to the runtime's root
 * directory.
 */
ProbeResult LayerInventory::parseRuntimeInfo(const std::string& json, boost::filesystem::path& storageRoot) {
    auto info = rapidjson::Document{};
    try {
        info = libskiff::json::parse(json);
    }
    catch(const std::exception& e) {
        return ProbeResult::queryFailed(e.what());
    }
    if(!info.IsObject()) {
        return ProbeResult::queryFailed("runtime info is not a JSON object");
    }

    auto driverItr = info.FindMember("Driver");
    auto rootItr = info.FindMember("DockerRootDir");
    if(driverItr == info.MemberEnd() || !driverItr->value.IsString()
       || rootItr == info.MemberEnd() || !rootItr->value.IsString()) {
        return ProbeResult::queryFailed("runtime info lacks 'Driver' or 'DockerRootDir'");
    }

    auto driver = std::string{driverItr->value.GetString()};
    if(driver != SUPPORTED_STORAGE_DRIVER) {
        auto message = boost::format("storage driver '%s' is not supported") % driver;
        return ProbeResult::driverUnsupported(message.str());
    }

    storageRoot = rootItr->value.GetString();
    return ProbeResult::found({});
}

ProbeResult LayerInventory::scanLayerDatabase(const boost::filesystem::path& storageRoot) const {
    auto layerdb = storageRoot / "image" / SUPPORTED_STORAGE_DRIVER / "layerdb" / "sha256";

    auto entries = std::vector<std::string>{};
    try {
        entries = channel.listDirectory(layerdb);
    }
    catch(const std::exception& e) {
        return ProbeResult::queryFailed(e.what());
    }

    auto layerIds = LayerSet{};
    for(const auto& entry : entries) {
        auto diffFile = layerdb / entry / "diff";
        try {
            auto diffId = libskiff::string::trimWhitespace(channel::readFile(channel, diffFile));
            if(!diffId.empty()) {
                layerIds.insert(diffId);
            }
        }
        catch(const std::exception& e) {
            // e.g. the "tmp" directory of the layer database
            log(boost::format("Skipping %s: %s") % diffFile % e.what(), libskiff::LogLevel::DEBUG);
        }
    }
    return ProbeResult::found(std::move(layerIds));
}

ProbeResult LayerInventory::probeImage(const common::ImageReference& target) const {
    auto quotedTarget = libskiff::string::shellQuote(target.string());

    auto output = channel::CommandOutput{};
    try {
        output = channel.run(dockerPath + " images --quiet --no-trunc " + quotedTarget);
    }
    catch(const std::exception& e) {
        return ProbeResult::queryFailed(e.what());
    }
    if(libskiff::string::trimWhitespace(output.stdoutBytes).empty()) {
        auto message = boost::format("image %s does not exist") % target;
        return ProbeResult::notFound(message.str());
    }

    try {
        output = channel.run(dockerPath + " inspect --type image --format '{{json .RootFS.Layers}}' " + quotedTarget);
        return ProbeResult::found(parseLayerList(output.stdoutBytes));
    }
    catch(const std::exception& e) {
        return ProbeResult::queryFailed(e.what());
    }
}

LayerSet LayerInventory::parseLayerList(const std::string& json) {
    auto layers = libskiff::json::parse(json);
    if(layers.IsNull()) {
        return LayerSet{};
    }
    if(!layers.IsArray()) {
        SKIFF_THROW_ERROR("Malformed layer list: not a JSON array");
    }
    auto layerIds = LayerSet{};
    for(const auto& layer : layers.GetArray()) {
        if(!layer.IsString()) {
            SKIFF_THROW_ERROR("Malformed layer list: non-string element");
        }
        layerIds.insert(layer.GetString());
    }
    return layerIds;
}

void LayerInventory::log(const boost::format& message, libskiff::LogLevel level,
                         std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
