/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/DedupPruner.hpp"

#include <set>
#include <algorithm>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"


namespace skiff {
namespace transport {

namespace {

// expects a lexically normal path
bool isContainedPath(const boost::filesystem::path& path) {
    if(path.empty() || path.is_absolute() || path == ".") {
        return false;
    }
    return std::none_of(path.begin(), path.end(), [](const boost::filesystem::path& component) {
        return component == "..";
    });
}

}

DedupPruner::DedupPruner(channel::ExecutionChannel& channel, const boost::filesystem::path& extractionDir)
    : channel{channel}
    , archive{channel, extractionDir}
{}

PruneResult DedupPruner::prune(const common::ImageReference& reference, const LayerSet& existingLayers) const {
    auto result = PruneResult{};
    auto removed = std::set<boost::filesystem::path>{};
    bool isEntryFound = false;

    for(const auto& entry : archive.readManifest()) {
        if(!entry.isTaggedAs(reference)) {
            continue;
        }
        isEntryFound = true;

        auto config = archive.readConfigDescriptor(entry);
        for(const auto& layerPath : selectRedundantLayers(entry, config, existingLayers)) {
            auto representation = getLayerRepresentation(layerPath);
            if(removed.count(representation) > 0) {
                continue;
            }
            if(removeLayer(archive.getExtractionDir() / representation)) {
                removed.insert(representation);
                result.removedPaths.push_back(representation);
            }
            else {
                ++result.failedRemovals;
            }
        }
    }

    if(!isEntryFound) {
        log(boost::format("No manifest entry is tagged as %s: nothing to prune") % reference,
            libskiff::LogLevel::WARN);
    }
    log(boost::format("Pruned %d layers of %s (%d removals failed)")
        % result.removedPaths.size() % reference % result.failedRemovals, libskiff::LogLevel::INFO);
    return result;
}

/**
 * Pairs layer i of the manifest entry with diff id i of its config and
 * returns the layer paths whose diff id is in the given set, in manifest order.
 */
std::vector<boost::filesystem::path> DedupPruner::selectRedundantLayers(const ManifestEntry& entry,
                                                                        const ConfigDescriptor& config,
                                                                        const LayerSet& existingLayers) {
    if(entry.layerPaths.size() != config.diffIds.size()) {
        auto message = boost::format("Malformed image archive: manifest entry with config %s lists %d layers"
                                     " but its config lists %d diff ids")
            % entry.configPath % entry.layerPaths.size() % config.diffIds.size();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest, message.str());
    }

    auto redundant = std::vector<boost::filesystem::path>{};
    for(std::size_t i = 0; i < entry.layerPaths.size(); ++i) {
        if(existingLayers.count(config.diffIds[i]) == 0) {
            continue;
        }
        auto layerPath = entry.layerPaths[i].lexically_normal();
        if(!isContainedPath(layerPath)) {
            auto message = boost::format("Malformed image archive: layer path %s points outside of the archive")
                % layerPath;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::MalformedManifest, message.str());
        }
        redundant.push_back(layerPath);
    }
    return redundant;
}

/**
 * Legacy archives store each layer as "<id>/layer.tar" next to its metadata,
 * so the whole "<id>" directory represents the layer. Newer archives store
 * the layer as a single blob file.
 */
boost::filesystem::path DedupPruner::getLayerRepresentation(const boost::filesystem::path& layerPath) {
    auto normalPath = layerPath.lexically_normal();
    auto parent = normalPath.parent_path();
    if(normalPath.filename() == "layer.tar" && !parent.empty() && parent != ".") {
        return parent;
    }
    return normalPath;
}

// Failures only forfeit some size reduction, so they are reported and ignored.
bool DedupPruner::removeLayer(const boost::filesystem::path& representation) const {
    try {
        auto status = channel.stat(representation);
        bool isDirectory = status.type == channel::FileStatus::Type::Directory;
        log(boost::format("Removing %s %s") % (isDirectory ? "directory" : "file") % representation,
            libskiff::LogLevel::DEBUG);
        channel.remove(representation, isDirectory);
        return true;
    }
    catch(libskiff::Error& e) {
        log(boost::format("Failed to remove redundant layer %s: %s") % representation % e.what(),
            libskiff::LogLevel::WARN);
        return false;
    }
}

void DedupPruner::log(const boost::format& message, libskiff::LogLevel level,
                      std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
