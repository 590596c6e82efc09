/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_transport_DedupPruner_hpp
#define skiff_transport_DedupPruner_hpp

#include <vector>
#include <iostream>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libskiff/LogLevel.hpp"
#include "common/ImageReference.hpp"
#include "channel/ExecutionChannel.hpp"
#include "transport/ImageArchive.hpp"
#include "transport/LayerInventory.hpp"


namespace skiff {
namespace transport {

struct PruneResult {
    std::vector<boost::filesystem::path> removedPaths;
    std::size_t failedRemovals = 0;
};

/**
 * Removes from an extracted image archive the data of the layers that the
 * destination already holds. The paths to delete are computed here from the
 * manifest and the layer set; the host only receives plain removals.
 */
class DedupPruner {
public:
    DedupPruner(channel::ExecutionChannel& channel, const boost::filesystem::path& extractionDir);

    PruneResult prune(const common::ImageReference& reference, const LayerSet& existingLayers) const;

    // these methods are public for test purpose
    static std::vector<boost::filesystem::path> selectRedundantLayers(const ManifestEntry& entry,
                                                                      const ConfigDescriptor& config,
                                                                      const LayerSet& existingLayers);
    static boost::filesystem::path getLayerRepresentation(const boost::filesystem::path& layerPath);

private:
    bool removeLayer(const boost::filesystem::path& representation) const;
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    channel::ExecutionChannel& channel;
    ImageArchive archive;
    const std::string sysname = "DedupPruner";
};

}
}

#endif
