/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_transport_ImageArchive_hpp
#define skiff_transport_ImageArchive_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "common/ImageReference.hpp"
#include "channel/ExecutionChannel.hpp"


namespace skiff {
namespace transport {

/**
 * One record of the "manifest.json" at the top of an extracted "docker save"
 * archive. Paths are relative to the extraction directory.
 */
struct ManifestEntry {
    std::vector<std::string> repoTags;
    std::vector<boost::filesystem::path> layerPaths;
    boost::filesystem::path configPath;

    bool isTaggedAs(const common::ImageReference& reference) const;
};

/**
 * The part of an image config needed to pair layers with their content:
 * "rootfs.diff_ids", in the same order as the manifest's layer list.
 */
struct ConfigDescriptor {
    std::vector<std::string> diffIds;
};

/**
 * Read-only view of an extracted image archive, accessed through the channel
 * of the host where it was extracted.
 */
class ImageArchive {
public:
    ImageArchive(channel::ExecutionChannel& channel, const boost::filesystem::path& extractionDir);

    std::vector<ManifestEntry> readManifest() const;
    ConfigDescriptor readConfigDescriptor(const ManifestEntry& entry) const;
    const boost::filesystem::path& getExtractionDir() const { return extractionDir; }

    // these methods are public for test purpose
    static std::vector<ManifestEntry> parseManifest(const std::string& json);
    static ConfigDescriptor parseConfigDescriptor(const std::string& json);

private:
    channel::ExecutionChannel& channel;
    boost::filesystem::path extractionDir;
};

}
}

#endif
