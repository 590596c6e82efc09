/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_transport_LayerInventory_hpp
#define skiff_transport_LayerInventory_hpp

#include <set>
#include <string>
#include <iostream>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libskiff/LogLevel.hpp"
#include "common/ImageReference.hpp"
#include "channel/ExecutionChannel.hpp"


namespace skiff {
namespace transport {

using LayerSet = std::set<std::string>;

/**
 * Outcome of one inventory strategy. Only "Found" carries layer ids;
 * the other kinds tell the caller why the strategy could not answer.
 */
struct ProbeResult {
    enum class Kind { Found, NotFound, DriverUnsupported, QueryFailed };

    Kind kind;
    LayerSet layerIds;
    std::string detail;

    static ProbeResult found(LayerSet layerIds);
    static ProbeResult notFound(const std::string& detail);
    static ProbeResult driverUnsupported(const std::string& detail);
    static ProbeResult queryFailed(const std::string& detail);
};

std::string probeKindToString(ProbeResult::Kind);

/**
 * Determines which layer contents (diff ids) a host's container runtime
 * already holds.
 *
 * The primary strategy reads the overlay2 layer database of the runtime's
 * storage root, which lists every layer on the host. The fallback inspects
 * the image with the target reference, if the host has one.
 */
class LayerInventory {
public:
    LayerInventory(channel::ExecutionChannel& channel, const std::string& dockerPath);

    // Returns none when neither strategy yields an inventory ("no inventory").
    // Throws with code InventoryUnavailable on unexpected query failures.
    boost::optional<LayerSet> collect(const common::ImageReference& target) const;

    ProbeResult probeStorage() const;
    ProbeResult probeImage(const common::ImageReference& target) const;

    // these methods are public for test purpose
    static ProbeResult parseRuntimeInfo(const std::string& json, boost::filesystem::path& storageRoot);
    static LayerSet parseLayerList(const std::string& json);

    static const std::string SUPPORTED_STORAGE_DRIVER;

private:
    ProbeResult scanLayerDatabase(const boost::filesystem::path& storageRoot) const;
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    channel::ExecutionChannel& channel;
    std::string dockerPath;
    const std::string sysname = "LayerInventory";
};

}
}

#endif
