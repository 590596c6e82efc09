/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_transport_Orchestrator_hpp
#define skiff_transport_Orchestrator_hpp

#include <string>
#include <vector>
#include <iostream>
#include <functional>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libskiff/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "channel/ExecutionChannel.hpp"
#include "channel/ChannelPathRAII.hpp"
#include "transport/LayerInventory.hpp"
#include "transport/DedupPruner.hpp"
#include "transport/TransferEngine.hpp"


namespace skiff {
namespace transport {

struct RunReport {
    boost::optional<LayerSet> inventory;
    boost::optional<PruneResult> pruning;
    TransferReport transfer;
};

/**
 * Runs one transport of an image from a source host to a destination host:
 *
 *   PreHook > PrepareSourceDir > Export > Extract > Inventory > [Prune] >
 *   VerifyNonEmpty > Repack > PrepareDestDir > Transfer > Import >
 *   [Cleanup] > PostHook
 *
 * The steps run strictly in sequence; the first failing step aborts the run
 * with an error naming the step. The working directories on both hosts are
 * removed when the run ends, on success as well as on failure, unless
 * cleanup is disabled in the configuration. A workdir given explicitly is
 * kept: only the files created in it are removed.
 */
class Orchestrator {
public:
    enum class Step {
        PreHook, PrepareSourceDir, Export, Extract, Inventory, Prune, VerifyNonEmpty,
        Repack, PrepareDestDir, Transfer, Import, Cleanup, PostHook
    };

public:
    Orchestrator(const common::Config& config,
                 channel::ExecutionChannel& source,
                 const common::ImageReference& sourceImage,
                 channel::ExecutionChannel& destination,
                 const common::ImageReference& targetImage);

    RunReport run();

    const boost::filesystem::path& getWorkdir() const { return workdir; }

    // these methods are public for test purpose
    static bool hasErrorMarker(const std::string& stderrBytes);
    static std::string stepToString(Step);

private:
    void runStep(Step step, const std::function<void()>& function) const;
    void runHook(const std::string& hook) const;
    void prepareDirectory(channel::ExecutionChannel& channel,
                          const boost::filesystem::path& directory,
                          const std::vector<boost::filesystem::path>& scratchPaths,
                          std::vector<channel::ChannelPathRAII>& guards) const;
    void exportImage() const;
    void extractArchive() const;
    boost::optional<LayerSet> collectInventory() const;
    void verifyNonEmpty() const;
    void repackArchive() const;
    void importArchive() const;
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    const common::Config& config;
    channel::ExecutionChannel& source;
    common::ImageReference sourceImage;
    channel::ExecutionChannel& destination;
    common::ImageReference targetImage;

    boost::filesystem::path workdir;
    boost::filesystem::path extractionDir;
    boost::filesystem::path exportedArchive;
    boost::filesystem::path repackedArchive;
    boost::filesystem::path receivedArchive;

    const std::string sysname = "Orchestrator";
};

}
}

#endif
