/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/Orchestrator.hpp"

#include <sstream>

#include <boost/algorithm/string/predicate.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/string.hpp"


namespace skiff {
namespace transport {

namespace {

std::string quote(const boost::filesystem::path& path) {
    return libskiff::string::shellQuote(path.string());
}

}

Orchestrator::Orchestrator(const common::Config& config,
                           channel::ExecutionChannel& source,
                           const common::ImageReference& sourceImage,
                           channel::ExecutionChannel& destination,
                           const common::ImageReference& targetImage)
    : config{config}
    , source{source}
    , sourceImage{sourceImage}
    , destination{destination}
    , targetImage{targetImage}
    , workdir{config.getWorkdir()}
{
    extractionDir = workdir / "image";
    exportedArchive = workdir / "image.tar";
    auto archiveExtension = std::string{config.compressArchive ? ".tar.gz" : ".tar"};
    repackedArchive = workdir / ("image.pruned" + archiveExtension);
    // distinct from the repacked archive, so that both ends may share a host and a workdir
    receivedArchive = workdir / ("image.received" + archiveExtension);
}

RunReport Orchestrator::run() {
    log(boost::format("Transporting %s from %s to %s on %s (workdir %s)")
        % sourceImage % source.describe() % targetImage % destination.describe() % workdir,
        libskiff::LogLevel::INFO);

    auto report = RunReport{};
    auto sourceGuards = std::vector<channel::ChannelPathRAII>{};
    auto destinationGuards = std::vector<channel::ChannelPathRAII>{};
    bool isWorkdirGenerated = !config.directories.workdir;
    auto sourceScratchPaths = isWorkdirGenerated
        ? std::vector<boost::filesystem::path>{workdir}
        : std::vector<boost::filesystem::path>{extractionDir, exportedArchive, repackedArchive};
    auto destinationScratchPaths = isWorkdirGenerated
        ? std::vector<boost::filesystem::path>{workdir}
        : std::vector<boost::filesystem::path>{receivedArchive};

    if(config.hooks.preHook) {
        runStep(Step::PreHook, [this]() { runHook(*config.hooks.preHook); });
    }
    runStep(Step::PrepareSourceDir, [&]() { prepareDirectory(source, extractionDir, sourceScratchPaths, sourceGuards); });
    runStep(Step::Export, [this]() { exportImage(); });
    runStep(Step::Extract, [this]() { extractArchive(); });
    runStep(Step::Inventory, [&]() { report.inventory = collectInventory(); });
    if(report.inventory) {
        runStep(Step::Prune, [&]() {
            auto pruner = DedupPruner{source, extractionDir};
            report.pruning = pruner.prune(sourceImage, *report.inventory);
        });
    }
    else {
        log(boost::format("No layer inventory: skipping pruning, the whole image will be transferred"),
            libskiff::LogLevel::INFO);
    }
    runStep(Step::VerifyNonEmpty, [this]() { verifyNonEmpty(); });
    runStep(Step::Repack, [this]() { repackArchive(); });
    runStep(Step::PrepareDestDir, [&]() { prepareDirectory(destination, workdir, destinationScratchPaths, destinationGuards); });
    runStep(Step::Transfer, [&]() {
        auto engine = TransferEngine{source, destination, config.chunkSize};
        report.transfer = engine.transfer(repackedArchive, receivedArchive);
    });
    runStep(Step::Import, [this]() { importArchive(); });

    if(config.cleanup) {
        runStep(Step::Cleanup, [&]() {
            destinationGuards.clear();
            sourceGuards.clear();
        });
    }
    else {
        log(boost::format("Keeping working directory %s on both hosts") % workdir, libskiff::LogLevel::INFO);
    }

    if(config.hooks.postHook) {
        runStep(Step::PostHook, [this]() { runHook(*config.hooks.postHook); });
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - config.programStart);
    log(boost::format("Transported %s to %s on %s: shipped %d bytes (total time %.3f s)")
        % sourceImage % targetImage % destination.describe() % report.transfer.transferredBytes % elapsed.count(),
        libskiff::LogLevel::INFO);
    return report;
}

void Orchestrator::runStep(Step step, const std::function<void()>& function) const {
    log(boost::format("> %s") % stepToString(step), libskiff::LogLevel::INFO);
    try {
        function();
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed step '%s'") % stepToString(step);
        SKIFF_RETHROW_ERROR(e, message.str());
    }
}

void Orchestrator::runHook(const std::string& hook) const {
    destination.run(hook, channel::OutputEcho{true, true});
}

void Orchestrator::prepareDirectory(channel::ExecutionChannel& channel,
                                    const boost::filesystem::path& directory,
                                    const std::vector<boost::filesystem::path>& scratchPaths,
                                    std::vector<channel::ChannelPathRAII>& guards) const {
    // guard first: a partially created workdir is removed as well
    if(config.cleanup) {
        for(const auto& path : scratchPaths) {
            guards.emplace_back(channel, path);
        }
    }
    channel.run("mkdir -p " + quote(directory));
}

void Orchestrator::exportImage() const {
    auto command = config.runtime.sourceDockerPath.string()
        + " save -o " + quote(exportedArchive)
        + " " + libskiff::string::shellQuote(sourceImage.string());

    auto output = channel::CommandOutput{};
    try {
        output = source.run(command);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to export image %s on %s: %s") % sourceImage % source.describe() % e.what();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::ExportFailure, message.str());
    }

    if(hasErrorMarker(output.stderrBytes)) {
        auto message = boost::format("Failed to export image %s on %s: %s")
            % sourceImage % source.describe() % output.stderrBytes;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::ExportFailure, message.str());
    }
}

/**
 * The runtime reports failures of "save" with lines such as
 * "Error response from daemon: ..." or "Error: No such image: ...".
 */
bool Orchestrator::hasErrorMarker(const std::string& stderrBytes) {
    std::istringstream is(stderrBytes);
    std::string line;
    while(std::getline(is, line)) {
        if(boost::istarts_with(libskiff::string::trimWhitespace(line), "error")) {
            return true;
        }
    }
    return false;
}

void Orchestrator::extractArchive() const {
    source.run("tar -x -f " + quote(exportedArchive) + " -C " + quote(extractionDir));
    // the export is no longer needed, free the space before repacking
    source.remove(exportedArchive, false);
}

boost::optional<LayerSet> Orchestrator::collectInventory() const {
    auto inventory = LayerInventory{destination, config.runtime.targetDockerPath.string()};
    try {
        return inventory.collect(targetImage);
    }
    catch(libskiff::Error& e) {
        if(e.getCode() != libskiff::ErrorCode::InventoryUnavailable) {
            throw;
        }
        log(boost::format("%s. Falling back to a full transfer") % e.what(), libskiff::LogLevel::WARN);
        return boost::none;
    }
}

void Orchestrator::verifyNonEmpty() const {
    if(source.listDirectory(extractionDir).empty()) {
        auto message = boost::format("Extraction of image %s on %s yielded no files")
            % sourceImage % source.describe();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::EmptyArchiveFailure, message.str());
    }
}

void Orchestrator::repackArchive() const {
    auto command = std::string{config.compressArchive ? "tar -c -z -f " : "tar -c -f "}
        + quote(repackedArchive) + " -C " + quote(extractionDir) + " .";
    source.run(command, channel::OutputEcho{false, true});
}

void Orchestrator::importArchive() const {
    auto dockerPath = config.runtime.targetDockerPath.string();
    destination.run(dockerPath + " load -i " + quote(receivedArchive), channel::OutputEcho{true, true});

    if(targetImage.getFamiliarName() != sourceImage.getFamiliarName()) {
        log(boost::format("Tagging %s as %s") % sourceImage % targetImage, libskiff::LogLevel::INFO);
        destination.run(dockerPath + " tag "
                        + libskiff::string::shellQuote(sourceImage.string()) + " "
                        + libskiff::string::shellQuote(targetImage.string()));
    }
}

std::string Orchestrator::stepToString(Step step) {
    switch(step) {
        case Step::PreHook: return "PreHook";
        case Step::PrepareSourceDir: return "PrepareSourceDir";
        case Step::Export: return "Export";
        case Step::Extract: return "Extract";
        case Step::Inventory: return "Inventory";
        case Step::Prune: return "Prune";
        case Step::VerifyNonEmpty: return "VerifyNonEmpty";
        case Step::Repack: return "Repack";
        case Step::PrepareDestDir: return "PrepareDestDir";
        case Step::Transfer: return "Transfer";
        case Step::Import: return "Import";
        case Step::Cleanup: return "Cleanup";
        case Step::PostHook: return "PostHook";
    }
    return "Unknown";
}

void Orchestrator::log(const boost::format& message, libskiff::LogLevel level,
                       std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
