/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "transport/TransferEngine.hpp"

#include <vector>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"


namespace skiff {
namespace transport {

namespace {

double toMiB(double bytes) {
    return bytes / (1024.0 * 1024.0);
}

}

TransferEngine::TransferEngine(channel::ExecutionChannel& source,
                               channel::ExecutionChannel& destination,
                               std::size_t chunkSize)
    : source{source}
    , destination{destination}
    , chunkSize{chunkSize}
{
    if(chunkSize == 0) {
        SKIFF_THROW_ERROR("Invalid transfer chunk size: must be greater than 0");
    }
}

TransferReport TransferEngine::transfer(const boost::filesystem::path& sourcePath,
                                        const boost::filesystem::path& destinationPath) const {
    auto report = TransferReport{};
    report.totalSize = source.stat(sourcePath).size;

    log(boost::format("Transferring %s (%d bytes) from %s to %s on %s in chunks of %d bytes")
        % sourcePath % report.totalSize % source.describe() % destinationPath % destination.describe() % chunkSize,
        libskiff::LogLevel::INFO);

    auto reader = source.openRead(sourcePath);
    auto writer = destination.openWrite(destinationPath);
    auto buffer = std::vector<char>(chunkSize);
    bool isProgressLogged = libskiff::Logger::getInstance().getLevel() <= libskiff::LogLevel::DEBUG;

    auto start = std::chrono::steady_clock::now();
    std::size_t count;
    while((count = reader->read(buffer.data(), buffer.size())) > 0) {
        writer->write(buffer.data(), count);
        report.transferredBytes += count;

        report.elapsed = std::chrono::steady_clock::now() - start;
        if(report.elapsed.count() > 0) {
            report.throughput = report.transferredBytes / report.elapsed.count();
        }
        if(isProgressLogged) {
            log(boost::format("transferred %d/%d bytes (%.2f MiB/s)")
                % report.transferredBytes % report.totalSize % toMiB(report.throughput),
                libskiff::LogLevel::DEBUG);
        }
    }
    reader->close();
    writer->close();

    report.elapsed = std::chrono::steady_clock::now() - start;
    if(report.elapsed.count() > 0) {
        report.throughput = report.transferredBytes / report.elapsed.count();
    }
    report.sizeMatches = report.transferredBytes == report.totalSize;

    if(report.sizeMatches) {
        log(boost::format("Transferred %d bytes in %.3f s (%.2f MiB/s)")
            % report.transferredBytes % report.elapsed.count() % toMiB(report.throughput),
            libskiff::LogLevel::INFO);
    }
    else {
        log(boost::format("Transfer size mismatch: transferred %d bytes, expected %d bytes")
            % report.transferredBytes % report.totalSize,
            libskiff::LogLevel::WARN);
    }
    return report;
}

void TransferEngine::log(const boost::format& message, libskiff::LogLevel level,
                         std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message.str(), sysname, level, outStream, errStream);
}

}
}
