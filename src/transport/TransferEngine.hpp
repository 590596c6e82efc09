/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_transport_TransferEngine_hpp
#define skiff_transport_TransferEngine_hpp

#include <chrono>
#include <cstdint>
#include <iostream>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libskiff/LogLevel.hpp"
#include "channel/ExecutionChannel.hpp"


namespace skiff {
namespace transport {

struct TransferReport {
    std::uintmax_t totalSize = 0;
    std::uintmax_t transferredBytes = 0;
    std::chrono::duration<double> elapsed{0};
    double throughput = 0; // bytes per second
    bool sizeMatches = false;
};

/**
 * Copies a file from one host to another in fixed-size chunks. At most one
 * chunk is held in memory. A final byte count that differs from the source
 * size is reported as a warning, the transfer is not retried.
 */
class TransferEngine {
public:
    TransferEngine(channel::ExecutionChannel& source, channel::ExecutionChannel& destination, std::size_t chunkSize);

    TransferReport transfer(const boost::filesystem::path& sourcePath,
                            const boost::filesystem::path& destinationPath) const;

private:
    void log(const boost::format& message, libskiff::LogLevel level,
             std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    channel::ExecutionChannel& source;
    channel::ExecutionChannel& destination;
    std::size_t chunkSize;
    const std::string sysname = "TransferEngine";
};

}
}

#endif
