/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ExecutionChannel.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/logging.hpp"


namespace skiff {
namespace channel {

std::string readFile(ExecutionChannel& channel, const boost::filesystem::path& path) {
    auto content = std::string{};
    try {
        auto source = channel.openRead(path);
        char buffer[64 * 1024];
        size_t count;
        while((count = source->read(buffer, sizeof(buffer))) > 0) {
            content.append(buffer, count);
        }
        source->close();
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to read %s on %s") % path % channel.describe();
        SKIFF_RETHROW_ERROR(e, message.str());
    }
    return content;
}

void writeFile(ExecutionChannel& channel, const boost::filesystem::path& path, const std::string& content) {
    libskiff::logMessage(boost::format("Writing %d bytes to %s on %s") % content.size() % path % channel.describe(),
                         libskiff::LogLevel::DEBUG);
    try {
        auto sink = channel.openWrite(path);
        sink->write(content.data(), content.size());
        sink->close();
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to write %s on %s") % path % channel.describe();
        SKIFF_RETHROW_ERROR(e, message.str());
    }
}

void echoCommandOutput(const CommandOutput& output, const OutputEcho& echo) {
    if(echo.echoStdout && !output.stdoutBytes.empty()) {
        libskiff::logMessage(output.stdoutBytes, libskiff::LogLevel::GENERAL, std::cerr);
    }
    if(echo.echoStderr && !output.stderrBytes.empty()) {
        libskiff::logMessage(output.stderrBytes, libskiff::LogLevel::GENERAL, std::cerr);
    }
}

}
}
