/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "channel/LocalChannel.hpp"

#include <fstream>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/CLIArguments.hpp"
#include "libskiff/utility/filesystem.hpp"
#include "libskiff/utility/process.hpp"


namespace skiff {
namespace channel {

namespace {

class LocalFileSource : public ByteSource {
public:
    LocalFileSource(const boost::filesystem::path& path)
        : path{path}
        , stream{path.string(), std::ios::in | std::ios::binary}
    {
        if(!stream) {
            auto message = boost::format("Failed to open %s for reading") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
    }

    size_t read(char* buffer, size_t size) override {
        stream.read(buffer, size);
        if(stream.bad()) {
            auto message = boost::format("Failed to read from %s") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
        return static_cast<size_t>(stream.gcount());
    }

    void close() override {
        stream.close();
    }

private:
    boost::filesystem::path path;
    std::ifstream stream;
};

class LocalFileSink : public ByteSink {
public:
    LocalFileSink(const boost::filesystem::path& path)
        : path{path}
        , stream{path.string(), std::ios::out | std::ios::binary | std::ios::trunc}
    {
        if(!stream) {
            auto message = boost::format("Failed to open %s for writing") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
    }

    void write(const char* buffer, size_t size) override {
        stream.write(buffer, size);
        if(!stream) {
            auto message = boost::format("Failed to write to %s") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
    }

    void close() override {
        stream.flush();
        if(!stream) {
            auto message = boost::format("Failed to flush %s") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
        stream.close();
    }

private:
    boost::filesystem::path path;
    std::ofstream stream;
};

}

CommandOutput LocalChannel::run(const std::string& command, const OutputEcho& echo) {
    log(boost::format("Executing command '%s'") % command, libskiff::LogLevel::DEBUG);

    auto args = libskiff::CLIArguments{"/bin/sh", "-c", command};
    auto result = libskiff::process::forkExecCapture(args);
    auto output = CommandOutput{std::move(result.stdoutBytes), std::move(result.stderrBytes)};
    echoCommandOutput(output, echo);

    if(result.status != 0) {
        auto message = boost::format("Failed to execute command '%s' on %s. Process terminated with status %d."
                                     " Process' stderr:\n\n%s")
            % command % describe() % result.status % output.stderrBytes;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::ExecutionFailure, message.str());
    }

    return output;
}

FileStatus LocalChannel::stat(const boost::filesystem::path& path) {
    auto ec = boost::system::error_code{};
    auto status = boost::filesystem::status(path, ec);
    if(ec || !boost::filesystem::exists(status)) {
        auto message = boost::format("Failed to stat %s: %s")
            % path % (ec ? ec.message() : std::string{"no such file or directory"});
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
    }

    if(boost::filesystem::is_directory(status)) {
        return FileStatus{0, FileStatus::Type::Directory};
    }
    if(boost::filesystem::is_regular_file(status)) {
        return FileStatus{libskiff::filesystem::getFileSize(path), FileStatus::Type::RegularFile};
    }
    return FileStatus{0, FileStatus::Type::Other};
}

std::unique_ptr<ByteSource> LocalChannel::openRead(const boost::filesystem::path& path) {
    log(boost::format("Opening %s for reading") % path, libskiff::LogLevel::DEBUG);
    return std::unique_ptr<ByteSource>{new LocalFileSource{path}};
}

std::unique_ptr<ByteSink> LocalChannel::openWrite(const boost::filesystem::path& path) {
    log(boost::format("Opening %s for writing") % path, libskiff::LogLevel::DEBUG);
    return std::unique_ptr<ByteSink>{new LocalFileSink{path}};
}

std::vector<std::string> LocalChannel::listDirectory(const boost::filesystem::path& path) {
    return libskiff::filesystem::listDirectory(path);
}

void LocalChannel::remove(const boost::filesystem::path& path, bool recursive) {
    log(boost::format("Removing %s%s") % path % (recursive ? " recursively" : ""), libskiff::LogLevel::DEBUG);

    auto ec = boost::system::error_code{};
    if(recursive) {
        boost::filesystem::remove_all(path, ec);
    }
    else {
        boost::filesystem::remove(path, ec);
    }
    if(ec) {
        auto message = boost::format("Failed to remove %s: %s") % path % ec.message();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
    }
}

std::string LocalChannel::describe() const {
    return "localhost";
}

void LocalChannel::log(const boost::format& message, libskiff::LogLevel level,
                       std::ostream& outStream, std::ostream& errStream) const {
    log(message.str(), level, outStream, errStream);
}

void LocalChannel::log(const std::string& message, libskiff::LogLevel level,
                       std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
