/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "channel/RemoteChannel.hpp"

#include <algorithm>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/process.hpp"
#include "libskiff/utility/string.hpp"


namespace skiff {
namespace channel {

namespace {

class RemoteFileSource : public ByteSource {
public:
    RemoteFileSource(const libskiff::CLIArguments& args, const boost::filesystem::path& path)
        : path{path}
        , process{args, libskiff::process::Subprocess::Mode::ReadStdout}
    {}

    size_t read(char* buffer, size_t size) override {
        return process.read(buffer, size);
    }

    void close() override {
        auto status = process.wait();
        if(status != 0) {
            auto message = boost::format("Failed to read remote file %s (status %d): %s")
                % path % status % process.getStderr();
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
    }

private:
    boost::filesystem::path path;
    libskiff::process::Subprocess process;
};

class RemoteFileSink : public ByteSink {
public:
    RemoteFileSink(const libskiff::CLIArguments& args, const boost::filesystem::path& path)
        : path{path}
        , process{args, libskiff::process::Subprocess::Mode::WriteStdin}
    {}

    void write(const char* buffer, size_t size) override {
        try {
            process.write(buffer, size);
        }
        catch(libskiff::Error& e) {
            auto message = boost::format("Failed to write remote file %s") % path;
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str() + ": " + e.what());
        }
    }

    void close() override {
        auto status = process.wait();
        if(status != 0) {
            auto message = boost::format("Failed to write remote file %s (status %d): %s")
                % path % status % process.getStderr();
            SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
        }
    }

private:
    boost::filesystem::path path;
    libskiff::process::Subprocess process;
};

}

RemoteChannel::RemoteChannel(std::shared_ptr<SshSession> session)
    : session{std::move(session)}
{}

CommandOutput RemoteChannel::run(const std::string& command, const OutputEcho& echo) {
    log(boost::format("Executing command '%s' on %s") % command % describe(), libskiff::LogLevel::DEBUG);

    auto result = libskiff::process::forkExecCapture(session->makeCommandArgs(command));
    auto output = CommandOutput{std::move(result.stdoutBytes), std::move(result.stderrBytes)};
    echoCommandOutput(output, echo);

    if(result.status != 0) {
        // ssh reports its own failures (e.g. a dropped connection) with status 255
        auto message = boost::format("Failed to execute command '%s' on %s. Process terminated with status %d."
                                     " Process' stderr:\n\n%s")
            % command % describe() % result.status % output.stderrBytes;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::ExecutionFailure, message.str());
    }

    return output;
}

FileStatus RemoteChannel::stat(const boost::filesystem::path& path) {
    auto command = "stat -L -c '%s %F' -- " + libskiff::string::shellQuote(path.string());
    auto output = runFileCommand(command, path);
    return parseStatOutput(output.stdoutBytes);
}

/**
 * Parses the output of "stat -c '%s %F'", e.g. "1024 regular file",
 * "0 regular empty file" or "4096 directory".
 */
FileStatus RemoteChannel::parseStatOutput(const std::string& output) {
    auto line = libskiff::string::trimWhitespace(output);
    auto separator = line.find(' ');
    if(separator == std::string::npos) {
        auto message = boost::format("Failed to parse output of remote stat: '%s'") % output;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
    }

    auto status = FileStatus{};
    try {
        status.size = boost::lexical_cast<std::uintmax_t>(line.substr(0, separator));
    }
    catch(const boost::bad_lexical_cast&) {
        auto message = boost::format("Failed to parse size in output of remote stat: '%s'") % output;
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
    }

    auto type = line.substr(separator + 1);
    if(type == "directory") {
        status.type = FileStatus::Type::Directory;
        status.size = 0;
    }
    else if(type == "regular file" || type == "regular empty file") {
        status.type = FileStatus::Type::RegularFile;
    }
    else {
        status.type = FileStatus::Type::Other;
    }
    return status;
}

std::unique_ptr<ByteSource> RemoteChannel::openRead(const boost::filesystem::path& path) {
    log(boost::format("Opening %s on %s for reading") % path % describe(), libskiff::LogLevel::DEBUG);
    auto command = "cat -- " + libskiff::string::shellQuote(path.string());
    return std::unique_ptr<ByteSource>{new RemoteFileSource{session->makeCommandArgs(command), path}};
}

std::unique_ptr<ByteSink> RemoteChannel::openWrite(const boost::filesystem::path& path) {
    log(boost::format("Opening %s on %s for writing") % path % describe(), libskiff::LogLevel::DEBUG);
    auto command = "cat > " + libskiff::string::shellQuote(path.string());
    return std::unique_ptr<ByteSink>{new RemoteFileSink{session->makeCommandArgs(command), path}};
}

std::vector<std::string> RemoteChannel::listDirectory(const boost::filesystem::path& path) {
    auto command = "find " + libskiff::string::shellQuote(path.string())
        + " -mindepth 1 -maxdepth 1 -printf '%f\\0'";
    auto output = runFileCommand(command, path);
    auto names = libskiff::string::splitNullSeparated(output.stdoutBytes);
    std::sort(names.begin(), names.end());
    return names;
}

void RemoteChannel::remove(const boost::filesystem::path& path, bool recursive) {
    log(boost::format("Removing %s on %s%s") % path % describe() % (recursive ? " recursively" : ""),
        libskiff::LogLevel::DEBUG);
    auto command = std::string{recursive ? "rm -rf -- " : "rm -f -- "} + libskiff::string::shellQuote(path.string());
    runFileCommand(command, path);
}

std::string RemoteChannel::describe() const {
    auto const& descriptor = session->getDescriptor();
    auto format = boost::format{"%s@%s:%d"} % descriptor.username % descriptor.host % descriptor.port;
    return format.str();
}

/**
 * Runs a filesystem command and reports any failure as an IOFailure on the
 * given path: at this level a failing stat/find/rm means the path is missing
 * or not accessible.
 */
CommandOutput RemoteChannel::runFileCommand(const std::string& command, const boost::filesystem::path& path) {
    try {
        return run(command);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to access %s on %s: %s") % path % describe() % e.what();
        SKIFF_THROW_CODED_ERROR(libskiff::ErrorCode::IOFailure, message.str());
    }
}

void RemoteChannel::log(const boost::format& message, libskiff::LogLevel level,
                        std::ostream& outStream, std::ostream& errStream) const {
    log(message.str(), level, outStream, errStream);
}

void RemoteChannel::log(const std::string& message, libskiff::LogLevel level,
                        std::ostream& outStream, std::ostream& errStream) const {
    libskiff::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
