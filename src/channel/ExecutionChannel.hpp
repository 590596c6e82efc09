/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_channel_ExecutionChannel_hpp
#define skiff_channel_ExecutionChannel_hpp

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>


namespace skiff {
namespace channel {

/**
 * Raw output of a command. Both streams are undecoded bytes: the payload
 * may be a binary archive stream rather than text.
 */
struct CommandOutput {
    std::string stdoutBytes;
    std::string stderrBytes;
};

/**
 * Which streams of a command are echoed to the log for observability.
 */
struct OutputEcho {
    bool echoStdout = false;
    bool echoStderr = false;
};

struct FileStatus {
    enum class Type { RegularFile, Directory, Other };
    std::uintmax_t size;
    Type type;
};

class ByteSource {
public:
    virtual ~ByteSource() {}
    // Returns 0 once the end of the data is reached
    virtual size_t read(char* buffer, size_t size) = 0;
    virtual void close() = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() {}
    virtual void write(const char* buffer, size_t size) = 0;
    // Flushes and checks that all data reached its destination
    virtual void close() = 0;
};

/**
 * The capability set used to drive one host, local or remote.
 *
 * All operations block until completion. Command failures (non-zero exit
 * status) are reported as libskiff::Error with code ExecutionFailure;
 * filesystem failures (missing path, permission) with code IOFailure.
 */
class ExecutionChannel {
public:
    virtual ~ExecutionChannel() {}
    virtual CommandOutput run(const std::string& command, const OutputEcho& echo = OutputEcho{}) = 0;
    virtual FileStatus stat(const boost::filesystem::path& path) = 0;
    virtual std::unique_ptr<ByteSource> openRead(const boost::filesystem::path& path) = 0;
    virtual std::unique_ptr<ByteSink> openWrite(const boost::filesystem::path& path) = 0;
    virtual std::vector<std::string> listDirectory(const boost::filesystem::path& path) = 0;
    virtual void remove(const boost::filesystem::path& path, bool recursive) = 0;
    virtual std::string describe() const = 0;
};

std::string readFile(ExecutionChannel& channel, const boost::filesystem::path& path);
void writeFile(ExecutionChannel& channel, const boost::filesystem::path& path, const std::string& content);
void echoCommandOutput(const CommandOutput& output, const OutputEcho& echo);

}
}

#endif
