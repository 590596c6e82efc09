/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_process_hpp
#define libskiff_utility_process_hpp

#include <functional>
#include <string>

#include <sys/types.h>

#include <boost/optional.hpp>

#include "libskiff/CLIArguments.hpp"

/**
 * Utility functions for process operations
 */

namespace libskiff {
namespace process {

struct CommandResult {
    int status;
    std::string stdoutBytes;
    std::string stderrBytes;
};

/**
 * Forks and executes the given program, capturing its stdout and stderr
 * separately and in full. Output is treated as raw bytes.
 * Returns the exit status; throws only if the program could not be run
 * or terminated abnormally.
 */
CommandResult forkExecCapture(const libskiff::CLIArguments& args,
                              const boost::optional<std::function<void()>>& preExecChildActions = {});

/**
 * A child process with one of its standard streams connected to the caller
 * through a pipe, for streaming data in or out of a program without
 * buffering the whole payload. The child's stderr is always captured.
 * The destructor terminates and reaps the child if wait() was not called.
 */
class Subprocess {
public:
    enum class Mode { ReadStdout, WriteStdin };

public:
    Subprocess(const libskiff::CLIArguments& args,
               Mode mode,
               const boost::optional<std::function<void()>>& preExecChildActions = {});
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    ~Subprocess();

    size_t read(char* buffer, size_t size);
    void write(const char* buffer, size_t size);
    int wait();
    boost::optional<int> tryWait();
    const std::string& getStderr() const { return stderrBytes; }
    const libskiff::CLIArguments& getArgs() const { return args; }

private:
    void drainStderr(bool block);
    void closeDataPipe();

private:
    libskiff::CLIArguments args;
    Mode mode;
    pid_t pid = -1;
    int dataFd = -1;
    int stderrFd = -1;
    std::string stderrBytes;
    boost::optional<int> exitStatus;
};

std::string getHostname();
std::string getUsername();

}}

#endif
