/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <pwd.h>
#include <unistd.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/logging.hpp"

/**
 * Utility functions for process operations
 */

namespace libskiff {
namespace process {

static void createPipe(int fds[2], const libskiff::CLIArguments& args) {
    // close-on-exec, so that pipes of one child never leak into a sibling
    if(pipe2(fds, O_CLOEXEC) == -1) {
        auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
            % args.string() % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }
}

static void closeIfOpen(int& fd) {
    if(fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * Runs in the forked child: wires the standard streams and replaces the
 * process image. Never returns.
 */
[[noreturn]] static void execChild(const libskiff::CLIArguments& args,
                                   int stdinFd, int stdoutFd, int stderrFd,
                                   const boost::optional<std::function<void()>>& preExecChildActions) {
    auto devNull = open("/dev/null", O_RDWR);
    if(devNull == -1) {
        _exit(127);
    }
    dup2(stdinFd >= 0 ? stdinFd : devNull, STDIN_FILENO);
    dup2(stdoutFd >= 0 ? stdoutFd : devNull, STDOUT_FILENO);
    dup2(stderrFd >= 0 ? stderrFd : devNull, STDERR_FILENO);

    try {
        if(preExecChildActions) {
            (*preExecChildActions)();
        }
    }
    catch(const std::exception& e) {
        std::cerr << "Failed to prepare subprocess " << args.string() << ": " << e.what() << std::endl;
        _exit(127);
    }

    auto argv = args.argv();
    execvp(argv[0], argv);
    std::cerr << "Failed to execvp subprocess " << args.string() << ": " << strerror(errno) << std::endl;
    _exit(127);
}

static int waitForChild(pid_t pid, const libskiff::CLIArguments& args) {
    int status;
    do {
        if(waitpid(pid, &status, 0) == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to waitpid subprocess %s: %s")
                % args.string() % strerror(errno);
            SKIFF_THROW_ERROR(message.str());
        }
    } while(!WIFEXITED(status) && !WIFSIGNALED(status));

    if(!WIFEXITED(status)) {
        auto message = boost::format("Subprocess %s terminated abnormally (signal %d)")
            % args.string() % WTERMSIG(status);
        SKIFF_THROW_ERROR(message.str());
    }

    logMessage( boost::format("%s (pid %d) exited with status %d") % args.string() % pid % WEXITSTATUS(status),
                libskiff::LogLevel::DEBUG);

    return WEXITSTATUS(status);
}

CommandResult forkExecCapture(const libskiff::CLIArguments& args,
                              const boost::optional<std::function<void()>>& preExecChildActions) {
    logMessage(boost::format("Forking and executing %s") % args.string(), libskiff::LogLevel::DEBUG);

    int stdoutPipe[2];
    int stderrPipe[2];
    createPipe(stdoutPipe, args);
    try {
        createPipe(stderrPipe, args);
    }
    catch(libskiff::Error& e) {
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        SKIFF_RETHROW_ERROR(e, "Failed to set up output capture");
    }

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args.string() % strerror(errno);
        close(stdoutPipe[0]); close(stdoutPipe[1]);
        close(stderrPipe[0]); close(stderrPipe[1]);
        SKIFF_THROW_ERROR(message.str());
    }

    if(pid == 0) {
        execChild(args, -1, stdoutPipe[1], stderrPipe[1], preExecChildActions);
    }

    close(stdoutPipe[1]);
    close(stderrPipe[1]);

    auto result = CommandResult{};
    pollfd fds[2] = { {stdoutPipe[0], POLLIN, 0}, {stderrPipe[0], POLLIN, 0} };
    std::string* sinks[2] = { &result.stdoutBytes, &result.stderrBytes };
    int openStreams = 2;
    char buffer[64 * 1024];

    while(openStreams > 0) {
        if(poll(fds, 2, -1) == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to poll output of subprocess %s: %s") % args.string() % strerror(errno);
            closeIfOpen(fds[0].fd);
            closeIfOpen(fds[1].fd);
            waitForChild(pid, args);
            SKIFF_THROW_ERROR(message.str());
        }
        for(int i=0; i<2; ++i) {
            if(fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            auto count = ::read(fds[i].fd, buffer, sizeof(buffer));
            if(count > 0) {
                sinks[i]->append(buffer, count);
            }
            else if(count == 0 || errno != EINTR) {
                closeIfOpen(fds[i].fd);
                --openStreams;
            }
        }
    }

    result.status = waitForChild(pid, args);
    return result;
}

Subprocess::Subprocess(const libskiff::CLIArguments& args,
                       Mode mode,
                       const boost::optional<std::function<void()>>& preExecChildActions)
    : args{args}
    , mode{mode}
{
    logMessage(boost::format("Spawning streaming subprocess %s") % args.string(), libskiff::LogLevel::DEBUG);

    int dataPipe[2];
    int stderrPipe[2];
    createPipe(dataPipe, args);
    try {
        createPipe(stderrPipe, args);
    }
    catch(libskiff::Error& e) {
        close(dataPipe[0]);
        close(dataPipe[1]);
        SKIFF_RETHROW_ERROR(e, "Failed to set up streaming subprocess");
    }

    pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args.string() % strerror(errno);
        close(dataPipe[0]); close(dataPipe[1]);
        close(stderrPipe[0]); close(stderrPipe[1]);
        SKIFF_THROW_ERROR(message.str());
    }

    if(pid == 0) {
        if(mode == Mode::ReadStdout) {
            execChild(args, -1, dataPipe[1], stderrPipe[1], preExecChildActions);
        }
        else {
            execChild(args, dataPipe[0], -1, stderrPipe[1], preExecChildActions);
        }
    }

    if(mode == Mode::ReadStdout) {
        dataFd = dataPipe[0];
        close(dataPipe[1]);
    }
    else {
        dataFd = dataPipe[1];
        close(dataPipe[0]);
    }
    stderrFd = stderrPipe[0];
    close(stderrPipe[1]);

    fcntl(stderrFd, F_SETFL, fcntl(stderrFd, F_GETFL) | O_NONBLOCK);
}

Subprocess::~Subprocess() {
    closeDataPipe();
    closeIfOpen(stderrFd);
    if(pid > 0 && !exitStatus) {
        kill(pid, SIGTERM);
        int status;
        while(waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }
}

size_t Subprocess::read(char* buffer, size_t size) {
    if(mode != Mode::ReadStdout || dataFd < 0) {
        auto message = boost::format("Subprocess %s is not open for reading") % args.string();
        SKIFF_THROW_ERROR(message.str());
    }

    while(true) {
        pollfd fds[2] = { {dataFd, POLLIN, 0}, {stderrFd, POLLIN, 0} };
        if(poll(fds, 2, -1) == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to poll stdout of subprocess %s: %s") % args.string() % strerror(errno);
            SKIFF_THROW_ERROR(message.str());
        }
        if(fds[1].revents) {
            drainStderr(false);
        }
        if(fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            auto count = ::read(dataFd, buffer, size);
            if(count >= 0) {
                return static_cast<size_t>(count);
            }
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to read stdout of subprocess %s: %s") % args.string() % strerror(errno);
            SKIFF_THROW_ERROR(message.str());
        }
    }
}

void Subprocess::write(const char* buffer, size_t size) {
    if(mode != Mode::WriteStdin || dataFd < 0) {
        auto message = boost::format("Subprocess %s is not open for writing") % args.string();
        SKIFF_THROW_ERROR(message.str());
    }

    size_t written = 0;
    while(written < size) {
        pollfd fds[2] = { {dataFd, POLLOUT, 0}, {stderrFd, POLLIN, 0} };
        if(poll(fds, 2, -1) == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to poll stdin of subprocess %s: %s") % args.string() % strerror(errno);
            SKIFF_THROW_ERROR(message.str());
        }
        if(fds[1].revents) {
            drainStderr(false);
        }
        if(fds[0].revents & POLLERR) {
            auto message = boost::format("Failed to write to stdin of subprocess %s: the subprocess closed its input. Stderr:\n%s")
                % args.string() % stderrBytes;
            SKIFF_THROW_ERROR(message.str());
        }
        if(fds[0].revents & POLLOUT) {
            auto count = ::write(dataFd, buffer + written, size - written);
            if(count < 0) {
                if(errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                auto message = boost::format("Failed to write to stdin of subprocess %s: %s. Stderr:\n%s")
                    % args.string() % strerror(errno) % stderrBytes;
                SKIFF_THROW_ERROR(message.str());
            }
            written += static_cast<size_t>(count);
        }
    }
}

int Subprocess::wait() {
    if(exitStatus) {
        return *exitStatus;
    }
    closeDataPipe();
    drainStderr(true);
    closeIfOpen(stderrFd);
    exitStatus = waitForChild(pid, args);
    return *exitStatus;
}

/**
 * Non-blocking check for termination. Returns the exit status once the
 * child has exited, none while it is still running.
 */
boost::optional<int> Subprocess::tryWait() {
    if(exitStatus) {
        return exitStatus;
    }

    drainStderr(false);

    int status;
    auto result = waitpid(pid, &status, WNOHANG);
    if(result == 0) {
        return boost::none;
    }
    if(result == -1) {
        if(errno == EINTR) {
            return boost::none;
        }
        auto message = boost::format("Failed to waitpid subprocess %s: %s") % args.string() % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }

    closeDataPipe();
    drainStderr(true);
    closeIfOpen(stderrFd);
    if(WIFEXITED(status)) {
        exitStatus = WEXITSTATUS(status);
    }
    else {
        exitStatus = 128 + WTERMSIG(status);
    }
    return exitStatus;
}

void Subprocess::drainStderr(bool block) {
    if(stderrFd < 0) {
        return;
    }
    char buffer[4096];
    while(true) {
        auto count = ::read(stderrFd, buffer, sizeof(buffer));
        if(count > 0) {
            stderrBytes.append(buffer, count);
            continue;
        }
        if(count == 0) {
            closeIfOpen(stderrFd);
            return;
        }
        if(errno == EINTR) {
            continue;
        }
        if(errno == EAGAIN || errno == EWOULDBLOCK) {
            if(!block) {
                return;
            }
            pollfd fd = {stderrFd, POLLIN, 0};
            poll(&fd, 1, -1);
            continue;
        }
        auto message = boost::format("Failed to read stderr of subprocess %s: %s") % args.string() % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }
}

void Subprocess::closeDataPipe() {
    closeIfOpen(dataFd);
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

std::string getUsername() {
    auto uid = geteuid();
    errno = 0;
    auto* entry = getpwuid(uid);
    if(entry == nullptr) {
        auto message = boost::format("failed to retrieve the user name of uid %d (%s)")
            % uid % (errno != 0 ? strerror(errno) : "no passwd entry");
        SKIFF_THROW_ERROR(message.str());
    }
    return entry->pw_name;
}

}}
