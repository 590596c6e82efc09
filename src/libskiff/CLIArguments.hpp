/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_CLIArguments_hpp
#define libskiff_CLIArguments_hpp

#include <initializer_list>
#include <string>
#include <vector>

namespace libskiff {

/**
 * The argument vector of a program to be executed. The strings are owned by
 * the object, argv() exposes them as the null-terminated array that execvp
 * and boost::program_options expect.
 */
class CLIArguments {
public:
    CLIArguments() = default;
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);

    CLIArguments& operator+=(const CLIArguments& rhs);

    int argc() const;
    char** argv() const;
    std::string string() const;

private:
    std::vector<std::string> args;
    mutable std::vector<char*> pointers;
};

}

#endif
