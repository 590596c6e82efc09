/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <boost/algorithm/string/join.hpp>

namespace libskiff {

CLIArguments::CLIArguments(int argc, char* argv[])
    : args(argv, argv + argc)
{}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : args(args)
{}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    args.insert(args.end(), rhs.args.cbegin(), rhs.args.cend());
    return *this;
}

int CLIArguments::argc() const {
    return static_cast<int>(args.size());
}

char** CLIArguments::argv() const {
    pointers.clear();
    for(const auto& arg : args) {
        pointers.push_back(const_cast<char*>(arg.c_str()));
    }
    pointers.push_back(nullptr);
    return pointers.data();
}

std::string CLIArguments::string() const {
    return boost::algorithm::join(args, " ");
}

}
