/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"

/**
 * Utility functions for filesystem investigation
 */

namespace libskiff {
namespace filesystem {

size_t getFileSize(const boost::filesystem::path& filename) {
    struct stat st;
    if(stat(filename.c_str(), &st) != 0) {
        auto message = boost::format("Failed to retrieve size of file %s. Stat failed: %s")
            % filename % strerror(errno);
        SKIFF_THROW_CODED_ERROR(ErrorCode::IOFailure, message.str());
    }
    return st.st_size;
}

std::vector<std::string> listDirectory(const boost::filesystem::path& path) {
    auto ec = boost::system::error_code{};
    auto isDirectory = boost::filesystem::is_directory(path, ec);
    if(ec) {
        auto message = boost::format("Failed to list %s: %s") % path % ec.message();
        SKIFF_THROW_CODED_ERROR(ErrorCode::IOFailure, message.str());
    }
    if(!isDirectory) {
        auto message = boost::format("Failed to list %s: path is not an existing directory.") % path;
        SKIFF_THROW_CODED_ERROR(ErrorCode::IOFailure, message.str());
    }

    auto names = std::vector<std::string>{};
    auto entry = boost::filesystem::directory_iterator{path, ec};
    for(; !ec && entry != boost::filesystem::directory_iterator{}; entry.increment(ec)) {
        names.push_back(entry->path().filename().string());
    }
    if(ec) {
        auto message = boost::format("Failed to list directory %s: %s") % path % ec.message();
        SKIFF_THROW_CODED_ERROR(ErrorCode::IOFailure, message.str());
    }
    std::sort(names.begin(), names.end());
    return names;
}

}}
