/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_filesystem_hpp
#define libskiff_utility_filesystem_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem investigation
 */

namespace libskiff {
namespace filesystem {

size_t getFileSize(const boost::filesystem::path& filename);
std::vector<std::string> listDirectory(const boost::filesystem::path& path);

}}

#endif
