/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_json_hpp
#define libskiff_utility_json_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

/**
 * Utility functions for JSON operations
 */

namespace libskiff {
namespace json {

rapidjson::Document parse(const std::string& string);
// parses the file and validates it against the JSON schema in schemaFile
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);

}}

#endif
