/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_string_hpp
#define libskiff_utility_string_hpp

#include <random>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

/**
 * Utility functions for string manipulation
 */

namespace libskiff {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string generateRandom(size_t size);
std::string generateRandom(size_t size, std::mt19937& generator);
std::unordered_map<std::string, std::string> parseMap(const std::string& input,
                                                      const char pairSeparators = ',',
                                                      const char keyValueSeparators = '=');
std::string shellQuote(const std::string&);
std::vector<std::string> splitNullSeparated(const std::string&);
std::string trimWhitespace(const std::string&);

}}

#endif
