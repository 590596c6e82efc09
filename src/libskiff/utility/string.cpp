/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <iostream>

#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/logging.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libskiff {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        SKIFF_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

std::string generateRandom(size_t size) {
    std::mt19937 generator;
    generator.seed(std::random_device()());
    return generateRandom(size, generator);
}

/**
 * Draws alphanumeric characters ([0-9a-zA-Z]) from the given generator.
 * The output is fully determined by the generator's state, which makes
 * names derived from a seeded generator reproducible.
 */
std::string generateRandom(size_t size, std::mt19937& generator) {
    static const auto charset = std::string{"0123456789"
                                            "abcdefghijklmnopqrstuvwxyz"
                                            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"};
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, charset.size()-1);

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        string[i] = charset[dist(generator)];
    }

    return string;
}

/**
 * Converts a string representing a list of key-value pairs to a map.
 *
 * If no separators are passed as arguments, the pairs are assumed to be separated by commas,
 * while keys and values are assumed to be separated by an = sign.
 * If a value is not specified (i.e. a character sequence between two pair separators does
 * not feature a key-value separator), the map entry is created with the value as an
 * empty string.
 */
std::unordered_map<std::string, std::string> parseMap(const std::string& input,
                                                      const char pairSeparators,
                                                      const char keyValueSeparators) {
    if(input.empty()) {
        return std::unordered_map<std::string, std::string>{};
    }

    auto map = std::unordered_map<std::string, std::string>{};

    auto pairs = std::vector<std::string>{};
    boost::split(pairs, input, boost::is_any_of(std::string{pairSeparators}));

    for(const auto& pair : pairs) {
        std::string key, value;
        try {
            std::tie(key, value) = string::parseKeyValuePair(pair, keyValueSeparators);
        }
        catch(std::exception& e) {
            auto message = boost::format("Error parsing '%s'. %s") % input % e.what();
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }

        // do not allow repeated separators in the value
        auto valueEnd = std::find(value.cbegin(), value.cend(), keyValueSeparators);
        if(valueEnd != value.cend()) {
            auto message = boost::format("Error parsing '%s'. Invalid key-value pair '%s': repeated use of separator is not allowed.")
                % input % pair;
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO)
        }

        // check for duplicated key
        if(map.find(key) != map.cend()) {
            auto message = boost::format("Error parsing '%s'. Found duplicated key '%s': expected a list of unique key-value pairs.")
                % input % key;
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO)
        }

        map[key] = value;
    }

    return map;
}

/**
 * Quotes a string so that a POSIX shell reads it back as one literal word.
 * The string is wrapped in single quotes; embedded single quotes are emitted as '\''.
 */
std::string shellQuote(const std::string& s) {
    auto quoted = std::string{"'"};
    for(auto c : s) {
        if(c == '\'') {
            quoted += "'\\''";
        }
        else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> splitNullSeparated(const std::string& input) {
    auto tokens = std::vector<std::string>{};
    auto begin = std::string::size_type{0};
    while(begin < input.size()) {
        auto end = input.find('\0', begin);
        if(end == std::string::npos) {
            end = input.size();
        }
        if(end > begin) {
            tokens.push_back(input.substr(begin, end - begin));
        }
        begin = end + 1;
    }
    return tokens;
}

std::string trimWhitespace(const std::string& s) {
    return boost::algorithm::trim_copy(s);
}

}}
