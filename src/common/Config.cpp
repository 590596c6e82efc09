/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Config.hpp"

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/json.hpp"
#include "libskiff/utility/string.hpp"

#ifndef SKIFF_VERSION
#define SKIFF_VERSION "unknown"
#endif


namespace skiff {
namespace common {

const std::size_t Config::DEFAULT_CHUNK_SIZE = 64 * 1024;

Config::BuildTime::BuildTime()
    : version{SKIFF_VERSION}
{}

/**
 * Applies the settings of a JSON configuration file on top of the defaults.
 * The file is validated against the schema first, so the type checks
 * below only guard against a schema that was edited by hand.
 */
void Config::loadFile(const boost::filesystem::path& configFile,
                      const boost::filesystem::path& schemaFile) {
    libskiff::Logger::getInstance().log(boost::format("Reading configuration file %s") % configFile,
                                        "Config", libskiff::LogLevel::DEBUG);

    auto json = rapidjson::Document{};
    try {
        json = libskiff::json::readAndValidate(configFile, schemaFile);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to load configuration file %s") % configFile;
        SKIFF_RETHROW_ERROR(e, message.str());
    }

    if(json.HasMember("sourceDockerPath")) {
        runtime.sourceDockerPath = json["sourceDockerPath"].GetString();
    }
    if(json.HasMember("targetDockerPath")) {
        runtime.targetDockerPath = json["targetDockerPath"].GetString();
    }
    if(json.HasMember("workdirBase")) {
        directories.workdirBase = json["workdirBase"].GetString();
    }
    if(json.HasMember("chunkSizeKiB")) {
        chunkSize = static_cast<std::size_t>(json["chunkSizeKiB"].GetUint()) * 1024;
    }
    if(json.HasMember("connectTimeoutSeconds")) {
        transport.connectTimeout = std::chrono::seconds{json["connectTimeoutSeconds"].GetUint()};
    }
    if(json.HasMember("controlDirectory")) {
        transport.controlDirectory = json["controlDirectory"].GetString();
    }
    if(json.HasMember("sshPath")) {
        transport.sshPath = json["sshPath"].GetString();
    }
    if(json.HasMember("sshpassPath")) {
        transport.sshpassPath = json["sshpassPath"].GetString();
    }
    if(json.HasMember("compressArchive")) {
        compressArchive = json["compressArchive"].GetBool();
    }

    if(chunkSize == 0) {
        auto message = boost::format("Invalid configuration file %s: chunkSizeKiB must be greater than 0") % configFile;
        SKIFF_THROW_ERROR(message.str());
    }
}

boost::filesystem::path Config::getWorkdir() const {
    if(directories.workdir) {
        return *directories.workdir;
    }
    return makeWorkdirPath(directories.workdirBase, getRandomSeed());
}

boost::filesystem::path Config::getSchemaFile() const {
    return directories.installationPrefix / "etc/skiff.schema.json";
}

std::mt19937::result_type Config::getRandomSeed() const {
    if(!randomSeed) {
        randomSeed = std::random_device{}();
    }
    return *randomSeed;
}

void Config::setRandomSeed(std::mt19937::result_type seed) {
    randomSeed = seed;
}

/**
 * Derives a collision-resistant working directory name from a seed.
 * Same base and seed always yield the same path.
 */
boost::filesystem::path makeWorkdirPath(const boost::filesystem::path& base, std::mt19937::result_type seed) {
    const size_t sizeOfRandomName = 8;
    auto generator = std::mt19937{seed};
    return base / libskiff::string::generateRandom(sizeOfRandomName, generator);
}

}
}
