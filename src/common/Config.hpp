/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_Config_hpp
#define skiff_common_Config_hpp

#include <string>
#include <chrono>
#include <random>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>


namespace skiff {
namespace common {

/**
 * Run configuration of one transport. Built by the CLI (optionally seeded
 * from a JSON configuration file) and handed to the Orchestrator, which
 * reads nothing from global state.
 */
class Config {
    public:
        Config() = default;

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct Endpoints {
            std::string sourceAddress;
            std::string targetAddress;
        };

        struct Runtime {
            boost::filesystem::path sourceDockerPath{"docker"};
            boost::filesystem::path targetDockerPath{"docker"};
        };

        struct Transport {
            boost::filesystem::path sshPath{"ssh"};
            boost::filesystem::path sshpassPath{"sshpass"};
            boost::filesystem::path controlDirectory{"/tmp"};
            std::chrono::seconds connectTimeout{10};
        };

        struct Hooks {
            boost::optional<std::string> preHook;
            boost::optional<std::string> postHook;
        };

        struct Directories {
            boost::filesystem::path installationPrefix{"/usr/local"};
            boost::filesystem::path workdirBase{"/tmp/.skiff"};
            boost::optional<boost::filesystem::path> workdir;
        };

        void loadFile(const boost::filesystem::path& configFile,
                      const boost::filesystem::path& schemaFile);
        boost::filesystem::path getWorkdir() const;
        boost::filesystem::path getSchemaFile() const;
        std::mt19937::result_type getRandomSeed() const;
        void setRandomSeed(std::mt19937::result_type seed);

        BuildTime buildTime;
        Endpoints endpoints;
        Runtime runtime;
        Transport transport;
        Hooks hooks;
        Directories directories;

        std::size_t chunkSize = DEFAULT_CHUNK_SIZE;
        bool cleanup = true;
        bool compressArchive = true;

        std::chrono::high_resolution_clock::time_point programStart; // for time measurement

        static const std::size_t DEFAULT_CHUNK_SIZE;

    private:
        mutable boost::optional<std::mt19937::result_type> randomSeed;
};

boost::filesystem::path makeWorkdirPath(const boost::filesystem::path& base, std::mt19937::result_type seed);

}
}

#endif
