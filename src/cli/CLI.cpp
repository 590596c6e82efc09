/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <iostream>
#include <string>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "endpoint/EndpointResolver.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandVersion.hpp"
#include "cli/CommandTransport.hpp"


namespace skiff {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help,h", "Print help")
        ("version", "Print version information and quit")
        ("workdir", boost::program_options::value<std::string>(),
            "Working directory on both hosts (default: a random directory under /tmp/.skiff)")
        ("source-docker-path", boost::program_options::value<std::string>(),
            "Container runtime binary on the source host (default: docker)")
        ("target-docker-path", boost::program_options::value<std::string>(),
            "Container runtime binary on the destination host (default: docker)")
        ("no-cleanup", "Keep the working directories after the transport")
        ("pre-hook", boost::program_options::value<std::string>(),
            "Shell command executed on the destination host before the transport")
        ("post-hook", boost::program_options::value<std::string>(),
            "Shell command executed on the destination host after the transport")
        ("chunk-size", boost::program_options::value<long long>(),
            "Transfer chunk size in KiB (default: 64)")
        ("no-compress", "Do not compress the archive shipped to the destination")
        ("config", boost::program_options::value<std::string>(),
            "JSON configuration file providing default settings")
        ("loglevel", boost::program_options::value<std::string>()->default_value("info"),
            "Verbosity: debug, info, warn or error");
    hiddenOptionsDescription.add_options()
        ("source_image", boost::program_options::value<std::string>())
        ("target_image", boost::program_options::value<std::string>());
    allOptionsDescription.add(optionsDescription).add(hiddenOptionsDescription);
    positionalOptionsDescription.add("source_image", 1).add("target_image", 1);
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libskiff::CLIArguments& args,
                                                    std::shared_ptr<common::Config> conf) const {
    boost::program_options::variables_map values;

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(args.argc(), args.argv())
                .options(allOptionsDescription)
                .positional(positionalOptionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values); // throw if options are invalid
    }
    catch (const std::exception& e) {
        throwUsageError(e.what());
    }

    // configure logger
    try {
        libskiff::Logger::getInstance().setLevel(libskiff::parseLogLevel(values["loglevel"].as<std::string>()));
    }
    catch(const libskiff::Error& e) {
        throwUsageError(e.what());
    }

    // --help option
    if(values.count("help")) {
        // --help overrides other arguments and options
        return std::unique_ptr<cli::Command>{new CommandHelp{optionsDescription}};
    }

    // --version option
    if(values.count("version")) {
        // --version overrides other arguments and options
        return std::unique_ptr<cli::Command>{new CommandVersion{std::move(conf)}};
    }

    if(!values.count("source_image") || !values.count("target_image")) {
        throwUsageError("Expected two arguments: SOURCE_IMAGE TARGET_IMAGE");
    }

    if(values.count("config")) {
        conf->loadFile(values["config"].as<std::string>(), conf->getSchemaFile());
    }
    applyOptions(values, *conf);
    validateAddresses(*conf);

    return std::unique_ptr<cli::Command>{new CommandTransport{std::move(conf)}};
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

void CLI::applyOptions(const boost::program_options::variables_map& values, common::Config& conf) const {
    conf.endpoints.sourceAddress = values["source_image"].as<std::string>();
    conf.endpoints.targetAddress = values["target_image"].as<std::string>();

    if(values.count("workdir")) {
        conf.directories.workdir = boost::filesystem::path{values["workdir"].as<std::string>()};
    }
    if(values.count("source-docker-path")) {
        conf.runtime.sourceDockerPath = values["source-docker-path"].as<std::string>();
    }
    if(values.count("target-docker-path")) {
        conf.runtime.targetDockerPath = values["target-docker-path"].as<std::string>();
    }
    if(values.count("no-cleanup")) {
        conf.cleanup = false;
    }
    if(values.count("pre-hook")) {
        conf.hooks.preHook = values["pre-hook"].as<std::string>();
    }
    if(values.count("post-hook")) {
        conf.hooks.postHook = values["post-hook"].as<std::string>();
    }
    if(values.count("chunk-size")) {
        auto chunkSizeKiB = values["chunk-size"].as<long long>();
        if(chunkSizeKiB <= 0) {
            auto message = boost::format("Invalid chunk size %d: must be greater than 0") % chunkSizeKiB;
            throwUsageError(message.str());
        }
        conf.chunkSize = static_cast<std::size_t>(chunkSizeKiB) * 1024;
    }
    if(values.count("no-compress")) {
        conf.compressArchive = false;
    }
}

void CLI::validateAddresses(const common::Config& conf) const {
    auto source = endpoint::ParsedAddress{};
    auto target = endpoint::ParsedAddress{};
    try {
        source = endpoint::parseAddress(conf.endpoints.sourceAddress, "");
        target = endpoint::parseAddress(conf.endpoints.targetAddress, "");
    }
    catch(libskiff::Error& e) {
        libskiff::Logger::getInstance().log(boost::format("%s\nSee 'skiff --help'") % e.what(),
                                            "CLI", libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_RETHROW_ERROR(e, "Failed to parse image addresses", libskiff::LogLevel::INFO);
    }

    if(!source.connection && !target.connection) {
        throwUsageError("At least one of the two images must be on a remote host");
    }
}

void CLI::throwUsageError(const std::string& error) const {
    auto message = boost::format("%s\nSee 'skiff --help'") % error;
    libskiff::Logger::getInstance().log(message, "CLI", libskiff::LogLevel::GENERAL, std::cerr);
    SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
}

} // namespace
} // namespace
