/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <fstream>

#include <boost/format.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

#include "libskiff/Error.hpp"

/**
 * Utility functions for JSON operations
 */

namespace libskiff {
namespace json {

namespace {

std::ifstream openFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % path;
        SKIFF_THROW_CODED_ERROR(ErrorCode::IOFailure, message.str());
    }
    return ifs;
}

std::string describeParseError(const rapidjson::Document& json) {
    auto message = boost::format("Error(offset %u): %s")
        % static_cast<unsigned>(json.GetErrorOffset())
        % rapidjson::GetParseError_En(json.GetParseError());
    return message.str();
}

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile) {
    auto ifs = openFile(schemaFile);
    rapidjson::IStreamWrapper isw(ifs);
    auto schema = rapidjson::Document{};
    schema.ParseStream(isw);
    if(schema.HasParseError()) {
        auto message = boost::format("Error parsing JSON schema %s. %s") % schemaFile % describeParseError(schema);
        SKIFF_THROW_ERROR(message.str());
    }
    return rapidjson::SchemaDocument{schema};
}

template<class Reader>
std::string describeValidationError(const Reader& reader) {
    rapidjson::StringBuffer schemaPointer;
    reader.GetInvalidSchemaPointer().StringifyUriFragment(schemaPointer);
    rapidjson::StringBuffer documentPointer;
    reader.GetInvalidDocumentPointer().StringifyUriFragment(documentPointer);
    rapidjson::StringBuffer report;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(report);
    reader.GetError().Accept(writer);

    auto message = boost::format("Invalid schema: %s\nInvalid keyword: %s\nInvalid document: %s\nError report:\n%s")
        % schemaPointer.GetString()
        % reader.GetInvalidSchemaKeyword()
        % documentPointer.GetString()
        % report.GetString();
    return message.str();
}

}

rapidjson::Document parse(const std::string& string) {
    auto json = rapidjson::Document{};
    json.Parse(string.c_str(), string.size());
    if(json.HasParseError()) {
        auto message = boost::format("Error parsing JSON string:\n'%s'\nInput data is not valid JSON\n%s")
            % string % describeParseError(json);
        SKIFF_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schema = readSchema(schemaFile);
    auto ifs = openFile(jsonFile);
    rapidjson::IStreamWrapper isw(ifs);

    using ValidatingReader = rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags,
                                                               rapidjson::IStreamWrapper,
                                                               rapidjson::UTF8<>>;
    ValidatingReader reader(isw, schema);
    auto json = rapidjson::Document{};
    json.Populate(reader);

    if(!reader.GetParseResult()) {
        // a terminated parse is either a schema violation or a syntax error
        if(!reader.IsValid()) {
            auto message = boost::format("JSON file %s does not conform to schema %s\n%s")
                % jsonFile % schemaFile % describeValidationError(reader);
            SKIFF_THROW_ERROR(message.str());
        }
        auto message = boost::format("Error parsing JSON file %s: %s (offset %u)")
            % jsonFile
            % rapidjson::GetParseError_En(reader.GetParseResult().Code())
            % static_cast<unsigned>(reader.GetParseResult().Offset());
        SKIFF_THROW_ERROR(message.str());
    }
    return json;
}

}}
