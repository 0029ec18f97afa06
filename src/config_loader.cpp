// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace checkhttp {

namespace {

/**
 * @brief Open and parse a JSON file.
 * @param what Description used in error messages ("check definition", "schema")
 */
rapidjson::Document parse_json_file(const std::filesystem::path& path, const std::string& what) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open " + what + " file: " + path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document doc;
    doc.ParseStream(isw);

    if (doc.HasParseError()) {
        throw std::runtime_error("Failed to parse " + what + " JSON: " + path.string() +
                                 " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return doc;
}

/**
 * @brief Validate JSON document against schema.
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const rapidjson::SchemaDocument& schema,
                             const std::filesystem::path& config_path) {
    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        throw std::runtime_error("Check definition validation failed for " +
                                 config_path.string() + " at: " + sb.GetString() +
                                 ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

} // namespace

CheckConfig load_check_definition(const std::filesystem::path& config_path,
                                  const std::filesystem::path& schema_path) {
    rapidjson::Document config_doc = parse_json_file(config_path, "check definition");
    rapidjson::Document schema_doc = parse_json_file(schema_path, "schema");

    rapidjson::SchemaDocument schema(schema_doc);
    validate_against_schema(config_doc, schema, config_path);

    // Types are guaranteed by the schema
    using rapidjson::GetValueByPointer;
    using rapidjson::GetValueByPointerWithDefault;

    CheckConfig config;

    config.url = GetValueByPointerWithDefault(config_doc, json::URL, "").GetString();
    config.timeout_seconds =
        GetValueByPointerWithDefault(config_doc, json::TIMEOUT, DEFAULT_TIMEOUT_SECONDS).GetInt();
    config.redirect_ok =
        GetValueByPointerWithDefault(config_doc, json::REDIRECT_OK, false).GetBool();

    if (auto* code = GetValueByPointer(config_doc, json::RESPONSE_CODE)) {
        config.expected_status = code->GetInt();
    }

    config.required_pattern = GetValueByPointerWithDefault(config_doc, json::QUERY, "").GetString();
    config.forbidden_pattern =
        GetValueByPointerWithDefault(config_doc, json::NEGQUERY, "").GetString();

    return config;
}

} // namespace checkhttp
