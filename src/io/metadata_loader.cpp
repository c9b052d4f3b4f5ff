/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/metadata_loader.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace bim::io {

    using core::PropertyValue;
    using core::SemanticElement;
    using core::ValueKind;

    namespace {

        std::string string_or_empty(const nlohmann::json& j, const char* key) {
            if (!j.contains(key) || !j[key].is_string())
                return {};
            return j[key].get<std::string>();
        }

        PropertyValue read_property(const nlohmann::json& j) {
            PropertyValue prop;
            prop.name = string_or_empty(j, "name");
            prop.group_name = string_or_empty(j, "propertySet");

            const std::optional<ValueKind> declared =
                j.contains("type") && j["type"].is_string()
                    ? core::value_kind_from_string(j["type"].get<std::string>())
                    : std::nullopt;

            const nlohmann::json value = j.contains("value") ? j["value"] : nlohmann::json();
            if (value.is_string()) {
                prop.value = value.get<std::string>();
                prop.kind = ValueKind::String;
            } else if (value.is_boolean()) {
                prop.value = value.get<bool>();
                prop.kind = ValueKind::Boolean;
            } else if (value.is_number_integer()) {
                prop.value = value.get<double>();
                prop.kind = declared == ValueKind::Number ? ValueKind::Number : ValueKind::Integer;
            } else if (value.is_number()) {
                prop.value = value.get<double>();
                prop.kind = declared == ValueKind::Integer ? ValueKind::Integer : ValueKind::Number;
            } else {
                prop.kind = ValueKind::Null;
            }

            if (declared && *declared != prop.kind &&
                !(prop.isNumeric() && (*declared == ValueKind::Number || *declared == ValueKind::Integer))) {
                LOG_DEBUG("Property '{}' declared as {} but holds {}", prop.name,
                          core::value_kind_to_string(*declared), core::value_kind_to_string(prop.kind));
            }
            return prop;
        }

        std::vector<std::string> read_string_list(const nlohmann::json& j) {
            std::vector<std::string> out;
            for (const auto& item : j) {
                if (item.is_string())
                    out.push_back(item.get<std::string>());
            }
            std::sort(out.begin(), out.end());
            out.erase(std::unique(out.begin(), out.end()), out.end());
            return out;
        }

        Result<core::ModelMetadata> from_json(const nlohmann::json& doc) {
            if (!doc.is_object()) {
                return make_error(ErrorCode::MALFORMED_JSON, "Metadata document must be a JSON object");
            }

            core::ModelMetadata metadata;
            metadata.model_id = string_or_empty(doc, "modelId");
            metadata.name = string_or_empty(doc, "name");

            if (doc.contains("elements")) {
                const auto& elements = doc["elements"];
                if (!elements.is_array()) {
                    return make_error(ErrorCode::MALFORMED_JSON, "'elements' must be an array");
                }
                metadata.elements.reserve(elements.size());
                for (size_t i = 0; i < elements.size(); ++i) {
                    const auto& e = elements[i];
                    if (!e.is_object() || !e.contains("id") || !e["id"].is_string()) {
                        return make_error(ErrorCode::MALFORMED_JSON,
                                          std::format("Element {} has no string 'id'", i));
                    }

                    SemanticElement element;
                    element.id = e["id"].get<std::string>();
                    if (auto guid = string_or_empty(e, "ifcGuid"); !guid.empty()) {
                        element.external_guid = std::move(guid);
                    }
                    element.type_tag = string_or_empty(e, "type");
                    element.display_name = string_or_empty(e, "name");

                    if (e.contains("properties") && e["properties"].is_array()) {
                        for (const auto& p : e["properties"]) {
                            if (p.is_object())
                                element.properties.push_back(read_property(p));
                        }
                    }
                    metadata.elements.push_back(std::move(element));
                }
            }

            const bool has_types = doc.contains("types") && doc["types"].is_array();
            const bool has_psets = doc.contains("propertySets") && doc["propertySets"].is_array();
            if (has_types && has_psets) {
                metadata.types = read_string_list(doc["types"]);
                metadata.property_sets = read_string_list(doc["propertySets"]);
            } else {
                metadata.deriveSummaries();
            }

            return metadata;
        }

    } // namespace

    Result<core::ModelMetadata> parse_model_metadata(const std::string_view json_text) {
        try {
            return from_json(nlohmann::json::parse(json_text));
        } catch (const nlohmann::json::exception& e) {
            return make_error(ErrorCode::MALFORMED_JSON, std::format("JSON parse error: {}", e.what()));
        }
    }

    Result<core::ModelMetadata> load_model_metadata(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            return make_error(ErrorCode::PATH_NOT_FOUND, "Metadata file not found", path);
        }

        std::ifstream file;
        if (!core::open_file_for_read(path, file)) {
            return make_error(ErrorCode::READ_FAILURE, "Cannot open metadata file", path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        auto result = parse_model_metadata(buffer.str());
        if (!result) {
            return make_error(result.error().code, result.error().message, path);
        }

        LOG_INFO("Loaded metadata '{}': {} elements, {} types",
                 result->model_id, result->elements.size(), result->types.size());
        return result;
    }

} // namespace bim::io
