/// @file model_catalog.cpp
/// @brief YAML model catalog parser.

#include "pgw/service/model_catalog.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

GatewayResult<ModelRecord> parseEntry(const YAML::Node& node, std::size_t position) {
    auto malformed = [position](const std::string& reason) {
        return GatewayResult<ModelRecord>::err(GatewayError(
            ErrorCode::CatalogInvalid,
            "catalog entry " + std::to_string(position) + ": " + reason));
    };

    if (!node.IsMap()) {
        return malformed("not a map");
    }
    for (const char* required : {"id", "provider", "capabilities", "cost_per_input_token",
                                 "cost_per_output_token", "average_latency_ms",
                                 "reliability_score"}) {
        if (!node[required]) {
            return malformed(std::string("missing '") + required + "'");
        }
    }

    try {
        ModelRecord record;
        record.id = node["id"].as<std::string>();
        record.provider = node["provider"].as<std::string>();
        record.remoteModelName = node["remote_model_name"]
                                     ? node["remote_model_name"].as<std::string>()
                                     : record.id;
        record.costPerInputToken = node["cost_per_input_token"].as<double>();
        record.costPerOutputToken = node["cost_per_output_token"].as<double>();
        record.averageLatency =
            std::chrono::milliseconds(node["average_latency_ms"].as<int64_t>());
        record.maxContextTokens =
            node["max_context_tokens"] ? node["max_context_tokens"].as<uint32_t>() : 0;
        record.reliabilityScore = node["reliability_score"].as<double>();
        record.localOnly = node["local_only"] ? node["local_only"].as<bool>() : false;

        const auto& caps = node["capabilities"];
        if (!caps.IsSequence()) {
            return malformed("'capabilities' is not a sequence");
        }
        for (const auto& cap : caps) {
            auto parsed = parseTaskCapability(cap.as<std::string>());
            if (!parsed) {
                return malformed(std::string(parsed.error().message()));
            }
            record.capabilities.push_back(parsed.value());
        }
        return GatewayResult<ModelRecord>::ok(std::move(record));
    } catch (const YAML::BadConversion& e) {
        return malformed(e.what());
    }
}

GatewayResult<ModelRegistry> buildRegistry(const YAML::Node& root) {
    const auto& models = root["models"];
    if (!models || !models.IsSequence()) {
        return GatewayResult<ModelRegistry>::err(
            GatewayError(ErrorCode::CatalogInvalid, "catalog has no 'models' sequence"));
    }

    std::vector<ModelRecord> records;
    records.reserve(models.size());
    std::size_t position = 0;
    for (const auto& entry : models) {
        auto record = parseEntry(entry, position++);
        if (!record) {
            return GatewayResult<ModelRegistry>::err(record.error());
        }
        records.push_back(std::move(record).value());
    }
    return ModelRegistry::create(std::move(records));
}

}  // anonymous namespace

GatewayResult<ModelRegistry> parseModelCatalog(std::string_view yaml) {
    try {
        return buildRegistry(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<ModelRegistry>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GatewayResult<ModelRegistry> loadModelCatalog(const std::filesystem::path& path) {
    try {
        return buildRegistry(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GatewayResult<ModelRegistry>::err(GatewayError(
            ErrorCode::ConfigLoadFailed, "failed to open model catalog: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<ModelRegistry>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

} // namespace pgw::service
