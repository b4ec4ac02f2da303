#pragma once

/// @file model_catalog.hpp
/// @brief YAML model catalog loading.
///
/// Catalog layout:
/// @code
///   models:
///     - id: groq-llama3-70b
///       provider: groq
///       remote_model_name: llama3-70b-8192
///       capabilities: [reasoning, research, code_generation]
///       cost_per_input_token: 5.9e-7
///       cost_per_output_token: 7.9e-7
///       average_latency_ms: 500
///       max_context_tokens: 8192
///       reliability_score: 0.95
///       local_only: false      # optional
/// @endcode

#include <filesystem>
#include <string_view>

#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/model_registry.hpp"

namespace pgw::service {

/// Parse a catalog document. Catalog order follows the sequence order.
/// @return CatalogInvalid for malformed entries or registry validation
///         failures, ConfigLoadFailed for YAML syntax errors.
[[nodiscard]] foundation::GatewayResult<ModelRegistry> parseModelCatalog(std::string_view yaml);

/// Load a catalog file.
[[nodiscard]] foundation::GatewayResult<ModelRegistry> loadModelCatalog(
    const std::filesystem::path& path);

}  // namespace pgw::service
