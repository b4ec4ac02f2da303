#pragma once

/// @file gateway_result.hpp
/// @brief GatewayResult<T> alias for gateway error handling.

#include "pgw/core/result.hpp"
#include "pgw/foundation/gateway_error.hpp"

namespace pgw::foundation {

/// Result type specialized with GatewayError.
///
/// Example:
/// @code
///   GatewayResult<ExecutionMode> parse(std::string_view name) {
///       if (name.empty()) {
///           return GatewayResult<ExecutionMode>::err(
///               GatewayError(ErrorCode::UnknownExecutionMode, "empty mode name"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using GatewayResult = pgw::Result<T, GatewayError>;

}  // namespace pgw::foundation
