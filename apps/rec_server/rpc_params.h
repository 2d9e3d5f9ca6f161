#pragma once

#include "crec/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace crec::rpc {

using IntegerParam = core::Result<std::optional<std::int64_t>, std::string>;

// integer_param reads params[name] as an integer.
//
// Accepted: a JSON integer, or a string holding a base-10 integer ("42", " 42 ").
// Absent or null yields nullopt. Anything else (floats, booleans, "4.2", "abc",
// integers outside int64) is an error naming the parameter.
[[nodiscard]] IntegerParam integer_param(const nlohmann::json& params, const std::string& name);

}  // namespace crec::rpc
