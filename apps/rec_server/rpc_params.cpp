#include "rpc_params.h"

#include "crec/core/normalization.h"

#include <limits>

namespace crec::rpc {

IntegerParam integer_param(const nlohmann::json& params, const std::string& name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return IntegerParam::ok(std::nullopt);
  }

  const nlohmann::json& value = *it;
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return IntegerParam::err(name + " is out of range");
    }
    return IntegerParam::ok(static_cast<std::int64_t>(raw));
  }
  if (value.is_number_integer()) {
    return IntegerParam::ok(value.get<std::int64_t>());
  }
  if (value.is_string()) {
    if (auto parsed = core::parse_int64(value.get<std::string>())) {
      return IntegerParam::ok(parsed);
    }
  }
  return IntegerParam::err(name + " must be an integer");
}

}  // namespace crec::rpc
