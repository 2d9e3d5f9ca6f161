#pragma once

namespace crec::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.1";

}  // namespace crec::core
