#pragma once

namespace cuid2::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "0.2";

}  // namespace cuid2::core
