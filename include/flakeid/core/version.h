#pragma once

namespace flakeid::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.1";

}  // namespace flakeid::core
