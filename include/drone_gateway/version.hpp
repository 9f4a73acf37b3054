// === Version Metadata ========================================================
//
// Exposes the gateway's semantic version string used in logs and status replies.

#pragma once

#include <string_view>

namespace drone_gateway {

inline constexpr std::string_view k_version{"1.0.0"};

}  // namespace drone_gateway
