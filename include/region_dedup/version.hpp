// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs.

#pragma once

#include <string_view>

namespace region_dedup {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace region_dedup
