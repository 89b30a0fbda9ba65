#pragma once

#include <string>
#include <string_view>

namespace tkgstats {

/// Release numbers, injected by the build
inline constexpr int kVersionMajor = TKG_VERSION_MAJOR;
inline constexpr int kVersionMinor = TKG_VERSION_MINOR;
inline constexpr int kVersionPatch = TKG_VERSION_PATCH;

/// "MAJOR.MINOR.PATCH"
const std::string& version_string();

/// "<program> MAJOR.MINOR.PATCH", as printed by the tools' --version
std::string version_banner(std::string_view program);

} // namespace tkgstats
