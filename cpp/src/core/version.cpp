#include "tkgstats/core/version.hpp"

namespace tkgstats {

const std::string& version_string() {
    static const std::string version = std::to_string(kVersionMajor) + '.' +
                                       std::to_string(kVersionMinor) + '.' +
                                       std::to_string(kVersionPatch);
    return version;
}

std::string version_banner(std::string_view program) {
    std::string banner(program);
    banner += ' ';
    banner += version_string();
    return banner;
}

} // namespace tkgstats
