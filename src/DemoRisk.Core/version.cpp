#include "version.h"

#include <fmt/format.h>

namespace drisk::core {

int Version::GetMajor() { return API_MAJOR; }

int Version::GetMinor() { return API_MINOR; }

int Version::GetPatch() { return API_PATCH; }

std::string Version::GetVersion() {
    static const std::string version = fmt::format("{}.{}.{}", API_MAJOR, API_MINOR, API_PATCH);
    return version;
}

bool Version::IsAtLeast(int major, int minor, int patch) {
    if (API_MAJOR != major) {
        return API_MAJOR > major;
    }
    if (API_MINOR != minor) {
        return API_MINOR > minor;
    }
    return API_PATCH >= patch;
}
} // namespace drisk::core
