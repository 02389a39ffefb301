#include "common/PathUtils.h"

#include <system_error>

namespace kestrel {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path(ec);
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& path) {
    const std::filesystem::path requested(path);
    if (requested.is_absolute()) {
        return requested;
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec && std::filesystem::exists(cwd / requested, ec)) {
        return cwd / requested;
    }
    return getExecutableDir() / requested;
}

} // namespace utils
} // namespace kestrel
