#pragma once

#include <filesystem>
#include <string>

namespace kestrel {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Absolute paths are returned unchanged. A relative path that exists under
    // the working directory wins; otherwise it resolves against the executable
    // directory, where the build copies config/.
    static std::filesystem::path resolveRelativePath(const std::string& path);
};

} // namespace utils
} // namespace kestrel
