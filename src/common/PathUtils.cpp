#include "common/PathUtils.h"

#include <system_error>

namespace triplersi {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path rel(relative_path);
    if (rel.is_absolute()) {
        return rel;
    }

    auto exe_relative = getExecutableDir() / rel;
    std::error_code ec;
    if (std::filesystem::exists(exe_relative, ec)) {
        return exe_relative;
    }
    return std::filesystem::current_path() / rel;
}

} // namespace utils
} // namespace triplersi
