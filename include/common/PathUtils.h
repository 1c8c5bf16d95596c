#pragma once

#include <string>
#include <filesystem>

namespace triplersi {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환 (/proc/self/exe 기준)
    static std::filesystem::path getExecutableDir();

    // 실행 파일 기준 상대 경로 → 없으면 현재 작업 디렉토리 기준
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace triplersi
