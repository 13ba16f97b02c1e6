// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace smartocr::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    /** @brief Default location for results when no output path is given: <input stem>.txt next to the input. */
    static std::filesystem::path DefaultOutputPath(const std::string& inputPath);
};

} // namespace smartocr::infrastructure
