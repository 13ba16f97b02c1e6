/**
 * @file OfficeConverter.hpp
 * @brief LibreOffice-based conversion of presentation and flow documents to PDF.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace smartocr::infrastructure {

class OfficeConverter {
public:
    /**
     * @brief Converts a document to PDF with `soffice --headless`.
     * @return Path of the produced PDF inside outDir.
     * @throws domain::ToolingUnavailableError when soffice is not installed.
     * @throws domain::RenderError when the conversion fails.
     */
    static std::filesystem::path ConvertToPdf(const std::string& sourcePath,
                                              const std::filesystem::path& outDir,
                                              std::chrono::seconds timeout);
};

} // namespace smartocr::infrastructure
