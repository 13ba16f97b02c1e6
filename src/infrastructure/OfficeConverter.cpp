/**
 * @file OfficeConverter.cpp
 * @brief Implementation of OfficeConverter.
 */

#include "infrastructure/OfficeConverter.hpp"
#include "domain/PageRenderer.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <iostream>

namespace smartocr::infrastructure {

namespace fs = std::filesystem;

fs::path OfficeConverter::ConvertToPdf(const std::string& sourcePath,
                                       const fs::path& outDir,
                                       std::chrono::seconds timeout) {
    if (!ProcessRunner::IsAvailable("soffice")) {
        throw domain::ToolingUnavailableError(
            "LibreOffice (soffice) is required to handle " + fs::path(sourcePath).extension().string() +
            " files. Install LibreOffice and make sure 'soffice' is on PATH.");
    }

    std::cout << "[OfficeConverter] Converting " << sourcePath << " to PDF..." << std::endl;
    auto result = ProcessRunner::Run("soffice",
                                     {"--headless", "--convert-to", "pdf", "--outdir", outDir.string(), sourcePath},
                                     timeout, true);
    if (result.timedOut()) {
        throw domain::RenderError("Conversion to PDF timed out for " + sourcePath);
    }

    fs::path pdfPath = outDir / fs::path(sourcePath).stem();
    pdfPath += ".pdf";
    if (!result.succeeded() || !fs::exists(pdfPath)) {
        throw domain::RenderError("Conversion to PDF failed for " + sourcePath + ": " + result.output);
    }
    return pdfPath;
}

} // namespace smartocr::infrastructure
