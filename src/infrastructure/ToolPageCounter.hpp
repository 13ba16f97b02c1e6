/**
 * @file ToolPageCounter.hpp
 * @brief Page counting through command-line tools, one strategy per format.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "domain/PageCounter.hpp"

namespace smartocr::infrastructure {

/**
 * @class ToolPageCounter
 * @brief Implements PageCounter with pdfinfo (PDF), unzip (PPTX), ImageMagick identify (TIFF)
 *        and a LibreOffice round-trip through PDF for DOCX/ODT/RTF.
 */
class ToolPageCounter : public domain::PageCounter {
public:
    explicit ToolPageCounter(std::chrono::seconds timeout = std::chrono::seconds(15));

    int countPages(const std::string& path, domain::FileType type) override;

    /** @brief Extracts the "Pages:" field from pdfinfo output. */
    static std::optional<int> ParsePdfInfoPages(const std::string& output);

    /** @brief Counts ppt/slides/slideN.xml entries in an `unzip -Z1` listing. */
    static int CountPptxSlides(const std::string& listing);

    /** @brief Reads the frame count from `identify -format "%n\n"` output. */
    static std::optional<int> ParseIdentifyFrames(const std::string& output);

private:
    int countPdf(const std::string& path);
    int countPptx(const std::string& path);
    int countTiff(const std::string& path);
    int countFlowDocument(const std::string& path);

    std::chrono::seconds m_timeout;
};

} // namespace smartocr::infrastructure
