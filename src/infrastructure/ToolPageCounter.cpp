/**
 * @file ToolPageCounter.cpp
 * @brief Implementation of ToolPageCounter.
 */

#include "infrastructure/ToolPageCounter.hpp"
#include "infrastructure/OfficeConverter.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include <iostream>
#include <regex>
#include <sstream>

namespace smartocr::infrastructure {

ToolPageCounter::ToolPageCounter(std::chrono::seconds timeout)
    : m_timeout(timeout) {}

int ToolPageCounter::countPages(const std::string& path, domain::FileType type) {
    switch (type) {
        case domain::FileType::PDF: return countPdf(path);
        case domain::FileType::PPTX: return countPptx(path);
        case domain::FileType::TIFF: return countTiff(path);
        case domain::FileType::DOCX:
        case domain::FileType::ODT:
        case domain::FileType::RTF: return countFlowDocument(path);
        case domain::FileType::Unknown: return 0;
    }
    return 0;
}

std::optional<int> ToolPageCounter::ParsePdfInfoPages(const std::string& output) {
    std::stringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("Pages:", 0) == 0) {
            try {
                return std::stoi(line.substr(6));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

int ToolPageCounter::CountPptxSlides(const std::string& listing) {
    static const std::regex slidePattern(R"(^ppt/slides/slide[0-9]+\.xml\r?$)");
    std::stringstream ss(listing);
    std::string line;
    int count = 0;
    while (std::getline(ss, line)) {
        if (std::regex_match(line, slidePattern)) {
            ++count;
        }
    }
    return count;
}

std::optional<int> ToolPageCounter::ParseIdentifyFrames(const std::string& output) {
    std::stringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.empty()) continue;
        try {
            return std::stoi(line);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

int ToolPageCounter::countPdf(const std::string& path) {
    if (!ProcessRunner::IsAvailable("pdfinfo")) {
        throw domain::ToolingUnavailableError("Install Poppler (pdfinfo, pdftoppm) to handle PDFs.");
    }
    auto result = ProcessRunner::Run("pdfinfo", {path}, m_timeout, true);
    if (!result.succeeded()) {
        throw domain::RenderError("Could not retrieve PDF info: " + result.output);
    }
    auto pages = ParsePdfInfoPages(result.output);
    if (!pages) {
        throw domain::RenderError("pdfinfo did not report a page count for " + path);
    }
    return *pages;
}

int ToolPageCounter::countPptx(const std::string& path) {
    if (!ProcessRunner::IsAvailable("unzip")) {
        throw domain::ToolingUnavailableError("Install unzip to handle PPTX.");
    }
    auto result = ProcessRunner::Run("unzip", {"-Z1", path}, m_timeout);
    if (!result.succeeded()) {
        throw domain::RenderError("Could not read presentation archive: " + path);
    }
    return CountPptxSlides(result.output);
}

int ToolPageCounter::countTiff(const std::string& path) {
    if (!ProcessRunner::IsAvailable("identify")) {
        throw domain::ToolingUnavailableError("Install ImageMagick (identify, convert) to handle TIFF.");
    }
    auto result = ProcessRunner::Run("identify", {"-format", "%n\n", path}, m_timeout);
    if (!result.succeeded()) {
        throw domain::RenderError("Could not read TIFF frames: " + path);
    }
    return ParseIdentifyFrames(result.output).value_or(1);
}

int ToolPageCounter::countFlowDocument(const std::string& path) {
    ScopedTempDirectory scratch("smartocr-count");
    auto pdfPath = OfficeConverter::ConvertToPdf(path, scratch.getPath(), m_timeout * 4);
    return countPdf(pdfPath.string());
}

} // namespace smartocr::infrastructure
