/**
 * @file PopplerPageRenderer.cpp
 * @brief Implementation of PopplerPageRenderer.
 */

#include "infrastructure/PopplerPageRenderer.hpp"
#include "domain/FileType.hpp"
#include "infrastructure/OfficeConverter.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace smartocr::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kPagePrefix = "page";
}

PopplerPageRenderer::PopplerPageRenderer(int dpi)
    : m_dpi(dpi > 0 ? dpi : 150) {}

std::vector<domain::RasterImage> PopplerPageRenderer::render(const std::string& sourcePath,
                                                             int firstPage,
                                                             int lastPage,
                                                             std::chrono::seconds timeout) {
    if (firstPage < 1 || lastPage < firstPage) {
        throw domain::RenderError("Invalid page range " + std::to_string(firstPage) + "-" + std::to_string(lastPage));
    }

    const auto type = domain::FileTypeFromExtension(fs::path(sourcePath).extension().string());
    switch (type) {
        case domain::FileType::PDF:
            return renderPdf(sourcePath, firstPage, lastPage, timeout);
        case domain::FileType::TIFF:
            return renderTiff(sourcePath, firstPage, lastPage, timeout);
        case domain::FileType::PPTX:
        case domain::FileType::DOCX:
        case domain::FileType::ODT:
        case domain::FileType::RTF:
            return renderPdf(convertedPdfFor(sourcePath, timeout), firstPage, lastPage, timeout);
        case domain::FileType::Unknown:
            break;
    }
    throw domain::RenderError("Unsupported document format: " + sourcePath);
}

std::optional<int> PopplerPageRenderer::ParseTrailingNumber(const fs::path& file) {
    const std::string stem = file.stem().string();
    const auto dash = stem.find_last_of('-');
    if (dash == std::string::npos || dash + 1 >= stem.size()) {
        return std::nullopt;
    }
    const std::string digits = stem.substr(dash + 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

std::string PopplerPageRenderer::ConversionCacheKey(const fs::path& source) {
    std::error_code ec;
    const auto stamp = fs::last_write_time(source, ec);
    if (ec) {
        return source.string();
    }
    return source.string() + "@" + std::to_string(stamp.time_since_epoch().count());
}

std::vector<domain::RasterImage> PopplerPageRenderer::collectPages(const fs::path& dir, int firstPage, int numberBase) {
    std::vector<std::pair<int, fs::path>> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".png") continue;
        if (auto n = ParseTrailingNumber(entry.path())) {
            files.emplace_back(firstPage + (*n - numberBase), entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<domain::RasterImage> images;
    images.reserve(files.size());
    for (const auto& [page, path] : files) {
        domain::RasterImage image;
        image.pageNumber = page;
        image.bytes = ReadFileBytes(path);
        image.format = "png";
        images.push_back(std::move(image));
    }
    return images;
}

std::vector<domain::RasterImage> PopplerPageRenderer::renderPdf(const std::string& pdfPath,
                                                                int firstPage,
                                                                int lastPage,
                                                                std::chrono::seconds timeout) {
    if (!ProcessRunner::IsAvailable("pdftoppm")) {
        throw domain::ToolingUnavailableError("Install Poppler (pdfinfo, pdftoppm) to handle PDFs.");
    }

    ScopedTempDirectory scratch("smartocr-render");
    const std::string prefix = (scratch.getPath() / kPagePrefix).string();
    auto result = ProcessRunner::Run("pdftoppm",
                                     {"-png", "-r", std::to_string(m_dpi),
                                      "-f", std::to_string(firstPage), "-l", std::to_string(lastPage),
                                      pdfPath, prefix},
                                     timeout, true);
    if (result.timedOut()) {
        throw domain::RenderError("pdftoppm timed out after " + std::to_string(timeout.count()) + "s");
    }
    if (!result.succeeded()) {
        throw domain::RenderError("pdftoppm failed: " + result.output);
    }

    // pdftoppm names files after the absolute page number.
    return collectPages(scratch.getPath(), firstPage, firstPage);
}

std::vector<domain::RasterImage> PopplerPageRenderer::renderTiff(const std::string& tiffPath,
                                                                 int firstPage,
                                                                 int lastPage,
                                                                 std::chrono::seconds timeout) {
    if (!ProcessRunner::IsAvailable("convert")) {
        throw domain::ToolingUnavailableError("Install ImageMagick (identify, convert) to handle TIFF.");
    }

    ScopedTempDirectory scratch("smartocr-render");
    std::stringstream frames;
    frames << tiffPath << "[" << (firstPage - 1) << "-" << (lastPage - 1) << "]";
    const std::string pattern = (scratch.getPath() / (std::string(kPagePrefix) + "-%d.png")).string();

    auto result = ProcessRunner::Run("convert", {frames.str(), pattern}, timeout, true);
    if (result.timedOut()) {
        throw domain::RenderError("convert timed out after " + std::to_string(timeout.count()) + "s");
    }
    if (!result.succeeded()) {
        throw domain::RenderError("convert failed: " + result.output);
    }

    // ImageMagick numbers the extracted frames from 0.
    return collectPages(scratch.getPath(), firstPage, 0);
}

std::string PopplerPageRenderer::convertedPdfFor(const std::string& sourcePath, std::chrono::seconds timeout) {
    const std::string key = ConversionCacheKey(sourcePath);
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto it = m_convertedPdfs.find(key);
    if (it != m_convertedPdfs.end() && fs::exists(it->second)) {
        return it->second;
    }

    if (!m_cacheDir) {
        m_cacheDir = std::make_unique<ScopedTempDirectory>("smartocr-pdf");
    }
    // Each source gets its own subdirectory so equal stems never collide.
    fs::path outDir = m_cacheDir->getPath() / std::to_string(m_convertedPdfs.size());
    fs::create_directories(outDir);

    auto pdfPath = OfficeConverter::ConvertToPdf(sourcePath, outDir, timeout * 4).string();
    m_convertedPdfs[key] = pdfPath;
    return pdfPath;
}

} // namespace smartocr::infrastructure
