/**
 * @file PopplerPageRenderer.hpp
 * @brief Page rasterization through pdftoppm, with LibreOffice and ImageMagick fallbacks.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "domain/PageRenderer.hpp"
#include "infrastructure/ScopedTempFile.hpp"

namespace smartocr::infrastructure {

/**
 * @class PopplerPageRenderer
 * @brief Renders arbitrary page sub-ranges to PNG without rendering the whole document.
 *
 * PDFs go straight to pdftoppm. PPTX/DOCX/ODT/RTF are converted to PDF once per
 * source version and the converted file is reused. TIFF frames are extracted with
 * ImageMagick. Safe to call from several threads.
 */
class PopplerPageRenderer : public domain::PageRenderer {
public:
    explicit PopplerPageRenderer(int dpi = 150);

    std::vector<domain::RasterImage> render(const std::string& sourcePath,
                                            int firstPage,
                                            int lastPage,
                                            std::chrono::seconds timeout) override;

    /**
     * @brief Extracts the trailing page number from an output file name such as "page-007.png".
     */
    static std::optional<int> ParseTrailingNumber(const std::filesystem::path& file);

    /** @brief Cache key of an office conversion: the path plus its modification time, so edited files convert again. */
    static std::string ConversionCacheKey(const std::filesystem::path& source);

private:
    std::vector<domain::RasterImage> renderPdf(const std::string& pdfPath, int firstPage, int lastPage,
                                               std::chrono::seconds timeout);
    std::vector<domain::RasterImage> renderTiff(const std::string& tiffPath, int firstPage, int lastPage,
                                                std::chrono::seconds timeout);
    std::string convertedPdfFor(const std::string& sourcePath, std::chrono::seconds timeout);

    /** @brief Reads every PNG in dir, numbering pages as firstPage + (n - firstNumber). */
    static std::vector<domain::RasterImage> collectPages(const std::filesystem::path& dir, int firstPage, int numberBase);

    int m_dpi;
    std::mutex m_cacheMutex;
    std::unique_ptr<ScopedTempDirectory> m_cacheDir;
    std::map<std::string, std::string> m_convertedPdfs; ///< ConversionCacheKey -> converted PDF.
};

} // namespace smartocr::infrastructure
