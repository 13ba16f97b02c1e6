/**
 * @file PageRenderer.hpp
 * @brief Interface for rasterizing a contiguous range of document pages.
 */

#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "RasterImage.hpp"

namespace smartocr::domain {

/**
 * @class RenderError
 * @brief Raised when a rendering or page-counting tool ran but did not produce a result.
 */
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ToolingUnavailableError
 * @brief Raised when the external tool needed for a recognized format is not installed.
 */
class ToolingUnavailableError : public std::runtime_error {
public:
    explicit ToolingUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class PageRenderer
 * @brief Abstract collaborator that turns document pages into raster images.
 */
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    /**
     * @brief Renders pages [firstPage, lastPage] of the source (1-based, inclusive).
     * @param sourcePath Path of the source document.
     * @param firstPage First page to render.
     * @param lastPage Last page to render.
     * @param timeout Upper bound for the rendering call.
     * @return Images in ascending page order.
     * @throws RenderError, ToolingUnavailableError
     */
    virtual std::vector<RasterImage> render(const std::string& sourcePath,
                                            int firstPage,
                                            int lastPage,
                                            std::chrono::seconds timeout) = 0;
};

} // namespace smartocr::domain
