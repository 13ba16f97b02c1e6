/**
 * @file RasterImage.hpp
 * @brief One rendered document page held in memory.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace smartocr::domain {

/**
 * @struct RasterImage
 * @brief Encoded raster of a single page, as produced by a PageRenderer.
 */
struct RasterImage {
    int pageNumber = 0;               ///< 1-based page number in the source document.
    std::vector<std::uint8_t> bytes;  ///< Encoded image data.
    std::string format = "png";       ///< Encoding of bytes, also used as file suffix when staging.

    bool empty() const { return bytes.empty(); }
};

} // namespace smartocr::domain
