/**
 * @file PageCounter.hpp
 * @brief Interface for per-format page counting.
 */

#pragma once
#include <string>
#include "FileType.hpp"
#include "PageRenderer.hpp"

namespace smartocr::domain {

/**
 * @class PageCounter
 * @brief Abstract collaborator that reports how many pages a document has.
 */
class PageCounter {
public:
    virtual ~PageCounter() = default;

    /**
     * @brief Counts the pages of a document of a known format.
     * @return Non-negative page count.
     * @throws ToolingUnavailableError when the format's tool is missing.
     * @throws RenderError when the tool failed on this file.
     */
    virtual int countPages(const std::string& path, FileType type) = 0;
};

} // namespace smartocr::domain
