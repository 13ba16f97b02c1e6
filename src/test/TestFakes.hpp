/**
 * @file TestFakes.hpp
 * @brief In-memory collaborators for the test programs.
 */

#pragma once
#include <algorithm>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/PageCounter.hpp"
#include "domain/PageRenderer.hpp"
#include "domain/RecognitionBackend.hpp"

namespace smartocr::test {

class FakePageCounter : public domain::PageCounter {
public:
    int pages = 0;
    bool toolingMissing = false;
    bool toolFails = false;
    int calls = 0;

    int countPages(const std::string&, domain::FileType) override {
        ++calls;
        if (toolingMissing) throw domain::ToolingUnavailableError("Install Poppler (pdfinfo, pdftoppm) to handle PDFs.");
        if (toolFails) throw domain::RenderError("pdfinfo crashed");
        return pages;
    }
};

/** Renders page N as the bytes "page-N". */
class FakePageRenderer : public domain::PageRenderer {
public:
    std::set<int> failingBatches;              ///< First pages of batches that fail to render.
    std::set<int> droppedPages;                ///< Pages silently left out of the result.
    bool reverseOrder = false;
    bool toolingMissing = false;
    std::function<void(int, int)> onRender;    ///< Called with (firstPage, lastPage) before rendering.
    std::vector<std::pair<int, int>> calls;
    std::mutex mutex;

    std::vector<domain::RasterImage> render(const std::string&, int firstPage, int lastPage,
                                            std::chrono::seconds) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            calls.emplace_back(firstPage, lastPage);
        }
        if (onRender) onRender(firstPage, lastPage);
        if (toolingMissing) {
            throw domain::ToolingUnavailableError("Install Poppler (pdfinfo, pdftoppm) to handle PDFs.");
        }
        if (failingBatches.count(firstPage)) {
            throw domain::RenderError("pdftoppm exited with 99");
        }
        std::vector<domain::RasterImage> images;
        for (int page = firstPage; page <= lastPage; ++page) {
            if (droppedPages.count(page)) continue;
            domain::RasterImage image;
            image.pageNumber = page;
            const std::string payload = "page-" + std::to_string(page);
            image.bytes.assign(payload.begin(), payload.end());
            images.push_back(std::move(image));
        }
        if (reverseOrder) std::reverse(images.begin(), images.end());
        return images;
    }
};

/**
 * Answers "text of page N" for page N in the OpenAI-compatible shape.
 * Records every staged path and whether the file existed during the call.
 */
class FakeRecognitionBackend : public domain::RecognitionBackend {
public:
    std::set<int> failingPages;
    std::function<void(int)> afterRespond;     ///< Called with the page number after each answer.
    std::vector<std::string> stagedPaths;
    bool stagedFileExisted = true;
    std::mutex mutex;

    nlohmann::json respond(const domain::StagedImage& staged, const std::string&) override {
        const int page = staged.image.pageNumber;
        {
            std::lock_guard<std::mutex> lock(mutex);
            stagedPaths.push_back(staged.path);
            if (!std::filesystem::exists(staged.path)) stagedFileExisted = false;
        }
        if (failingPages.count(page)) {
            if (afterRespond) afterRespond(page);
            throw std::runtime_error("HTTP Error 500: model crashed");
        }
        nlohmann::json response = {
            {"choices", nlohmann::json::array({{{"message", {{"content", "text of page " + std::to_string(page)}}}}})}
        };
        if (afterRespond) afterRespond(page);
        return response;
    }

    std::string getName() const override { return "FakeRecognitionBackend"; }
};

} // namespace smartocr::test
