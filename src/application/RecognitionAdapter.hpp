/**
 * @file RecognitionAdapter.hpp
 * @brief Wraps a recognition backend behind a single non-throwing call.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/RasterImage.hpp"
#include "domain/RecognitionBackend.hpp"

namespace smartocr::application {

/**
 * @struct RecognitionOutcome
 * @brief Normalized text on success, the underlying error message on failure.
 */
struct RecognitionOutcome {
    bool ok = false;
    std::string text;
    std::string error;

    bool succeeded() const { return ok; }

    static RecognitionOutcome Success(std::string text) { return {true, std::move(text), {}}; }
    static RecognitionOutcome Failure(std::string error) { return {false, {}, std::move(error)}; }
};

/**
 * @class RecognitionAdapter
 * @brief Stages a page image, issues exactly one backend request and normalizes the answer.
 *
 * The call blocks for the duration of the request and must only run on a
 * background thread. The staged file is released on every exit path.
 */
class RecognitionAdapter {
public:
    static constexpr const char* kDefaultPrompt =
        "Transcribe the contents of this image into plain text, and try to keep as close as "
        "possible to the original layout. Do not say anything else.";

    explicit RecognitionAdapter(std::shared_ptr<domain::RecognitionBackend> backend,
                                std::string prompt = kDefaultPrompt);

    /** @brief Recognizes one page. Never throws. */
    RecognitionOutcome recognize(const domain::RasterImage& image);

    const std::string& getPrompt() const { return m_prompt; }

private:
    std::shared_ptr<domain::RecognitionBackend> m_backend;
    std::string m_prompt;
};

} // namespace smartocr::application
