/**
 * @file RecognitionBackend.hpp
 * @brief Interface for image-to-text recognition services.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "RasterImage.hpp"

namespace smartocr::domain {

/**
 * @struct StagedImage
 * @brief A page image made available to a backend for the duration of one request.
 */
struct StagedImage {
    std::string path;          ///< Transient file holding the encoded image.
    const RasterImage& image;  ///< In-memory copy of the same data.
};

/**
 * @class RecognitionBackend
 * @brief Abstract interface for models that transcribe a page image.
 *
 * The response is returned undecoded. Backends answer with a plain string,
 * an object carrying "content" or "text", or an OpenAI-style
 * "choices[0].message.content" payload.
 */
class RecognitionBackend {
public:
    virtual ~RecognitionBackend() = default;

    /**
     * @brief Issues one blocking recognition request.
     * @param image Staged page image.
     * @param prompt Instruction sent alongside the image.
     * @return The backend response as JSON.
     * @throws std::exception on transport or backend failure.
     */
    virtual nlohmann::json respond(const StagedImage& image, const std::string& prompt) = 0;

    /** @brief Lists models offered by the backend, empty when unsupported. */
    virtual std::vector<std::string> getAvailableModels() { return {}; }

    /** @brief Human-readable backend name for logs. */
    virtual std::string getName() const = 0;
};

} // namespace smartocr::domain
