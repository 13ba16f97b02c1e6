/**
 * @file RecognitionAdapter.cpp
 * @brief Implementation of RecognitionAdapter.
 */

#include "application/RecognitionAdapter.hpp"
#include "application/ResponseNormalizer.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include <iostream>

namespace smartocr::application {

RecognitionAdapter::RecognitionAdapter(std::shared_ptr<domain::RecognitionBackend> backend, std::string prompt)
    : m_backend(std::move(backend)), m_prompt(std::move(prompt)) {
    if (m_prompt.empty()) {
        m_prompt = kDefaultPrompt;
    }
}

RecognitionOutcome RecognitionAdapter::recognize(const domain::RasterImage& image) {
    if (!m_backend) {
        return RecognitionOutcome::Failure("No recognition backend configured.");
    }

    try {
        infrastructure::ScopedTempFile staged("." + (image.format.empty() ? std::string("png") : image.format));
        staged.write(image.bytes);

        domain::StagedImage stagedImage{staged.getPath().string(), image};
        nlohmann::json response = m_backend->respond(stagedImage, m_prompt);
        return RecognitionOutcome::Success(ResponseNormalizer::Normalize(response));
    } catch (const std::exception& e) {
        std::cerr << "[RecognitionAdapter] " << m_backend->getName() << " failed on page "
                  << image.pageNumber << ": " << e.what() << std::endl;
        return RecognitionOutcome::Failure(e.what());
    } catch (...) {
        std::cerr << "[RecognitionAdapter] " << m_backend->getName() << " failed on page "
                  << image.pageNumber << " with a non-standard exception." << std::endl;
        return RecognitionOutcome::Failure("Unknown error during recognition.");
    }
}

} // namespace smartocr::application
