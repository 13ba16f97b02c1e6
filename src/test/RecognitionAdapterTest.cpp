#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "application/RecognitionAdapter.hpp"
#include "TestFakes.hpp"

using namespace smartocr;
using smartocr::test::FakeRecognitionBackend;

namespace {

domain::RasterImage MakePage(int page) {
    domain::RasterImage image;
    image.pageNumber = page;
    image.bytes = {0x89, 'P', 'N', 'G'};
    return image;
}

/** Checks the staged file content while the request is in flight. */
class InspectingBackend : public domain::RecognitionBackend {
public:
    std::string seenPath;
    std::string seenPrompt;
    std::size_t seenSize = 0;

    nlohmann::json respond(const domain::StagedImage& staged, const std::string& prompt) override {
        seenPath = staged.path;
        seenPrompt = prompt;
        seenSize = std::filesystem::file_size(staged.path);
        return "```text\nHello\n```";
    }
    std::string getName() const override { return "InspectingBackend"; }
};

class ThrowingBackend : public domain::RecognitionBackend {
public:
    std::string seenPath;
    bool nonStandard = false;

    nlohmann::json respond(const domain::StagedImage& staged, const std::string&) override {
        seenPath = staged.path;
        if (nonStandard) throw 42;
        throw std::runtime_error("Connection refused");
    }
    std::string getName() const override { return "ThrowingBackend"; }
};

} // namespace

void testSuccessReleasesStagedFile() {
    std::cout << "[Test] Success path..." << std::endl;
    auto backend = std::make_shared<InspectingBackend>();
    application::RecognitionAdapter adapter(backend);

    auto outcome = adapter.recognize(MakePage(3));
    assert(outcome.succeeded());
    assert(outcome.text == "Hello");
    assert(outcome.error.empty());

    assert(!backend->seenPath.empty());
    assert(std::filesystem::path(backend->seenPath).extension() == ".png");
    assert(backend->seenSize == 4);
    assert(!std::filesystem::exists(backend->seenPath));
    assert(backend->seenPrompt == application::RecognitionAdapter::kDefaultPrompt);
    std::cout << "[PASS] Success path" << std::endl;
}

void testFailureReleasesStagedFile() {
    std::cout << "[Test] Failure path..." << std::endl;
    auto backend = std::make_shared<ThrowingBackend>();
    application::RecognitionAdapter adapter(backend, "Custom prompt");
    assert(adapter.getPrompt() == "Custom prompt");

    auto outcome = adapter.recognize(MakePage(1));
    assert(!outcome.succeeded());
    assert(outcome.error == "Connection refused");
    assert(!backend->seenPath.empty());
    assert(!std::filesystem::exists(backend->seenPath));

    backend->nonStandard = true;
    outcome = adapter.recognize(MakePage(2));
    assert(!outcome.succeeded());
    assert(!outcome.error.empty());
    assert(!std::filesystem::exists(backend->seenPath));
    std::cout << "[PASS] Failure path" << std::endl;
}

void testEmptyPromptUsesDefault() {
    std::cout << "[Test] Default prompt..." << std::endl;
    application::RecognitionAdapter adapter(std::make_shared<FakeRecognitionBackend>(), "");
    assert(adapter.getPrompt() == application::RecognitionAdapter::kDefaultPrompt);

    application::RecognitionAdapter detached(nullptr);
    assert(!detached.recognize(MakePage(1)).succeeded());
    std::cout << "[PASS] Default prompt" << std::endl;
}

void testChatShapeFromFake() {
    std::cout << "[Test] Chat-shaped response..." << std::endl;
    auto backend = std::make_shared<FakeRecognitionBackend>();
    application::RecognitionAdapter adapter(backend);
    auto outcome = adapter.recognize(MakePage(7));
    assert(outcome.succeeded());
    assert(outcome.text == "text of page 7");
    assert(backend->stagedFileExisted);
    assert(!std::filesystem::exists(backend->stagedPaths.front()));
    std::cout << "[PASS] Chat-shaped response" << std::endl;
}

int main() {
    testSuccessReleasesStagedFile();
    testFailureReleasesStagedFile();
    testEmptyPromptUsesDefault();
    testChatShapeFromFake();
    std::cout << "[Test] All RecognitionAdapter tests passed." << std::endl;
    return 0;
}
