#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include "infrastructure/Base64.hpp"
#include "infrastructure/OpenAiVisionBackend.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PopplerPageRenderer.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include "infrastructure/ToolPageCounter.hpp"

using namespace smartocr::infrastructure;

void testPdfInfo() {
    std::cout << "[Test] pdfinfo parsing..." << std::endl;
    const std::string output =
        "Title:          Quarterly report\n"
        "Producer:       LibreOffice 7.6\n"
        "Pages:          42\n"
        "Encrypted:      no\n";
    assert(*ToolPageCounter::ParsePdfInfoPages(output) == 42);
    assert(!ToolPageCounter::ParsePdfInfoPages("Syntax Error: Couldn't read xref table\n"));
    std::cout << "[PASS] pdfinfo parsing" << std::endl;
}

void testPptxListing() {
    std::cout << "[Test] PPTX listing..." << std::endl;
    const std::string listing =
        "[Content_Types].xml\n"
        "ppt/presentation.xml\n"
        "ppt/slides/slide1.xml\n"
        "ppt/slides/slide2.xml\n"
        "ppt/slides/_rels/slide1.xml.rels\n"
        "ppt/slides/slide10.xml\r\n"
        "ppt/slideLayouts/slideLayout1.xml\n";
    assert(ToolPageCounter::CountPptxSlides(listing) == 3);
    assert(ToolPageCounter::CountPptxSlides("") == 0);
    std::cout << "[PASS] PPTX listing" << std::endl;
}

void testIdentifyFrames() {
    std::cout << "[Test] identify parsing..." << std::endl;
    assert(*ToolPageCounter::ParseIdentifyFrames("\n7\n7\n7\n") == 7);
    assert(!ToolPageCounter::ParseIdentifyFrames("identify: unable to open image"));
    assert(!ToolPageCounter::ParseIdentifyFrames(""));
    std::cout << "[PASS] identify parsing" << std::endl;
}

void testTrailingNumber() {
    std::cout << "[Test] Rendered file numbering..." << std::endl;
    assert(*PopplerPageRenderer::ParseTrailingNumber("/tmp/x/page-07.png") == 7);
    assert(*PopplerPageRenderer::ParseTrailingNumber("page-123.png") == 123);
    assert(*PopplerPageRenderer::ParseTrailingNumber("page-0.png") == 0);
    assert(!PopplerPageRenderer::ParseTrailingNumber("page.png"));
    assert(!PopplerPageRenderer::ParseTrailingNumber("page-x1.png"));
    std::cout << "[PASS] Rendered file numbering" << std::endl;
}

void testQuoting() {
    std::cout << "[Test] Shell quoting..." << std::endl;
    assert(ProcessRunner::Quote("plain") == "'plain'");
    assert(ProcessRunner::Quote("it's") == "'it'\\''s'");
    assert(ProcessRunner::Quote("a b;rm -rf") == "'a b;rm -rf'");

    auto echo = ProcessRunner::RunShell("printf 'hello'");
    assert(echo.succeeded());
    assert(echo.output == "hello");
    assert(ProcessRunner::RunShell("exit 3").exitCode == 3);
    std::cout << "[PASS] Shell quoting" << std::endl;
}

void testScopedTemporaries() {
    std::cout << "[Test] Scoped temporaries..." << std::endl;
    std::filesystem::path filePath;
    std::filesystem::path dirPath;
    {
        ScopedTempFile file(".png");
        file.write({1, 2, 3});
        filePath = file.getPath();
        assert(std::filesystem::exists(filePath));
        assert(filePath.extension() == ".png");
        assert(ReadFileBytes(filePath).size() == 3);

        ScopedTempDirectory dir("smartocr-test");
        dirPath = dir.getPath();
        ScopedTempFile other(".png");
        assert(other.getPath() != filePath);
        assert(std::filesystem::is_directory(dirPath));
    }
    assert(!std::filesystem::exists(filePath));
    assert(!std::filesystem::exists(dirPath));
    std::cout << "[PASS] Scoped temporaries" << std::endl;
}

void testShellRunsInOwnProcessGroup() {
    std::cout << "[Test] Shell process group..." << std::endl;
    // A terminal Ctrl-C goes to the foreground group only, so tools must lead their own.
    auto group = ProcessRunner::RunShell("kill -s 0 -- -$$ && echo own-group");
    assert(group.succeeded());
    assert(group.output == "own-group\n");
    std::cout << "[PASS] Shell process group" << std::endl;
}

void testConversionCacheKeyTracksEdits() {
    std::cout << "[Test] Conversion cache key..." << std::endl;
    ScopedTempFile file(".docx");
    file.write({'P', 'K'});
    const auto before = PopplerPageRenderer::ConversionCacheKey(file.getPath());
    assert(before.rfind(file.getPath().string(), 0) == 0);
    assert(PopplerPageRenderer::ConversionCacheKey(file.getPath()) == before);

    auto stamp = std::filesystem::last_write_time(file.getPath());
    std::filesystem::last_write_time(file.getPath(), stamp + std::chrono::seconds(10));
    assert(PopplerPageRenderer::ConversionCacheKey(file.getPath()) != before);

    assert(PopplerPageRenderer::ConversionCacheKey("/nonexistent/slides.docx") == "/nonexistent/slides.docx");
    std::cout << "[PASS] Conversion cache key" << std::endl;
}

void testRequestBody() {
    std::cout << "[Test] Chat request body..." << std::endl;
    assert(Base64Encode({}) == "");
    assert(Base64Encode({'M'}) == "TQ==");
    assert(Base64Encode({'M', 'a'}) == "TWE=");
    assert(Base64Encode({'M', 'a', 'n'}) == "TWFu");

    auto body = OpenAiVisionBackend::BuildRequest("gemma-3-12b-it-qat", "Transcribe.", "data:image/png;base64,TWFu");
    assert(body["model"] == "gemma-3-12b-it-qat");
    assert(body["stream"] == false);
    const auto& content = body["messages"][0]["content"];
    assert(body["messages"][0]["role"] == "user");
    assert(content[0]["type"] == "text");
    assert(content[0]["text"] == "Transcribe.");
    assert(content[1]["type"] == "image_url");
    assert(content[1]["image_url"]["url"] == "data:image/png;base64,TWFu");
    std::cout << "[PASS] Chat request body" << std::endl;
}

void testDefaultOutputPath() {
    std::cout << "[Test] Default output path..." << std::endl;
    assert(PathUtils::DefaultOutputPath("/data/scan.pdf") == std::filesystem::path("/data/scan.txt"));
    assert(PathUtils::DefaultOutputPath("slides") == std::filesystem::path("slides.txt"));
    std::cout << "[PASS] Default output path" << std::endl;
}

int main() {
    testPdfInfo();
    testPptxListing();
    testIdentifyFrames();
    testTrailingNumber();
    testQuoting();
    testScopedTemporaries();
    testShellRunsInOwnProcessGroup();
    testConversionCacheKeyTracksEdits();
    testRequestBody();
    testDefaultOutputPath();
    std::cout << "[Test] All tooling tests passed." << std::endl;
    return 0;
}
