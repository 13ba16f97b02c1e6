#include <cassert>
#include <iostream>
#include "domain/Document.hpp"
#include "TestFakes.hpp"

using namespace smartocr::domain;
using smartocr::test::FakePageCounter;

void testObjectIndicesAreMonotonic() {
    std::cout << "[Test] Object indices..." << std::endl;
    Document doc;
    assert(doc.getNextIndex() == 0);
    int a = doc.addObject(0, "first");
    int b = doc.addObject(0, "second");
    int c = doc.addObject(std::nullopt, "loose", Coordinates{1, 2, 3, 4});
    assert(a == 0 && b == 1 && c == 2);

    assert(doc.deleteObject(b) == 1);
    assert(doc.getObject(b) == nullptr);
    assert(doc.deleteObject(b) == 0);

    // Deleted indices are never reused.
    int d = doc.addObject(1, "after delete");
    assert(d == 3);
    assert(doc.getNextIndex() == 4);

    const ExtractedObject* loose = doc.getObject(c);
    assert(loose != nullptr);
    assert(!loose->getPage().has_value());
    assert(loose->getCoordinates().has_value());
    assert((*loose->getCoordinates())[3] == 4);
    assert(loose->getKind() == ObjectKind::Text);
    std::cout << "[PASS] Object indices" << std::endl;
}

void testDeletePageObjects() {
    std::cout << "[Test] Delete page objects..." << std::endl;
    Document doc;
    doc.addObject(0, "p0");
    doc.addObject(1, "p1a");
    doc.addObject(1, "p1b");

    // No pages yet: deleting by page is a no-op.
    assert(doc.deletePageObjects(1) == 0);
    assert(doc.getObjects().size() == 3);

    doc.addPage();
    doc.addPage();
    assert(doc.hasPages());
    assert(doc.getPageObjects(1).size() == 2);
    assert(doc.deletePageObjects(1) == 2);
    assert(doc.getPageObjects(1).empty());
    assert(doc.getObjects().size() == 1);
    assert(doc.getObjects().front().getContent() == "p0");
    std::cout << "[PASS] Delete page objects" << std::endl;
}

void testDetectType() {
    std::cout << "[Test] Detect type..." << std::endl;
    FakePageCounter counter;
    counter.pages = 12;

    Document doc;
    doc.detectType("/tmp/Report.PdF", counter);
    assert(doc.getFileType() == FileType::PDF);
    assert(doc.getTypeTag() == "PDF");
    assert(doc.getPageCount() == 12);
    assert(doc.getSourcePath() == "/tmp/Report.PdF");

    doc.detectType("/tmp/slides.pptx", counter);
    assert(doc.getFileType() == FileType::PPTX);

    doc.detectType("/tmp/notes.odt", counter);
    assert(doc.getFileType() == FileType::ODT);
    assert(IsFlowDocument(doc.getFileType()));

    int callsBefore = counter.calls;
    doc.detectType("/tmp/archive.zip", counter);
    assert(doc.getFileType() == FileType::Unknown);
    assert(doc.getTypeTag() == "ZIP");
    assert(doc.getPageCount() == 0);
    assert(counter.calls == callsBefore);

    doc.detectType("/tmp/noextension", counter);
    assert(doc.getTypeTag() == "UNKNOWN");

    counter.pages = -3;
    doc.detectType("/tmp/scan.tif", counter);
    assert(doc.getFileType() == FileType::TIFF);
    assert(doc.getPageCount() == 0);
    std::cout << "[PASS] Detect type" << std::endl;
}

void testToolingErrorsPropagate() {
    std::cout << "[Test] Tooling errors propagate..." << std::endl;
    FakePageCounter counter;
    counter.toolingMissing = true;

    Document doc;
    bool thrown = false;
    try {
        doc.detectType("/tmp/a.pdf", counter);
    } catch (const ToolingUnavailableError& e) {
        thrown = true;
        assert(std::string(e.what()).find("Poppler") != std::string::npos);
    }
    assert(thrown);
    assert(doc.getPageCount() == 0);

    counter.toolingMissing = false;
    counter.toolFails = true;
    thrown = false;
    try {
        doc.detectType("/tmp/a.pdf", counter);
    } catch (const RenderError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Tooling errors propagate" << std::endl;
}

void testClearKeepsIndexCounter() {
    std::cout << "[Test] Clear..." << std::endl;
    FakePageCounter counter;
    counter.pages = 2;
    Document doc;
    doc.detectType("/tmp/a.pdf", counter);
    doc.addObject(0, "x");
    doc.clear();
    assert(doc.getObjects().empty());
    assert(!doc.hasPages());
    assert(doc.getSourcePath().empty());
    assert(doc.addObject(0, "y") == 1);
    std::cout << "[PASS] Clear" << std::endl;
}

void testAdoptDetectionKeepsObjects() {
    std::cout << "[Test] Adopt detection..." << std::endl;
    FakePageCounter counter;
    counter.pages = 3;
    Document doc;
    doc.addObject(0, "a");
    doc.addObject(1, "b");

    Document detected;
    detected.detectType("/tmp/other.pptx", counter);
    doc.adoptDetection(detected);

    assert(doc.getFileType() == FileType::PPTX);
    assert(doc.getSourcePath() == "/tmp/other.pptx");
    assert(doc.getPageCount() == 3);
    assert(doc.getObjects().size() == 2);
    assert(doc.getNextIndex() == 2);
    assert(doc.addObject(2, "c") == 2);
    std::cout << "[PASS] Adopt detection" << std::endl;
}

void testFileTypeTags() {
    std::cout << "[Test] File type tags..." << std::endl;
    assert(FileTypeFromExtension(".docx") == FileType::DOCX);
    assert(FileTypeFromExtension("RTF") == FileType::RTF);
    assert(FileTypeFromExtension("tiff") == FileType::TIFF);
    assert(FileTypeFromExtension("png") == FileType::Unknown);
    assert(std::string(FileTypeToString(FileType::Unknown)) == "UNKNOWN");
    assert(!IsFlowDocument(FileType::PDF));
    std::cout << "[PASS] File type tags" << std::endl;
}

int main() {
    testObjectIndicesAreMonotonic();
    testDeletePageObjects();
    testDetectType();
    testToolingErrorsPropagate();
    testClearKeepsIndexCounter();
    testAdoptDetectionKeepsObjects();
    testFileTypeTags();
    std::cout << "[Test] All Document tests passed." << std::endl;
    return 0;
}
