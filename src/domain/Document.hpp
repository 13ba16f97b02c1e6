/**
 * @file Document.hpp
 * @brief In-memory registry of a document's pages and extracted objects.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ExtractedObject.hpp"
#include "FileType.hpp"
#include "PageCounter.hpp"

namespace smartocr::domain {

/**
 * @class Document
 * @brief Holds the detected format, the page count and every object extracted so far.
 *
 * Object indices come from a monotonic counter and are never reused, even after
 * deletion. Page numbers stored on objects are 0-based. The page of an object is
 * not checked against the page count: detection may happen after objects are added.
 */
class Document {
public:
    Document() = default;

    /** @brief Increments the page count by one. */
    void addPage() { ++m_pageCount; }

    /**
     * @brief Appends a new object and assigns it the next free index.
     * @param page Owning 0-based page, or nullopt for page-agnostic content.
     * @param content Recognized payload.
     * @param coordinates Optional bounding region.
     * @param kind Payload kind.
     * @return The index assigned to the new object.
     */
    int addObject(std::optional<int> page,
                  const std::string& content,
                  std::optional<Coordinates> coordinates = std::nullopt,
                  ObjectKind kind = ObjectKind::Text);

    /** @brief Looks up an object by index. Returns nullptr when no such object exists. */
    const ExtractedObject* getObject(int index) const;

    /**
     * @brief Removes the object with the given index.
     * @return Number of objects removed (0 for a no-op delete).
     */
    int deleteObject(int index);

    /**
     * @brief Removes every object attached to a page.
     * @return Number of objects removed. Always 0 while the document has no pages.
     */
    int deletePageObjects(int page);

    /** @brief Objects attached to a page, in insertion order. */
    std::vector<const ExtractedObject*> getPageObjects(int page) const;

    bool hasPages() const { return m_pageCount > 0; }

    /**
     * @brief Classifies the file by extension and asks the counter for its page count.
     *
     * Unrecognized extensions yield FileType::Unknown and zero pages. Errors from
     * the counter for a recognized format propagate to the caller.
     *
     * @throws ToolingUnavailableError, RenderError
     */
    void detectType(const std::string& path, PageCounter& counter);

    /**
     * @brief Takes over the format, source path and page count detected on another Document.
     * Objects and the index counter of this Document are left untouched.
     */
    void adoptDetection(const Document& detected);

    /** @brief Forgets the detected format, the pages and all objects. The index counter keeps running. */
    void clear();

    FileType getFileType() const { return m_fileType; }

    /** @brief Format tag: the FileType name, or the upper-cased raw extension for unknown formats. */
    const std::string& getTypeTag() const { return m_typeTag; }

    const std::string& getSourcePath() const { return m_sourcePath; }
    int getPageCount() const { return m_pageCount; }
    int getNextIndex() const { return m_nextIndex; }
    const std::vector<ExtractedObject>& getObjects() const { return m_objects; }

private:
    FileType m_fileType = FileType::Unknown;
    std::string m_typeTag;
    std::string m_sourcePath;
    int m_pageCount = 0;
    int m_nextIndex = 0;
    std::vector<ExtractedObject> m_objects;
};

} // namespace smartocr::domain
