/**
 * @file Document.cpp
 * @brief Implementation of the Document registry.
 */

#include "domain/Document.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace smartocr::domain {

int Document::addObject(std::optional<int> page,
                        const std::string& content,
                        std::optional<Coordinates> coordinates,
                        ObjectKind kind) {
    const int index = m_nextIndex++;
    m_objects.push_back(ExtractedObject(index, page, kind, content, coordinates));
    return index;
}

const ExtractedObject* Document::getObject(int index) const {
    for (const auto& obj : m_objects) {
        if (obj.getIndex() == index) {
            return &obj;
        }
    }
    return nullptr;
}

int Document::deleteObject(int index) {
    const auto before = m_objects.size();
    m_objects.erase(std::remove_if(m_objects.begin(), m_objects.end(),
                                   [index](const ExtractedObject& obj) { return obj.getIndex() == index; }),
                    m_objects.end());
    return static_cast<int>(before - m_objects.size());
}

int Document::deletePageObjects(int page) {
    if (!hasPages()) {
        return 0;
    }

    const auto before = m_objects.size();
    m_objects.erase(std::remove_if(m_objects.begin(), m_objects.end(),
                                   [page](const ExtractedObject& obj) { return obj.getPage() == page; }),
                    m_objects.end());
    return static_cast<int>(before - m_objects.size());
}

std::vector<const ExtractedObject*> Document::getPageObjects(int page) const {
    std::vector<const ExtractedObject*> found;
    for (const auto& obj : m_objects) {
        if (obj.getPage() == page) {
            found.push_back(&obj);
        }
    }
    return found;
}

void Document::detectType(const std::string& path, PageCounter& counter) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::toupper(c); });

    m_sourcePath = path;
    m_fileType = FileTypeFromExtension(ext);

    if (m_fileType == FileType::Unknown) {
        m_typeTag = ext.empty() ? FileTypeToString(FileType::Unknown) : ext;
        m_pageCount = 0;
        return;
    }

    m_typeTag = FileTypeToString(m_fileType);
    m_pageCount = 0;
    m_pageCount = std::max(0, counter.countPages(path, m_fileType));
}

void Document::adoptDetection(const Document& detected) {
    m_fileType = detected.m_fileType;
    m_typeTag = detected.m_typeTag;
    m_sourcePath = detected.m_sourcePath;
    m_pageCount = detected.m_pageCount;
}

void Document::clear() {
    m_fileType = FileType::Unknown;
    m_typeTag.clear();
    m_sourcePath.clear();
    m_pageCount = 0;
    m_objects.clear();
}

} // namespace smartocr::domain
