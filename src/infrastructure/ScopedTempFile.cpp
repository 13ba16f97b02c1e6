/**
 * @file ScopedTempFile.cpp
 * @brief Implementation of the scoped temp file helpers.
 */

#include "infrastructure/ScopedTempFile.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unistd.h>

namespace smartocr::infrastructure {

namespace fs = std::filesystem;

ScopedTempFile::ScopedTempFile(const std::string& suffix) {
    std::string pattern = (fs::temp_directory_path() / "smartocr-XXXXXX").string() + suffix;
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::runtime_error("Failed to create temporary file: " + std::string(std::strerror(errno)));
    }
    ::close(fd);
    m_path = buffer.data();
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedTempFile] Failed to delete temp file " << m_path << ": " << ec.message() << std::endl;
    }
}

void ScopedTempFile::write(const std::vector<std::uint8_t>& bytes) {
    std::ofstream ofs(m_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open temporary file: " + m_path.string());
    }
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (ofs.fail()) {
        throw std::runtime_error("Failed to write temporary file: " + m_path.string());
    }
}

ScopedTempDirectory::ScopedTempDirectory(const std::string& prefix) {
    std::string pattern = (fs::temp_directory_path() / (prefix + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create temporary directory: " + std::string(std::strerror(errno)));
    }
    m_path = buffer.data();
}

ScopedTempDirectory::~ScopedTempDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedTempDirectory] Failed to delete " << m_path << ": " << ec.message() << std::endl;
    }
}

std::vector<std::uint8_t> ReadFileBytes(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace smartocr::infrastructure
