/**
 * @file Base64.hpp
 * @brief Base64 encoding for embedding images in JSON requests.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace smartocr::infrastructure {

/** @brief Standard (RFC 4648) base64 with padding. */
std::string Base64Encode(const std::vector<std::uint8_t>& data);

} // namespace smartocr::infrastructure
