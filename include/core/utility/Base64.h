/*
 * Base64.h - Base64 encoding/decoding utility
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef EAVESDROP_CORE_UTILITY_BASE64_H
#define EAVESDROP_CORE_UTILITY_BASE64_H

#include <string>
#include <vector>
#include <cstdint>

namespace Eavesdrop {
namespace Core {
namespace Utility {

/**
 * @brief RFC 4648 Base64 with the standard alphabet and '=' padding
 *
 * Frame records travel on the event stream in this encoding.
 */
class Base64 {
public:
    static std::string encode(const std::vector<uint8_t>& data);
    static std::string encode(const uint8_t* data, size_t length);

    /**
     * Characters outside the alphabet (CR, LF, spaces) are skipped, missing
     * padding is tolerated and decoding stops at the first '='.
     */
    static std::vector<uint8_t> decode(const std::string& input);
};

} // namespace Utility
} // namespace Core
} // namespace Eavesdrop

#endif // EAVESDROP_CORE_UTILITY_BASE64_H
