/*
 * Base64.cpp - Base64 encoding/decoding utility (RFC 4648)
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Core {
namespace Utility {

static const char s_alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string Base64::encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::string Base64::encode(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= length) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        out += s_alphabet[(triple >> 18) & 0x3F];
        out += s_alphabet[(triple >> 12) & 0x3F];
        out += s_alphabet[(triple >> 6) & 0x3F];
        out += s_alphabet[triple & 0x3F];
        i += 3;
    }

    size_t remaining = length - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        out += s_alphabet[(triple >> 18) & 0x3F];
        out += s_alphabet[(triple >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        out += s_alphabet[(triple >> 18) & 0x3F];
        out += s_alphabet[(triple >> 12) & 0x3F];
        out += s_alphabet[(triple >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

std::vector<uint8_t> Base64::decode(const std::string& input) {
    std::vector<uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') {
            break;
        }
        int value = decodeChar(c);
        if (value < 0) {
            continue; // whitespace and junk are skipped
        }
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    return out;
}

} // namespace Utility
} // namespace Core
} // namespace Eavesdrop
