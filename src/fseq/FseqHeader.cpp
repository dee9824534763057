/*
 * FseqHeader.cpp - FSEQ sequence file header parsing
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Fseq {

namespace {

template<typename T>
T readLE(const uint8_t* p)
{
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(p[i]) << (8 * i);
    }
    return value;
}

// Fixed header fields only; variable headers are filled in by the caller.
FrameFileHeader decodeFixed(const uint8_t* data, size_t length)
{
    if (length < 4) {
        throw FseqParseException(ParseError::Truncated,
                                 "file is " + std::to_string(length) + " bytes, too short for a sequence header");
    }

    FrameFileHeader header;
    header.magic.assign(reinterpret_cast<const char*>(data), 4);
    if (header.magic != "PSEQ" && header.magic != "FSEQ") {
        throw FseqParseException(ParseError::BadMagic, "not a sequence file (magic is not PSEQ/FSEQ)");
    }

    if (length < 8) {
        throw FseqParseException(ParseError::Truncated, "fixed header truncated before the version field");
    }
    header.dataOffset = readLE<uint16_t>(data + 4);
    header.versionMinor = data[6];
    header.versionMajor = data[7];

    if (length < header.fixedHeaderSize()) {
        throw FseqParseException(ParseError::Truncated,
                                 "fixed header needs " + std::to_string(header.fixedHeaderSize()) +
                                 " bytes, got " + std::to_string(length));
    }

    header.variableHeaderOffset = readLE<uint16_t>(data + 8);
    header.channelCount = readLE<uint32_t>(data + 10);
    header.frameCount = readLE<uint32_t>(data + 14);
    header.stepTimeMs = data[18];
    header.flags = data[19];

    if (header.versionMajor >= 2) {
        header.compressionType = data[20] & 0x0F;
        header.compressionBlocks = data[21];
        header.sparseRanges = data[22];
        header.uniqueId = readLE<uint64_t>(data + 24);
    }

    if (header.channelCount == 0) {
        throw FseqParseException(ParseError::InvalidHeader, "channel count is zero");
    }
    if (header.stepTimeMs == 0) {
        throw FseqParseException(ParseError::InvalidHeader, "frame step time is zero");
    }
    if (header.dataOffset < header.fixedHeaderSize()) {
        throw FseqParseException(ParseError::InvalidHeader,
                                 "data offset " + std::to_string(header.dataOffset) + " lies inside the fixed header");
    }
    if (header.compressionType != FrameFileHeader::COMPRESSION_NONE) {
        throw FseqParseException(ParseError::Compressed,
                                 "compression type " + std::to_string(header.compressionType) +
                                 " is not frame-addressable");
    }
    if (header.sparseRanges != 0) {
        Debug::log("fseq", "FrameFileHeader: file declares ", static_cast<int>(header.sparseRanges),
                   " sparse ranges, reading records as ", header.channelCount, " contiguous channels");
    }

    return header;
}

// Where the variable header records begin
size_t variableHeaderStart(const FrameFileHeader& header)
{
    size_t start = header.variableHeaderOffset;
    if (start < header.fixedHeaderSize() || start > header.dataOffset) {
        start = header.fixedHeaderSize();
    }
    return start;
}

} // namespace

const char* parseErrorName(ParseError error)
{
    switch (error) {
        case ParseError::BadMagic: return "BadMagic";
        case ParseError::Truncated: return "Truncated";
        case ParseError::InvalidHeader: return "InvalidHeader";
        case ParseError::Compressed: return "Compressed";
        case ParseError::Unreadable: return "Unreadable";
    }
    return "Unknown";
}

FseqParseException::FseqParseException(ParseError error, const std::string &why)
    : m_error(error), m_why(std::string(parseErrorName(error)) + ": " + why)
{
}

const char *FseqParseException::what() const noexcept
{
    return m_why.c_str();
}

std::string FrameFileHeader::mediaFile() const
{
    auto it = variableHeaders.find("mf");
    return it == variableHeaders.end() ? std::string() : it->second;
}

std::map<std::string, std::string> FrameFileHeader::parseVariableHeaders(const uint8_t* data, size_t length)
{
    std::map<std::string, std::string> tags;
    size_t pos = 0;
    while (pos + 4 <= length) {
        std::string code(reinterpret_cast<const char*>(data + pos), 2);
        uint16_t valueLength = readLE<uint16_t>(data + pos + 2);
        // Alignment padding before the frame data
        if (code[0] == '\0' && code[1] == '\0') {
            break;
        }
        if (pos + 4 + valueLength > length) {
            Debug::log("fseq", "FrameFileHeader: variable header '", code, "' overruns header area, ignored");
            break;
        }
        std::string value(reinterpret_cast<const char*>(data + pos + 4), valueLength);
        while (!value.empty() && value.back() == '\0') {
            value.pop_back();
        }
        tags[code] = value;
        pos += 4 + valueLength;
    }
    return tags;
}

FrameFileHeader FrameFileHeader::parse(const uint8_t* data, size_t length)
{
    FrameFileHeader header = decodeFixed(data, length);
    size_t start = variableHeaderStart(header);
    size_t end = std::min<size_t>(header.dataOffset, length);
    if (end > start) {
        header.variableHeaders = parseVariableHeaders(data + start, end - start);
    }
    return header;
}

FrameFileHeader FrameFileHeader::parse(IO::IOHandler& handler)
{
    uint8_t fixed[V2_FIXED_SIZE];
    size_t got = handler.readAt(0, fixed, sizeof(fixed));
    FrameFileHeader header = decodeFixed(fixed, got);

    size_t start = variableHeaderStart(header);
    if (header.dataOffset > start) {
        std::vector<uint8_t> area(header.dataOffset - start);
        size_t areaLength = handler.readAt(static_cast<off_t>(start), area.data(), area.size());
        header.variableHeaders = parseVariableHeaders(area.data(), areaLength);
    }

    Debug::log("fseq", "FrameFileHeader: v", static_cast<int>(header.versionMajor), ".",
               static_cast<int>(header.versionMinor), " ", header.channelCount, " channels x ",
               header.frameCount, " frames @ ", static_cast<int>(header.stepTimeMs), "ms, data at ",
               header.dataOffset);
    return header;
}

} // namespace Fseq
} // namespace Eavesdrop
