/*
 * FseqHeader.h - FSEQ sequence file header parsing
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

#ifndef FSEQHEADER_H
#define FSEQHEADER_H

namespace Eavesdrop {
namespace Fseq {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Why a sequence file could not be opened for frame access.
 */
enum class ParseError {
    BadMagic,       ///< not "PSEQ" or "FSEQ"
    Truncated,      ///< shorter than the fixed header
    InvalidHeader,  ///< zero channels, zero step time or data inside the header
    Compressed,     ///< v2 zstd/zlib data, frames are not addressable
    Unreadable      ///< file could not be opened at all
};

const char* parseErrorName(ParseError error);

// Structurally invalid sequence file
class FseqParseException : public std::exception
{
    public:
        FseqParseException(ParseError error, const std::string &why);
        ~FseqParseException() noexcept override = default;
        const char *what() const noexcept override;
        ParseError error() const noexcept { return m_error; }
    private:
        ParseError m_error;
        std::string m_why;
};

/**
 * @brief Decoded FSEQ fixed header plus variable header tags.
 *
 * Multi-byte fields are little-endian on disk. Version 1 files have a
 * 28 byte fixed header, version 2 files a 32 byte one. Frame data starts
 * at dataOffset and is recordCount records of recordSize bytes each.
 */
struct FrameFileHeader {
    static constexpr size_t V1_FIXED_SIZE = 28;
    static constexpr size_t V2_FIXED_SIZE = 32;
    static constexpr uint8_t COMPRESSION_NONE = 0;
    static constexpr uint8_t COMPRESSION_ZSTD = 1;
    static constexpr uint8_t COMPRESSION_ZLIB = 2;

    std::string magic;                // "PSEQ" (or the older "FSEQ")
    uint16_t dataOffset = 0;          // bytes 4-5
    uint8_t versionMinor = 0;         // byte 6
    uint8_t versionMajor = 0;         // byte 7
    uint16_t variableHeaderOffset = 0; // bytes 8-9
    uint32_t channelCount = 0;        // bytes 10-13, also the record size
    uint32_t frameCount = 0;          // bytes 14-17
    uint8_t stepTimeMs = 0;           // byte 18
    uint8_t flags = 0;                // byte 19
    uint8_t compressionType = 0;      // byte 20, low nibble
    uint8_t compressionBlocks = 0;    // byte 21
    uint8_t sparseRanges = 0;         // byte 22
    uint64_t uniqueId = 0;            // bytes 24-31

    std::map<std::string, std::string> variableHeaders;

    uint32_t recordSize() const { return channelCount; }
    uint32_t recordCount() const { return frameCount; }
    uint32_t frameDurationMs() const { return stepTimeMs; }
    size_t fixedHeaderSize() const { return versionMajor <= 1 ? V1_FIXED_SIZE : V2_FIXED_SIZE; }

    /**
     * @brief Total playback length in milliseconds.
     */
    uint64_t durationMs() const { return static_cast<uint64_t>(frameCount) * stepTimeMs; }

    /**
     * @brief Value of the "mf" (media file) tag, or empty.
     */
    std::string mediaFile() const;

    /**
     * @brief Parse a header from the start of a handler.
     *
     * Reads the fixed header and everything up to dataOffset. The handler
     * position afterwards is unspecified.
     *
     * @throws FseqParseException on any structural problem
     */
    static FrameFileHeader parse(IO::IOHandler& handler);

    /**
     * @brief Parse a header from bytes already in memory.
     */
    static FrameFileHeader parse(const uint8_t* data, size_t length);

    /**
     * @brief Decode "code, uint16 length, value" variable header records.
     *
     * Parsing stops at the first record that would run past the end; the
     * trailing NUL of a value is dropped.
     */
    static std::map<std::string, std::string> parseVariableHeaders(const uint8_t* data, size_t length);
};

} // namespace Fseq
} // namespace Eavesdrop

#endif // FSEQHEADER_H
