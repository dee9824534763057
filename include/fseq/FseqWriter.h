/*
 * FseqWriter.h - Writer for uncompressed version 2 sequence files
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FSEQWRITER_H
#define FSEQWRITER_H

namespace Eavesdrop {
namespace Fseq {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Builds a "PSEQ" v2.0 file with no compression and no sparse ranges.
 *
 * Layout: 32 byte fixed header, variable header tags in insertion order,
 * zero padding to a 4 byte boundary, then the frame records.
 */
class FseqWriter {
public:
    FseqWriter(uint32_t channelCount, uint8_t stepTimeMs);

    /**
     * @brief Add or replace a variable header tag.
     * @throws std::invalid_argument if code is not exactly two characters
     */
    void setTag(const std::string& code, const std::string& value);

    /**
     * @brief Append one record.
     * @throws std::invalid_argument if the record is not channelCount bytes
     */
    void addFrame(const std::vector<uint8_t>& frame);

    size_t frameCount() const { return m_frames.size() / m_channel_count; }

    /**
     * @brief Offset of the first record in the encoded file.
     * @throws std::length_error if the tags do not fit a 16 bit offset
     */
    uint16_t dataOffset() const;

    std::vector<uint8_t> toBytes() const;

    /**
     * @brief Write the encoded file to disk.
     * @throws Core::IOException on any write failure
     */
    void write(const std::string& path) const;

private:
    std::vector<uint8_t> encodeVariableHeaders() const;

    uint32_t m_channel_count;
    uint8_t m_step_time_ms;
    std::vector<std::pair<std::string, std::string>> m_tags;
    std::vector<uint8_t> m_frames;
};

} // namespace Fseq
} // namespace Eavesdrop

#endif // FSEQWRITER_H
