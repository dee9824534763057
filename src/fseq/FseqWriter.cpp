/*
 * FseqWriter.cpp - Writer for uncompressed version 2 sequence files
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Fseq {

namespace {

template<typename T>
void appendLE(std::vector<uint8_t>& out, T value)
{
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

} // namespace

FseqWriter::FseqWriter(uint32_t channelCount, uint8_t stepTimeMs)
    : m_channel_count(channelCount), m_step_time_ms(stepTimeMs)
{
    if (channelCount == 0) {
        throw std::invalid_argument("FseqWriter: channel count must be non-zero");
    }
    if (stepTimeMs == 0) {
        throw std::invalid_argument("FseqWriter: step time must be non-zero");
    }
}

void FseqWriter::setTag(const std::string& code, const std::string& value)
{
    if (code.size() != 2) {
        throw std::invalid_argument("FseqWriter: tag code must be two characters: '" + code + "'");
    }
    for (auto& tag : m_tags) {
        if (tag.first == code) {
            tag.second = value;
            return;
        }
    }
    m_tags.emplace_back(code, value);
}

void FseqWriter::addFrame(const std::vector<uint8_t>& frame)
{
    if (frame.size() != m_channel_count) {
        throw std::invalid_argument("FseqWriter: frame is " + std::to_string(frame.size()) +
                                    " bytes, expected " + std::to_string(m_channel_count));
    }
    m_frames.insert(m_frames.end(), frame.begin(), frame.end());
}

std::vector<uint8_t> FseqWriter::encodeVariableHeaders() const
{
    std::vector<uint8_t> out;
    for (const auto& tag : m_tags) {
        // Values are stored NUL terminated
        size_t length = tag.second.size() + 1;
        if (length > 0xFFFF) {
            throw std::length_error("FseqWriter: tag '" + tag.first + "' value too long");
        }
        out.insert(out.end(), tag.first.begin(), tag.first.end());
        appendLE<uint16_t>(out, static_cast<uint16_t>(length));
        out.insert(out.end(), tag.second.begin(), tag.second.end());
        out.push_back(0);
    }
    return out;
}

uint16_t FseqWriter::dataOffset() const
{
    size_t offset = FrameFileHeader::V2_FIXED_SIZE + encodeVariableHeaders().size();
    offset += (4 - (offset % 4)) % 4;
    if (offset > 0xFFFF) {
        throw std::length_error("FseqWriter: variable headers exceed the 16 bit data offset");
    }
    return static_cast<uint16_t>(offset);
}

std::vector<uint8_t> FseqWriter::toBytes() const
{
    const std::vector<uint8_t> tags = encodeVariableHeaders();
    const uint16_t offset = dataOffset();
    const uint32_t frames = static_cast<uint32_t>(frameCount());

    std::vector<uint8_t> out;
    out.reserve(offset + m_frames.size());
    out.push_back('P');
    out.push_back('S');
    out.push_back('E');
    out.push_back('Q');
    appendLE<uint16_t>(out, offset);
    out.push_back(0);  // minor version
    out.push_back(2);  // major version
    appendLE<uint16_t>(out, static_cast<uint16_t>(FrameFileHeader::V2_FIXED_SIZE));
    appendLE<uint32_t>(out, m_channel_count);
    appendLE<uint32_t>(out, frames);
    out.push_back(m_step_time_ms);
    out.push_back(0);  // flags
    out.push_back(FrameFileHeader::COMPRESSION_NONE);
    out.push_back(0);  // compression blocks
    out.push_back(0);  // sparse ranges
    out.push_back(0);  // reserved
    appendLE<uint64_t>(out, 0);  // unique id

    out.insert(out.end(), tags.begin(), tags.end());
    out.resize(offset, 0);
    out.insert(out.end(), m_frames.begin(), m_frames.end());
    return out;
}

void FseqWriter::write(const std::string& path) const
{
    const std::vector<uint8_t> bytes = toBytes();

    IO::RAIIFileHandle file;
    if (!file.open(path, "wb")) {
        throw Core::IOException("Could not create " + path + ": " + strerror(errno));
    }
    if (!file.writeAll(bytes)) {
        throw Core::IOException("Short write to " + path + ": " + strerror(errno));
    }
    if (file.close() != 0) {
        throw Core::IOException("Could not finish writing " + path + ": " + strerror(errno));
    }
    Debug::log("fseq", "FseqWriter: wrote ", path, " (", frameCount(), " frames, ", bytes.size(), " bytes)");
}

} // namespace Fseq
} // namespace Eavesdrop
