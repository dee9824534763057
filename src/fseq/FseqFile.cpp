/*
 * FseqFile.cpp - Frame-addressed reader for uncompressed sequence files
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Fseq {

std::unique_ptr<FseqFile> FseqFile::open(const std::string& path)
{
    std::unique_ptr<IO::IOHandler> handler;
    try {
        handler = std::make_unique<IO::File::FileIOHandler>(path);
    } catch (const Core::IOException& e) {
        throw FseqParseException(ParseError::Unreadable, e.what());
    }
    return open(std::move(handler), path);
}

std::unique_ptr<FseqFile> FseqFile::open(std::unique_ptr<IO::IOHandler> handler, const std::string& name)
{
    if (!handler) {
        throw FseqParseException(ParseError::Unreadable, "no data source for " + name);
    }
    FrameFileHeader header = FrameFileHeader::parse(*handler);
    Debug::log("fseq", "FseqFile: opened ", name);
    return std::unique_ptr<FseqFile>(new FseqFile(std::move(handler), std::move(header), name));
}

FseqFile::FseqFile(std::unique_ptr<IO::IOHandler> handler, FrameFileHeader header, std::string name)
    : m_handler(std::move(handler)), m_header(std::move(header)), m_name(std::move(name))
{
}

FseqFile::~FseqFile()
{
    close();
}

std::optional<std::vector<uint8_t>> FseqFile::readFrame(int64_t frameIndex)
{
    if (!m_handler) {
        return std::nullopt;
    }
    if (frameIndex < 0) {
        frameIndex = 0;
    }
    if (frameIndex >= static_cast<int64_t>(m_header.recordCount())) {
        return std::nullopt;
    }

    const size_t recordSize = m_header.recordSize();
    const off_t offset = static_cast<off_t>(m_header.dataOffset) +
                         static_cast<off_t>(frameIndex) * static_cast<off_t>(recordSize);

    std::vector<uint8_t> record(recordSize);
    size_t got = m_handler->readAt(offset, record.data(), recordSize);
    if (got < recordSize) {
        DEBUG_LOG_LAZY("fseq", "FseqFile: short read at frame ", frameIndex, " (", got, "/", recordSize,
                       " bytes), end of data");
        return std::nullopt;
    }
    return record;
}

int64_t FseqFile::frameIndexForPosition(double positionMs) const
{
    const int64_t last = static_cast<int64_t>(m_header.recordCount()) - 1;
    if (last < 0 || !(positionMs > 0.0)) {
        return 0;
    }
    double index = std::floor(positionMs / m_header.frameDurationMs());
    if (index >= static_cast<double>(last)) {
        return last;
    }
    return static_cast<int64_t>(index);
}

std::optional<std::vector<uint8_t>> FseqFile::readFrameAt(double positionMs)
{
    return readFrame(frameIndexForPosition(positionMs));
}

void FseqFile::close()
{
    if (m_handler) {
        if (m_handler->close() != 0) {
            Debug::log("fseq", "FseqFile: error closing ", m_name, ": errno ", m_handler->getLastError());
        }
        m_handler.reset();
        Debug::log("fseq", "FseqFile: closed ", m_name);
    }
}

} // namespace Fseq
} // namespace Eavesdrop
