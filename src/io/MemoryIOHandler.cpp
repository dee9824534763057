/*
 * MemoryIOHandler.cpp - Memory-based IOHandler
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace IO {

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size)
    : m_buffer(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size) {
}

MemoryIOHandler::MemoryIOHandler(std::vector<uint8_t> data)
    : m_buffer(std::move(data)) {
}

MemoryIOHandler::~MemoryIOHandler() {
    close();
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    if (m_closed || !buffer || size == 0 || count == 0) {
        return 0;
    }

    size_t available = m_pos < m_buffer.size() ? m_buffer.size() - m_pos : 0;
    size_t elements = std::min(count, available / size);
    if (elements < count) {
        m_eof = true;
    }
    if (elements > 0) {
        std::memcpy(buffer, m_buffer.data() + m_pos, elements * size);
        m_pos += elements * size;
    }
    return elements;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    if (m_closed) {
        return -1;
    }

    off_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<off_t>(m_pos); break;
        case SEEK_END: base = static_cast<off_t>(m_buffer.size()); break;
        default:
            updateErrorState(EINVAL, "MemoryIOHandler::seek() - bad whence");
            return -1;
    }

    off_t target = base + offset;
    if (target < 0) {
        updateErrorState(EINVAL, "MemoryIOHandler::seek() - negative position");
        return -1;
    }
    // Seeking past the end is allowed, as with fseek; reads there return 0
    m_pos = static_cast<size_t>(target);
    m_eof = false;
    return 0;
}

off_t MemoryIOHandler::tell() {
    return m_closed ? -1 : static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    m_closed = true;
    return 0;
}

bool MemoryIOHandler::eof() {
    return m_closed || m_eof;
}

off_t MemoryIOHandler::getFileSize() {
    return static_cast<off_t>(m_buffer.size());
}

} // namespace IO
} // namespace Eavesdrop
