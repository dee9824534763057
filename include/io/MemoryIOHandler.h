/*
 * MemoryIOHandler.h - Memory-based IOHandler
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

// No direct includes - all includes should be in eavesdrop.h

namespace Eavesdrop {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Allows reading from a memory buffer as if it were a file. The buffer is
 * copied; the caller's data need not outlive the handler.
 */
class MemoryIOHandler : public IOHandler {
public:
    MemoryIOHandler(const void* data, size_t size);
    explicit MemoryIOHandler(std::vector<uint8_t> data);
    ~MemoryIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

private:
    std::vector<uint8_t> m_buffer;
    size_t m_pos = 0;
};

} // namespace IO
} // namespace Eavesdrop

#endif // MEMORYIOHANDLER_H
