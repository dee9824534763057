/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in eavesdrop.h

namespace Eavesdrop {
namespace IO {

/**
 * @brief Owning stdio FILE* that is closed on every exit path
 *
 * Readers hold their handle through FileIOHandler; the sequence writer
 * uses it directly so a failed write never leaks the stream.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept = default;
    ~RAIIFileHandle() noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Close any current handle, then fopen() path with mode
     * @return false with errno set by fopen() on failure
     */
    bool open(const std::string& path, const char* mode) noexcept;

    /**
     * @brief Write the whole buffer
     * @return false on a short write, with errno from fwrite()
     */
    bool writeAll(const std::vector<uint8_t>& bytes) noexcept;

    /// fclose() result; 0 when nothing was open
    int close() noexcept;

    FILE* get() const noexcept { return m_file; }
    explicit operator bool() const noexcept { return m_file != nullptr; }

private:
    FILE* m_file = nullptr;
};

} // namespace IO
} // namespace Eavesdrop

#endif // RAIIFILEHANDLE_H
