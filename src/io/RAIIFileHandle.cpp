/*
 * RAIIFileHandle.cpp - RAII wrapper for FILE* handles
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace IO {

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(std::exchange(other.m_file, nullptr)) {
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = std::exchange(other.m_file, nullptr);
    }
    return *this;
}

bool RAIIFileHandle::open(const std::string& path, const char* mode) noexcept {
    close();
    m_file = fopen(path.c_str(), mode);
    if (!m_file) {
        int error = errno;
        Debug::log("io", "RAIIFileHandle: cannot open ", path, " (", mode, "): ", strerror(error));
        errno = error;
        return false;
    }
    return true;
}

bool RAIIFileHandle::writeAll(const std::vector<uint8_t>& bytes) noexcept {
    if (!m_file) {
        errno = EBADF;
        return false;
    }
    return fwrite(bytes.data(), 1, bytes.size(), m_file) == bytes.size();
}

int RAIIFileHandle::close() noexcept {
    if (!m_file)
        return 0;
    int result = fclose(m_file);
    m_file = nullptr;
    if (result != 0) {
        int error = errno;
        Debug::log("io", "RAIIFileHandle: fclose failed: ", strerror(error));
        errno = error;
    }
    return result;
}

} // namespace IO
} // namespace Eavesdrop
