/*
 * FileIOHandler.cpp - Implementation for the file I/O handler.
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
namespace IO {
namespace File {

/**
 * @brief Constructs a FileIOHandler for a given local file path.
 *
 * This opens the specified file in binary read mode.
 *
 * @param path The file path to open
 * @throws Core::IOException if the file cannot be opened
 */
FileIOHandler::FileIOHandler(const std::string& path) : m_file_path(path) {
    Debug::log("io", "FileIOHandler::FileIOHandler() - Opening: ", path);

    if (!m_file_handle.open(path, "rb")) {
        int error = errno;
        m_closed = true;
        updateErrorState(error, getErrorMessage(error, "Could not open file " + path));
        throw Core::IOException("Could not open file: " + path + " (" + strerror(error) + ")");
    }
}

FileIOHandler::~FileIOHandler() {
    close();
}

size_t FileIOHandler::read(void* buffer, size_t size, size_t count) {
    if (m_closed || !buffer || size == 0 || count == 0) {
        return 0;
    }

    size_t result = fread(buffer, size, count, m_file_handle.get());
    if (result < count) {
        if (feof(m_file_handle.get())) {
            m_eof = true;
        } else if (ferror(m_file_handle.get())) {
            updateErrorState(errno, getErrorMessage(errno, "read failed on " + m_file_path));
            clearerr(m_file_handle.get());
        }
    }
    return result;
}

int FileIOHandler::seek(off_t offset, int whence) {
    if (m_closed) {
        return -1;
    }
    if (fseeko(m_file_handle.get(), offset, whence) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "seek failed on " + m_file_path));
        return -1;
    }
    m_eof = false;
    return 0;
}

off_t FileIOHandler::tell() {
    if (m_closed) {
        return -1;
    }
    return ftello(m_file_handle.get());
}

int FileIOHandler::close() {
    if (m_closed) {
        return 0;
    }
    m_closed = true;
    Debug::log("io", "FileIOHandler::close() - Closing: ", m_file_path);
    return m_file_handle.close();
}

bool FileIOHandler::eof() {
    return m_closed || m_eof;
}

off_t FileIOHandler::getFileSize() {
    if (m_cached_file_size >= 0) {
        return m_cached_file_size;
    }
    if (m_closed) {
        return -1;
    }

    struct stat st;
    if (fstat(fileno(m_file_handle.get()), &st) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fstat failed on " + m_file_path));
        return -1;
    }
    m_cached_file_size = st.st_size;
    return m_cached_file_size;
}

} // namespace File
} // namespace IO
} // namespace Eavesdrop
