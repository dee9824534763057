/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in eavesdrop.h

namespace Eavesdrop {
namespace IO {

/**
 * @brief Base IOHandler interface for random-access reads
 *
 * Sequence files are read through this interface so the frame reader works
 * the same over a local file and over an in-memory buffer. Handlers are
 * owned by exactly one reader and are not shared between threads.
 */
class IOHandler {
public:
    IOHandler();
    virtual ~IOHandler();

    /// fread() semantics: returns the number of whole elements read
    virtual size_t read(void* buffer, size_t size, size_t count) = 0;

    /// fseeko() semantics: 0 on success, -1 on failure
    virtual int seek(off_t offset, int whence) = 0;

    virtual off_t tell() = 0;
    virtual int close() = 0;
    virtual bool eof() = 0;

    /// Total size in bytes, -1 if unknown
    virtual off_t getFileSize() = 0;

    /// errno-style code of the last failure, 0 if none
    int getLastError() const;

    bool isClosed() const;

    /**
     * @brief Read up to length bytes starting at an absolute offset.
     *
     * Frame records are fetched this way: one seek, then reads until the
     * record is complete or the source runs out.
     * @return Bytes actually read; less than length at end of data
     */
    size_t readAt(off_t offset, void* buffer, size_t length);

protected:
    static std::string getErrorMessage(int error_code, const std::string& context = "");
    void updateErrorState(int error_code, const std::string& error_message = "");

    bool m_closed = false;
    bool m_eof = false;
    int m_error = 0;
};

} // namespace IO
} // namespace Eavesdrop

#endif // IOHANDLER_H
