/*
 * IOHandler.cpp - Abstract I/O handler base implementation
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

IOHandler::IOHandler() = default;

IOHandler::~IOHandler() = default;

int IOHandler::getLastError() const {
    return m_error;
}

bool IOHandler::isClosed() const {
    return m_closed;
}

size_t IOHandler::readAt(off_t offset, void* buffer, size_t length) {
    if (m_closed || offset < 0) {
        return 0;
    }
    if (seek(offset, SEEK_SET) != 0) {
        return 0;
    }
    size_t total = 0;
    auto* out = static_cast<uint8_t*>(buffer);
    // fread may return short counts before end of file on some handlers
    while (total < length) {
        size_t got = read(out + total, 1, length - total);
        if (got == 0) {
            break;
        }
        total += got;
    }
    return total;
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message = context.empty() ? "" : context + ": ";
    message += strerror(error_code);
    message += " (errno " + std::to_string(error_code) + ")";
    return message;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error = error_code;
    if (error_code != 0) {
        Debug::log("io", "IOHandler: ", error_message.empty() ? getErrorMessage(error_code) : error_message);
    }
}

} // namespace IO
} // namespace Eavesdrop
