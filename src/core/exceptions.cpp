/*
 * exceptions.cpp - Exception classes code
 * This file is part of Eavesdrop.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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
namespace Core {

/**
 * @brief Constructs an IOException.
 *
 * Used for file operations that are not sequence parsing, such as opening
 * the log file or writing a generated sequence.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

BadFormatException::BadFormatException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

const char *BadFormatException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs a ConfigException.
 *
 * Thrown when a configuration key carries a value that cannot be converted
 * or is out of range. Unknown keys are not an error.
 * @param key The offending configuration key.
 * @param why A string describing what is wrong with the value.
 */
ConfigException::ConfigException(const std::string &key, const std::string &why)
    : std::exception(), m_key(key), m_why("config key '" + key + "': " + why) {
  // ctor
}

const char *ConfigException::what() const noexcept { return m_why.c_str(); }

} // namespace Core
} // namespace Eavesdrop
