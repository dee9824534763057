/*
 * exceptions.h - Various exception classes.
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace Eavesdrop {
namespace Core {

// General file I/O failure outside of sequence parsing (log files, output files, etc.)
class IOException : public std::exception
{
    public:
        explicit IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

// Correct format, but incorrect data for whatever reason (file corrupt, unsupported encoding, etc.)
class BadFormatException : public std::exception
{
    public:
        explicit BadFormatException(const std::string &why);
        ~BadFormatException() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

// Malformed configuration file or command line value
class ConfigException : public std::exception
{
    public:
        ConfigException(const std::string &key, const std::string &why);
        ~ConfigException() noexcept override = default;
        const char *what() const noexcept override;
        const std::string &key() const noexcept { return m_key; }
    private:
        std::string m_key;
        std::string m_why;
};

} // namespace Core
} // namespace Eavesdrop

#endif // EXCEPTIONS_H
