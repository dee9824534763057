/*
 * FileIOHandler.h - Local file I/O handler
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in eavesdrop.h

namespace Eavesdrop {
namespace IO {
namespace File {

/**
 * @brief IOHandler over a local file opened read-only in binary mode.
 */
class FileIOHandler : public IOHandler {
public:
    /**
     * @brief Open the file at path.
     * @throws Core::IOException if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path);
    ~FileIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

    const std::string& path() const { return m_file_path; }

private:
    std::string m_file_path;
    RAIIFileHandle m_file_handle;
    off_t m_cached_file_size = -1;
};

} // namespace File
} // namespace IO
} // namespace Eavesdrop

#endif // FILEIOHANDLER_H
