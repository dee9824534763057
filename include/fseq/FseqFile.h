/*
 * FseqFile.h - Frame-addressed reader for uncompressed sequence files
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FSEQFILE_H
#define FSEQFILE_H

namespace Eavesdrop {
namespace Fseq {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Open sequence file with random access to fixed-size frame records.
 *
 * The header is parsed once at open and cached for the life of the object.
 * Reading past the last record is an ordinary end-of-data result, never an
 * exception. An FseqFile is not thread-safe; the frame loop owns it.
 */
class FseqFile {
public:
    /**
     * @brief Open and parse a file on disk.
     * @throws FseqParseException (Unreadable if the file cannot be opened)
     */
    static std::unique_ptr<FseqFile> open(const std::string& path);

    /**
     * @brief Parse sequence data from an existing handler.
     * @param handler Source, owned by the returned file from now on
     * @param name Name used in log output and reported as the audio file
     * @throws FseqParseException
     */
    static std::unique_ptr<FseqFile> open(std::unique_ptr<IO::IOHandler> handler, const std::string& name);

    ~FseqFile();

    FseqFile(const FseqFile&) = delete;
    FseqFile& operator=(const FseqFile&) = delete;

    /**
     * @brief Read one record.
     *
     * Negative indices read frame 0.
     * @return exactly recordSize bytes, or std::nullopt at end of data
     */
    std::optional<std::vector<uint8_t>> readFrame(int64_t frameIndex);

    /**
     * @brief Map a millisecond position to the nearest valid frame index.
     *
     * Positions before the start or past the end clamp to the first or
     * last frame.
     */
    int64_t frameIndexForPosition(double positionMs) const;

    /**
     * @brief readFrame(frameIndexForPosition(positionMs))
     */
    std::optional<std::vector<uint8_t>> readFrameAt(double positionMs);

    /**
     * @brief Release the underlying handler. Safe to call more than once.
     */
    void close();

    bool isOpen() const { return m_handler != nullptr; }
    const FrameFileHeader& header() const { return m_header; }
    const std::string& name() const { return m_name; }

private:
    FseqFile(std::unique_ptr<IO::IOHandler> handler, FrameFileHeader header, std::string name);

    std::unique_ptr<IO::IOHandler> m_handler;
    FrameFileHeader m_header;
    std::string m_name;
};

} // namespace Fseq
} // namespace Eavesdrop

#endif // FSEQFILE_H
