/*
 * WavReader.h - RIFF/WAVE PCM reader for the sequence encoder
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef WAVREADER_H
#define WAVREADER_H

namespace Eavesdrop {
namespace IO {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Interleaved 16-bit PCM.
 */
struct PcmAudio {
    uint32_t sampleRate = 0;
    unsigned channels = 0;
    std::vector<int16_t> samples;

    size_t frameCount() const { return channels ? samples.size() / channels : 0; }
};

/**
 * @brief Reads integer PCM WAVE files (8, 16, 24 or 32 bit) as 16-bit.
 *
 * Chunks other than "fmt " and "data" are skipped. Wider samples keep
 * their top 16 bits; 8-bit unsigned samples are re-centred.
 */
class WavReader {
public:
    /**
     * @throws Core::BadFormatException if the data is not integer PCM WAVE
     */
    static PcmAudio read(IOHandler& handler);

private:
    static constexpr uint32_t RIFF_FOURCC = 0x52494646; // "RIFF"
    static constexpr uint32_t WAVE_FOURCC = 0x57415645; // "WAVE"
    static constexpr uint32_t FMT_FOURCC  = 0x666d7420; // "fmt "
    static constexpr uint32_t DATA_FOURCC = 0x64617461; // "data"
    static constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
    static constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;
};

} // namespace IO
} // namespace Eavesdrop

#endif // WAVREADER_H
