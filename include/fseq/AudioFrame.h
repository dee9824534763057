/*
 * AudioFrame.h - PCM audio carried in sequence frame records
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOFRAME_H
#define AUDIOFRAME_H

namespace Eavesdrop {
namespace Fseq {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Codec for audio records: [0xAA, 0x55, hi0, lo0, hi1, lo1, ...]
 *
 * Two sync marker bytes followed by signed 16-bit samples, big-endian.
 * One record holds exactly one frame period of mono audio.
 */
class AudioFrame {
public:
    static constexpr uint8_t SYNC_HIGH = 0xAA;
    static constexpr uint8_t SYNC_LOW = 0x55;
    static constexpr size_t MARKER_SIZE = 2;

    /**
     * @brief Number of whole samples a record of this size carries.
     */
    static size_t samplesPerFrame(uint32_t recordSize);

    /**
     * @brief Sample rate implied by the record layout and frame period.
     */
    static uint32_t sampleRate(uint32_t recordSize, uint32_t frameDurationMs);

    /**
     * @brief Samples per frame for a target rate, truncated.
     */
    static size_t samplesForRate(uint32_t sampleRate, uint32_t frameDurationMs);

    static uint32_t recordSizeFor(size_t samplesPerFrame) {
        return static_cast<uint32_t>(MARKER_SIZE + samplesPerFrame * 2);
    }

    static bool hasSyncMarker(const std::vector<uint8_t>& record);

    /**
     * @brief Encode one record; short input is padded with silence.
     */
    static std::vector<uint8_t> encode(const int16_t* samples, size_t count, size_t samplesPerFrame);

    /**
     * @brief Split a whole signal into records, the last one silence padded.
     */
    static std::vector<std::vector<uint8_t>> encodeAll(const std::vector<int16_t>& samples, size_t samplesPerFrame);

    /**
     * @brief Decode the samples of a record.
     * @return std::nullopt if the record does not start with the sync marker
     */
    static std::optional<std::vector<int16_t>> decode(const std::vector<uint8_t>& record);

    /**
     * @brief Average interleaved channels down to one.
     */
    static std::vector<int16_t> mixToMono(const std::vector<int16_t>& interleaved, unsigned channels);

    /**
     * @brief Linear interpolation resampler.
     */
    static std::vector<int16_t> resampleLinear(const std::vector<int16_t>& samples, uint32_t fromRate, uint32_t toRate);
};

} // namespace Fseq
} // namespace Eavesdrop

#endif // AUDIOFRAME_H
