/*
 * AudioFrame.cpp - PCM audio carried in sequence frame records
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Fseq {

size_t AudioFrame::samplesPerFrame(uint32_t recordSize)
{
    if (recordSize < MARKER_SIZE) {
        return 0;
    }
    return (recordSize - MARKER_SIZE) / 2;
}

uint32_t AudioFrame::sampleRate(uint32_t recordSize, uint32_t frameDurationMs)
{
    if (frameDurationMs == 0) {
        return 0;
    }
    return static_cast<uint32_t>(samplesPerFrame(recordSize) * 1000 / frameDurationMs);
}

size_t AudioFrame::samplesForRate(uint32_t sampleRate, uint32_t frameDurationMs)
{
    return static_cast<size_t>(static_cast<uint64_t>(sampleRate) * frameDurationMs / 1000);
}

bool AudioFrame::hasSyncMarker(const std::vector<uint8_t>& record)
{
    return record.size() >= MARKER_SIZE && record[0] == SYNC_HIGH && record[1] == SYNC_LOW;
}

std::vector<uint8_t> AudioFrame::encode(const int16_t* samples, size_t count, size_t samplesPerFrame)
{
    std::vector<uint8_t> record(recordSizeFor(samplesPerFrame), 0);
    record[0] = SYNC_HIGH;
    record[1] = SYNC_LOW;
    size_t n = std::min(count, samplesPerFrame);
    for (size_t i = 0; i < n; ++i) {
        uint16_t value = static_cast<uint16_t>(samples[i]);
        record[MARKER_SIZE + i * 2] = static_cast<uint8_t>(value >> 8);
        record[MARKER_SIZE + i * 2 + 1] = static_cast<uint8_t>(value & 0xFF);
    }
    return record;
}

std::vector<std::vector<uint8_t>> AudioFrame::encodeAll(const std::vector<int16_t>& samples, size_t samplesPerFrame)
{
    std::vector<std::vector<uint8_t>> records;
    if (samplesPerFrame == 0) {
        return records;
    }
    records.reserve((samples.size() + samplesPerFrame - 1) / samplesPerFrame);
    for (size_t start = 0; start < samples.size(); start += samplesPerFrame) {
        records.push_back(encode(samples.data() + start, samples.size() - start, samplesPerFrame));
    }
    return records;
}

std::optional<std::vector<int16_t>> AudioFrame::decode(const std::vector<uint8_t>& record)
{
    if (!hasSyncMarker(record)) {
        return std::nullopt;
    }
    std::vector<int16_t> samples(samplesPerFrame(static_cast<uint32_t>(record.size())));
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t value = static_cast<uint16_t>((record[MARKER_SIZE + i * 2] << 8) | record[MARKER_SIZE + i * 2 + 1]);
        samples[i] = static_cast<int16_t>(value);
    }
    return samples;
}

std::vector<int16_t> AudioFrame::mixToMono(const std::vector<int16_t>& interleaved, unsigned channels)
{
    if (channels <= 1) {
        return interleaved;
    }
    std::vector<int16_t> mono;
    mono.reserve(interleaved.size() / channels + 1);
    for (size_t i = 0; i < interleaved.size(); i += channels) {
        size_t n = std::min<size_t>(channels, interleaved.size() - i);
        int32_t sum = 0;
        for (size_t c = 0; c < n; ++c) {
            sum += interleaved[i + c];
        }
        // Round toward negative infinity
        int32_t avg = sum / static_cast<int32_t>(n);
        if (sum % static_cast<int32_t>(n) != 0 && sum < 0) {
            --avg;
        }
        mono.push_back(static_cast<int16_t>(avg));
    }
    return mono;
}

std::vector<int16_t> AudioFrame::resampleLinear(const std::vector<int16_t>& samples, uint32_t fromRate, uint32_t toRate)
{
    if (fromRate == toRate || fromRate == 0 || toRate == 0 || samples.empty()) {
        return samples;
    }
    const double ratio = static_cast<double>(fromRate) / toRate;
    const size_t outLength = static_cast<size_t>(static_cast<uint64_t>(samples.size()) * toRate / fromRate);
    std::vector<int16_t> out;
    out.reserve(outLength);
    for (size_t i = 0; i < outLength; ++i) {
        double srcPos = i * ratio;
        size_t idx = static_cast<size_t>(srcPos);
        double frac = srcPos - idx;
        double value;
        if (idx + 1 < samples.size()) {
            value = samples[idx] * (1.0 - frac) + samples[idx + 1] * frac;
        } else {
            value = samples[std::min(idx, samples.size() - 1)];
        }
        value = std::max(-32768.0, std::min(32767.0, value));
        out.push_back(static_cast<int16_t>(value));
    }
    return out;
}

} // namespace Fseq
} // namespace Eavesdrop
