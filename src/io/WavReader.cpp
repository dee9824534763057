/*
 * WavReader.cpp - RIFF/WAVE PCM reader for the sequence encoder
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace IO {

namespace {

uint32_t readBE32(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

uint32_t readLE32(const uint8_t* p)
{
    return p[0] | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t readLE16(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

} // namespace

PcmAudio WavReader::read(IOHandler& handler)
{
    uint8_t header[12];
    if (handler.readAt(0, header, sizeof(header)) != sizeof(header)) {
        throw Core::BadFormatException("WAVE file too short");
    }
    // FourCC is always read as big-endian by convention
    if (readBE32(header) != RIFF_FOURCC || readBE32(header + 8) != WAVE_FOURCC) {
        throw Core::BadFormatException("not a RIFF/WAVE file");
    }

    PcmAudio audio;
    uint16_t bitsPerSample = 0;
    bool haveFormat = false;
    off_t pos = 12;

    while (true) {
        uint8_t chunkHeader[8];
        if (handler.readAt(pos, chunkHeader, sizeof(chunkHeader)) != sizeof(chunkHeader)) {
            break;
        }
        const uint32_t fourcc = readBE32(chunkHeader);
        const uint32_t size = readLE32(chunkHeader + 4);
        const off_t dataOffset = pos + 8;

        if (fourcc == FMT_FOURCC) {
            uint8_t fmt[16];
            if (size < sizeof(fmt) || handler.readAt(dataOffset, fmt, sizeof(fmt)) != sizeof(fmt)) {
                throw Core::BadFormatException("truncated fmt chunk");
            }
            uint16_t formatTag = readLE16(fmt);
            audio.channels = readLE16(fmt + 2);
            audio.sampleRate = readLE32(fmt + 4);
            bitsPerSample = readLE16(fmt + 14);
            if (formatTag != WAVE_FORMAT_PCM && formatTag != WAVE_FORMAT_EXTENSIBLE) {
                throw Core::BadFormatException("unsupported WAVE format tag " + std::to_string(formatTag));
            }
            if (audio.channels == 0 || audio.sampleRate == 0) {
                throw Core::BadFormatException("WAVE format declares no channels or no sample rate");
            }
            if (bitsPerSample != 8 && bitsPerSample != 16 && bitsPerSample != 24 && bitsPerSample != 32) {
                throw Core::BadFormatException("unsupported sample width " + std::to_string(bitsPerSample));
            }
            haveFormat = true;
        } else if (fourcc == DATA_FOURCC) {
            if (!haveFormat) {
                throw Core::BadFormatException("data chunk before fmt chunk");
            }
            const size_t bytesPerSample = bitsPerSample / 8;
            size_t available = size;
            const off_t fileSize = handler.getFileSize();
            if (fileSize >= dataOffset && static_cast<uint64_t>(fileSize - dataOffset) < size) {
                available = static_cast<size_t>(fileSize - dataOffset);
            }
            std::vector<uint8_t> raw(available);
            size_t got = handler.readAt(dataOffset, raw.data(), raw.size());
            raw.resize(got - got % bytesPerSample);

            audio.samples.reserve(raw.size() / bytesPerSample);
            for (size_t i = 0; i < raw.size(); i += bytesPerSample) {
                int16_t sample;
                switch (bytesPerSample) {
                    case 1:
                        sample = static_cast<int16_t>((static_cast<int>(raw[i]) - 128) * 256);
                        break;
                    case 2:
                        sample = static_cast<int16_t>(readLE16(&raw[i]));
                        break;
                    default:
                        // Little-endian, most significant two bytes last
                        sample = static_cast<int16_t>(readLE16(&raw[i + bytesPerSample - 2]));
                        break;
                }
                audio.samples.push_back(sample);
            }
            Debug::log("io", "WavReader: ", audio.channels, " channels @ ", audio.sampleRate, "Hz, ",
                       bitsPerSample, " bit, ", audio.frameCount(), " frames");
            return audio;
        }

        // Chunks are padded to even sizes
        pos = dataOffset + size + (size & 1);
    }

    throw Core::BadFormatException("WAVE file has no data chunk");
}

} // namespace IO
} // namespace Eavesdrop
