/*
 * mkfseq.cpp - Encode a WAVE file into an audio sequence file
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"
#include <getopt.h>

using namespace Eavesdrop;

namespace {

const char* const PRODUCER_TAG = "Eavesdrop mkfseq";

void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] input.wav -o output.fseq\n"
              << "  -o, --output FILE       sequence file to write (required)\n"
              << "  -r, --fps N             frame rate, default 40\n"
              << "  -t, --step-time MS      frame period in ms, overrides --fps\n"
              << "  -s, --sample-rate HZ    output sample rate, default 44100\n"
              << "  -d, --debug LIST        enable debug channels\n";
}

bool parsePositive(const char* text, long& out)
{
    char* end = nullptr;
    errno = 0;
    long value = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value <= 0) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    static const struct option long_options[] = {
        {"output", required_argument, 0, 'o'},
        {"fps", required_argument, 0, 'r'},
        {"step-time", required_argument, 0, 't'},
        {"sample-rate", required_argument, 0, 's'},
        {"debug", required_argument, 0, 'd'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    std::string output;
    long fps = 40;
    long stepTime = 0;
    long sampleRate = 44100;
    std::string debugChannels;

    int opt;
    while ((opt = getopt_long(argc, argv, "o:r:t:s:d:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o':
                output = optarg;
                break;
            case 'r':
                if (!parsePositive(optarg, fps)) {
                    std::cerr << argv[0] << ": bad --fps value: " << optarg << std::endl;
                    return 1;
                }
                break;
            case 't':
                if (!parsePositive(optarg, stepTime) || stepTime > 255) {
                    std::cerr << argv[0] << ": --step-time must be 1-255 ms" << std::endl;
                    return 1;
                }
                break;
            case 's':
                if (!parsePositive(optarg, sampleRate)) {
                    std::cerr << argv[0] << ": bad --sample-rate value: " << optarg << std::endl;
                    return 1;
                }
                break;
            case 'd':
                debugChannels = optarg;
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }

    if (optind != argc - 1 || output.empty()) {
        usage(argv[0]);
        return 1;
    }
    const std::string input = argv[optind];

    if (stepTime == 0) {
        stepTime = 1000 / fps;
        if (stepTime <= 0 || stepTime > 255) {
            std::cerr << argv[0] << ": --fps must give a 1-255 ms frame period" << std::endl;
            return 1;
        }
    }

    Debug::init("", Debug::parseChannelList(debugChannels));

    int status = 0;
    try {
        IO::File::FileIOHandler handler(input);
        IO::PcmAudio audio = IO::WavReader::read(handler);

        std::vector<int16_t> mono = Fseq::AudioFrame::mixToMono(audio.samples, audio.channels);
        mono = Fseq::AudioFrame::resampleLinear(mono, audio.sampleRate, static_cast<uint32_t>(sampleRate));

        const size_t samplesPerFrame =
            Fseq::AudioFrame::samplesForRate(static_cast<uint32_t>(sampleRate), static_cast<uint32_t>(stepTime));
        if (samplesPerFrame == 0) {
            throw std::invalid_argument("sample rate too low for a " + std::to_string(stepTime) + "ms frame");
        }

        Fseq::FseqWriter writer(Fseq::AudioFrame::recordSizeFor(samplesPerFrame), static_cast<uint8_t>(stepTime));
        const size_t slash = input.find_last_of('/');
        writer.setTag("mf", slash == std::string::npos ? input : input.substr(slash + 1));
        writer.setTag("sp", PRODUCER_TAG);
        for (const auto& record : Fseq::AudioFrame::encodeAll(mono, samplesPerFrame)) {
            writer.addFrame(record);
        }
        writer.write(output);

        std::cout << output << ": " << writer.frameCount() << " frames of "
                  << Fseq::AudioFrame::recordSizeFor(samplesPerFrame) << " channels, "
                  << stepTime << "ms step, " << samplesPerFrame << " samples/frame" << std::endl;
    } catch (const Core::IOException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = 1;
    } catch (const Core::BadFormatException& e) {
        std::cerr << argv[0] << ": " << input << ": " << e.what() << std::endl;
        status = 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = 1;
    } catch (const std::length_error& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        status = 1;
    }

    Debug::shutdown();
    return status;
}
