/*
 * EventStream.h - Correction and frame events, and their SSE encoding
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef EVENTSTREAM_H
#define EVENTSTREAM_H

namespace Eavesdrop {
namespace Player {

// No direct includes - all includes should be in eavesdrop.h

enum class CorrectionEventType {
    HardSeek,
    SoftRate,
    Idle,
    SourceUnreachable,
    LostSync,
    Recovered    // first good poll after a run of failures
};

struct CorrectionEvent {
    CorrectionEventType type = CorrectionEventType::Idle;
    std::string itemId;
    double targetMs = 0.0;
    double rateFactor = 1.0;
    double errorMs = 0.0;
};

enum class FrameEventType {
    SeqOpen,
    Frame,
    NoData,
    Idle,
    Error
};

/**
 * @brief Description of an opened audio sequence, sent before its frames.
 */
struct SequenceInfo {
    std::string file;        // item base name
    std::string audioFile;   // companion file name, without directory
    uint32_t channels = 0;
    uint32_t frames = 0;
    uint32_t frameDurationMs = 0;
    size_t samplesPerFrame = 0;
    uint32_t sampleRate = 0;
};

struct FrameEvent {
    uint64_t id = 0;
    FrameEventType type = FrameEventType::Idle;
    SequenceInfo sequence;           // SeqOpen
    std::vector<uint8_t> payload;    // Frame
    int64_t frameIndex = -1;         // Frame
    std::string message;             // NoData, Error
};

class CorrectionSink {
public:
    virtual ~CorrectionSink() = default;
    virtual void onCorrection(const CorrectionEvent& event) = 0;
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void onFrameEvent(const FrameEvent& event) = 0;
};

/**
 * @brief Writes both event channels as Server-Sent Events.
 *
 * Frame events carry their id in an "id:" line and frame payloads are sent
 * as bare Base64 text. Everything else is a JSON object on the "data:"
 * line. Safe to use from both loops at once.
 */
class SSEWriter : public CorrectionSink, public FrameSink {
public:
    SSEWriter(std::ostream& out, bool writeCorrections, bool writeFrames);

    void onCorrection(const CorrectionEvent& event) override;
    void onFrameEvent(const FrameEvent& event) override;

    static const char* eventName(CorrectionEventType type);
    static const char* eventName(FrameEventType type);

    static std::string format(const CorrectionEvent& event);
    static std::string format(const FrameEvent& event);

private:
    void write(const std::string& text);

    std::ostream& m_out;
    bool m_write_corrections;
    bool m_write_frames;
    std::mutex m_mutex;
};

} // namespace Player
} // namespace Eavesdrop

#endif // EVENTSTREAM_H
