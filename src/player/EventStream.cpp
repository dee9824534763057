/*
 * EventStream.cpp - Correction and frame events, and their SSE encoding
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Player {

using json = nlohmann::json;

SSEWriter::SSEWriter(std::ostream& out, bool writeCorrections, bool writeFrames)
    : m_out(out), m_write_corrections(writeCorrections), m_write_frames(writeFrames)
{
}

const char* SSEWriter::eventName(CorrectionEventType type)
{
    switch (type) {
        case CorrectionEventType::HardSeek: return "hardSeek";
        case CorrectionEventType::SoftRate: return "softRate";
        case CorrectionEventType::Idle: return "syncIdle";
        case CorrectionEventType::SourceUnreachable: return "sourceUnreachable";
        case CorrectionEventType::LostSync: return "lostSync";
        case CorrectionEventType::Recovered: return "syncRecovered";
    }
    return "unknown";
}

const char* SSEWriter::eventName(FrameEventType type)
{
    switch (type) {
        case FrameEventType::SeqOpen: return "seq_open";
        case FrameEventType::Frame: return "frame";
        case FrameEventType::NoData: return "no_audio";
        case FrameEventType::Idle: return "idle";
        case FrameEventType::Error: return "error";
    }
    return "unknown";
}

std::string SSEWriter::format(const CorrectionEvent& event)
{
    json data;
    switch (event.type) {
        case CorrectionEventType::HardSeek:
            data["targetMs"] = event.targetMs;
            data["item"] = event.itemId;
            break;
        case CorrectionEventType::SoftRate:
            data["rate"] = event.rateFactor;
            data["errorMs"] = event.errorMs;
            break;
        case CorrectionEventType::Idle:
            data["status"] = "idle";
            break;
        case CorrectionEventType::SourceUnreachable:
            data["msg"] = "FPP unreachable";
            break;
        case CorrectionEventType::LostSync:
            data["msg"] = "lost sync";
            break;
        case CorrectionEventType::Recovered:
            data["item"] = event.itemId;
            break;
    }

    std::string text;
    text += "event: ";
    text += eventName(event.type);
    text += "\ndata: " + data.dump() + "\n\n";
    return text;
}

std::string SSEWriter::format(const FrameEvent& event)
{
    std::string payload;
    switch (event.type) {
        case FrameEventType::SeqOpen: {
            json data;
            data["file"] = event.sequence.file;
            data["audioFile"] = event.sequence.audioFile;
            data["channels"] = event.sequence.channels;
            data["frames"] = event.sequence.frames;
            data["stepTime"] = event.sequence.frameDurationMs;
            data["samplesPerFrame"] = event.sequence.samplesPerFrame;
            data["sampleRate"] = event.sequence.sampleRate;
            payload = data.dump();
            break;
        }
        case FrameEventType::Frame:
            payload = Core::Utility::Base64::encode(event.payload);
            break;
        case FrameEventType::NoData:
        case FrameEventType::Error:
            payload = json{{"msg", event.message}}.dump();
            break;
        case FrameEventType::Idle:
            payload = json{{"status", "idle"}}.dump();
            break;
    }

    std::string text = "id: " + std::to_string(event.id) + "\n";
    text += "event: ";
    text += eventName(event.type);
    text += "\ndata: " + payload + "\n\n";
    return text;
}

void SSEWriter::onCorrection(const CorrectionEvent& event)
{
    if (m_write_corrections) {
        write(format(event));
    }
}

void SSEWriter::onFrameEvent(const FrameEvent& event)
{
    if (m_write_frames) {
        write(format(event));
    }
}

void SSEWriter::write(const std::string& text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << text;
    m_out.flush();
    if (!m_out) {
        Debug::log("player", "SSEWriter: output stream failed");
    }
}

} // namespace Player
} // namespace Eavesdrop
