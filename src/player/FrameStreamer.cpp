/*
 * FrameStreamer.cpp - Frame cycle of the playback client
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Player {

FrameStreamer::FrameStreamer(const Sync::PositionCell& cell,
                             Fseq::CompanionLocator locator,
                             FrameSink& sink,
                             uint32_t maxChannels,
                             Clock clock,
                             Opener opener)
    : m_cell(cell),
      m_locator(std::move(locator)),
      m_sink(sink),
      m_max_channels(maxChannels),
      m_clock(std::move(clock)),
      m_opener(std::move(opener))
{
    if (!m_opener) {
        m_opener = [](const std::string& path) { return Fseq::FseqFile::open(path); };
    }
}

FrameStreamer::~FrameStreamer()
{
    closeFile();
}

void FrameStreamer::tick()
{
    std::shared_ptr<const Sync::PositionSnapshot> snapshot = m_cell.read();

    if (!snapshot->playing) {
        closeFile();
        m_generation.reset();
        if (!m_idle_reported) {
            m_idle_reported = true;
            FrameEvent event;
            event.type = FrameEventType::Idle;
            emit(std::move(event));
        }
        return;
    }
    m_idle_reported = false;

    if (!m_generation || *m_generation != snapshot->generation) {
        m_generation = snapshot->generation;
        m_lost_reported = false;
        openFor(*snapshot);
    }

    if (snapshot->syncState == Sync::SyncState::LostSync) {
        if (!m_lost_reported) {
            m_lost_reported = true;
            FrameEvent event;
            event.type = FrameEventType::Error;
            event.message = "lost sync";
            emit(std::move(event));
        }
    } else {
        m_lost_reported = false;
    }

    if (!m_file) {
        return;
    }

    const double position = snapshot->positionAt(static_cast<double>(m_clock()));
    const int64_t index = m_file->frameIndexForPosition(position);
    std::optional<std::vector<uint8_t>> record = m_file->readFrame(index);
    if (!record) {
        return;
    }
    if (m_max_channels > 0 && record->size() > m_max_channels) {
        record->resize(m_max_channels);
    }

    FrameEvent event;
    event.type = FrameEventType::Frame;
    event.frameIndex = index;
    event.payload = std::move(*record);
    emit(std::move(event));
}

void FrameStreamer::openFor(const Sync::PositionSnapshot& snapshot)
{
    closeFile();

    const std::string base = Fseq::CompanionLocator::baseName(snapshot.itemId);
    std::optional<std::string> path = m_locator.locate(snapshot.itemId);
    if (!path) {
        FrameEvent event;
        event.type = FrameEventType::NoData;
        event.message = "No audio FSEQ for: " + base;
        emit(std::move(event));
        return;
    }

    try {
        m_file = m_opener(*path);
    } catch (const Fseq::FseqParseException& e) {
        Debug::log("player", "FrameStreamer: cannot use ", *path, ": ", e.what());
        FrameEvent event;
        event.type = FrameEventType::Error;
        event.message = std::string("Bad audio FSEQ: ") + e.what();
        emit(std::move(event));
        return;
    }
    if (!m_file) {
        return;
    }

    const Fseq::FrameFileHeader& header = m_file->header();
    const size_t slash = path->find_last_of('/');
    FrameEvent event;
    event.type = FrameEventType::SeqOpen;
    event.sequence.file = base;
    event.sequence.audioFile = slash == std::string::npos ? *path : path->substr(slash + 1);
    event.sequence.channels = header.recordSize();
    event.sequence.frames = header.recordCount();
    event.sequence.frameDurationMs = header.frameDurationMs();
    event.sequence.samplesPerFrame = Fseq::AudioFrame::samplesPerFrame(header.recordSize());
    event.sequence.sampleRate = Fseq::AudioFrame::sampleRate(header.recordSize(), header.frameDurationMs());
    emit(std::move(event));
}

void FrameStreamer::closeFile()
{
    if (m_file) {
        m_file->close();
        m_file.reset();
    }
}

void FrameStreamer::emit(FrameEvent event)
{
    event.id = m_next_id++;
    m_sink.onFrameEvent(event);
}

} // namespace Player
} // namespace Eavesdrop
