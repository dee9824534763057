/*
 * FrameStreamer.h - Frame cycle of the playback client
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FRAMESTREAMER_H
#define FRAMESTREAMER_H

namespace Eavesdrop {
namespace Player {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Reads the companion frame for the current position once per tick.
 *
 * Only ever reads the PositionCell. Owns the open sequence file, which is
 * closed on idle and replaced whenever the snapshot generation changes.
 * A missing or unparseable companion is reported once per item and not
 * retried until the item changes.
 */
class FrameStreamer {
public:
    using Opener = std::function<std::unique_ptr<Fseq::FseqFile>(const std::string& path)>;

    /**
     * @param maxChannels Truncate frame payloads to this many bytes, 0 for no limit
     */
    FrameStreamer(const Sync::PositionCell& cell,
                  Fseq::CompanionLocator locator,
                  FrameSink& sink,
                  uint32_t maxChannels = 0,
                  Clock clock = steadyNowMs,
                  Opener opener = Opener());

    ~FrameStreamer();

    void tick();

    bool hasOpenFile() const { return m_file != nullptr; }
    uint64_t nextEventId() const { return m_next_id; }

private:
    void openFor(const Sync::PositionSnapshot& snapshot);
    void closeFile();
    void emit(FrameEvent event);

    const Sync::PositionCell& m_cell;
    Fseq::CompanionLocator m_locator;
    FrameSink& m_sink;
    uint32_t m_max_channels;
    Clock m_clock;
    Opener m_opener;

    std::unique_ptr<Fseq::FseqFile> m_file;
    std::optional<uint64_t> m_generation;
    bool m_idle_reported = false;
    bool m_lost_reported = false;
    uint64_t m_next_id = 0;
};

} // namespace Player
} // namespace Eavesdrop

#endif // FRAMESTREAMER_H
