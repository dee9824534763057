/*
 * PositionCell.h - Single-writer position snapshot shared between loops
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef POSITIONCELL_H
#define POSITIONCELL_H

namespace Eavesdrop {
namespace Sync {

// No direct includes - all includes should be in eavesdrop.h

enum class SyncState {
    Idle,         // nothing playing
    Tracking,     // last poll succeeded
    Unreachable,  // last poll failed
    LostSync      // several polls in a row failed
};

const char* syncStateName(SyncState state);

/**
 * @brief Immutable view of the estimator after one poll.
 *
 * generation changes every time the model is re-anchored (new item, or
 * playback starting again), so readers can tell a new item from a seek.
 */
struct PositionSnapshot {
    uint64_t generation = 0;
    std::string itemId;
    bool playing = false;
    double offsetMs = 0.0;
    double driftPpm = 0.0;
    double instantMs = 0.0;
    SyncState syncState = SyncState::Idle;

    double positionAt(double nowMs) const {
        return offsetMs + (nowMs - instantMs) * (1.0 + driftPpm / 1e6);
    }
};

/**
 * @brief Atomic holder of the latest PositionSnapshot.
 *
 * The poll loop is the only writer. Readers get a shared_ptr to a snapshot
 * that never changes underneath them; publishing swaps the pointer.
 */
class PositionCell {
public:
    PositionCell();

    void publish(PositionSnapshot snapshot);

    /**
     * @brief Latest snapshot; never null.
     */
    std::shared_ptr<const PositionSnapshot> read() const;

    uint64_t publishCount() const { return m_publish_count.load(); }

private:
    std::shared_ptr<const PositionSnapshot> m_snapshot;
    std::atomic<uint64_t> m_publish_count{0};
};

} // namespace Sync
} // namespace Eavesdrop

#endif // POSITIONCELL_H
