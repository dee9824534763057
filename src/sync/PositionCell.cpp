/*
 * PositionCell.cpp - Single-writer position snapshot shared between loops
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Sync {

const char* syncStateName(SyncState state)
{
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Tracking: return "tracking";
        case SyncState::Unreachable: return "unreachable";
        case SyncState::LostSync: return "lost";
    }
    return "unknown";
}

PositionCell::PositionCell()
    : m_snapshot(std::make_shared<const PositionSnapshot>())
{
}

void PositionCell::publish(PositionSnapshot snapshot)
{
    std::shared_ptr<const PositionSnapshot> next = std::make_shared<const PositionSnapshot>(std::move(snapshot));
    std::atomic_store(&m_snapshot, next);
    m_publish_count.fetch_add(1);
}

std::shared_ptr<const PositionSnapshot> PositionCell::read() const
{
    return std::atomic_load(&m_snapshot);
}

} // namespace Sync
} // namespace Eavesdrop
