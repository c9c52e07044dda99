/**
 * @file SnapshotHistory.cpp
 * @brief SnapshotHistory implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/net/replication/SnapshotHistory.hpp>
#include <rift/core/Assert.hpp>

#include <algorithm>

namespace rift::net::replication {

SnapshotHistory::SnapshotHistory(core::u32 capacity)
    : _capacity{capacity}
{
    RIFT_ASSERT(capacity > 0);
}

bool SnapshotHistory::record(Snapshot snapshot)
{
    if (!_snapshots.empty() && snapshot.tick <= _snapshots.back().tick)
    {
        return false;
    }
    if (_snapshots.size() >= _capacity)
    {
        _snapshots.pop_front();
    }
    _snapshots.push_back(std::move(snapshot));
    return true;
}

const Snapshot* SnapshotHistory::find(core::Tick tick) const noexcept
{
    const auto it = std::ranges::lower_bound(_snapshots, tick, {}, &Snapshot::tick);
    return (it != _snapshots.end() && it->tick == tick) ? &*it : nullptr;
}

const Snapshot* SnapshotHistory::latest() const noexcept
{
    return _snapshots.empty() ? nullptr : &_snapshots.back();
}

void SnapshotHistory::discardBefore(core::Tick tick)
{
    while (!_snapshots.empty() && _snapshots.front().tick < tick)
    {
        _snapshots.pop_front();
    }
}

void SnapshotHistory::clear() noexcept
{
    _snapshots.clear();
}

} // namespace rift::net::replication
