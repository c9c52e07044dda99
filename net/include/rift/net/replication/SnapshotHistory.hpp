/**
 * @file SnapshotHistory.hpp
 * @brief Bounded store of recent world snapshots used as delta baselines.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_REPLICATION_SNAPSHOTHISTORY_HPP
    #define RIFT_NET_REPLICATION_SNAPSHOTHISTORY_HPP

#include <rift/net/replication/Snapshot.hpp>
#include <rift/core/Types.hpp>

#include <deque>

namespace rift::net::replication {

/**
 * @class SnapshotHistory
 * @brief FIFO of snapshots ordered by tick.
 *
 * The server keeps one per world and looks up each client's acknowledged
 * tick in it; the client keeps one to resolve incoming deltas.  A baseline
 * that has been evicted is simply not found, and the caller falls back to
 * a full snapshot.
 */
class SnapshotHistory final
{
public:
    explicit SnapshotHistory(core::u32 capacity);

    /**
     * @brief Stores @p snapshot.  Snapshots not newer than the latest one
     *        are ignored.
     * @return @c true if stored.
     */
    bool record(Snapshot snapshot);

    [[nodiscard]] const Snapshot* find(core::Tick tick) const noexcept;
    [[nodiscard]] const Snapshot* latest() const noexcept;

    /** @brief Drops every snapshot older than @p tick. */
    void discardBefore(core::Tick tick);

    void clear() noexcept;

    [[nodiscard]] core::usize size() const noexcept { return _snapshots.size(); }
    [[nodiscard]] core::u32   capacity() const noexcept { return _capacity; }

private:
    core::u32            _capacity;
    std::deque<Snapshot> _snapshots;
};

} // namespace rift::net::replication

#endif // RIFT_NET_REPLICATION_SNAPSHOTHISTORY_HPP
