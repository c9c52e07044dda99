/**
 * @file Snapshot.hpp
 * @brief World snapshots and the delta encoding between two of them.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_REPLICATION_SNAPSHOT_HPP
    #define RIFT_NET_REPLICATION_SNAPSHOT_HPP

#include <rift/net/protocol/Messages.hpp>
#include <rift/ecs/Registry.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/Types.hpp>

#include <vector>

namespace rift::net::replication {

/**
 * @struct Snapshot
 * @brief Complete replicated state of a world at one tick.
 *
 * Entities are sorted by id; each entry's mask names every component the
 * entity holds (kFieldReplace set).
 */
struct Snapshot
{
    core::Tick                         tick{0};
    std::vector<protocol::EntityState> entities;

    [[nodiscard]] const protocol::EntityState* find(core::u32 entityId) const noexcept;
};

[[nodiscard]] protocol::CharacterState toCharacterState(const ecs::Character& character) noexcept;

/** @brief Overwrites the replicated fields of @p character, keeping its input buffer. */
void applyCharacterState(ecs::Character& character, const protocol::CharacterState& state) noexcept;

/**
 * @brief Captures every entity tagged Replicated.
 */
[[nodiscard]] Snapshot captureSnapshot(const ecs::Registry& registry, core::Tick tick);

/**
 * @brief Builds the delta turning @p baseline into @p current.
 *
 * With no baseline the result is a full snapshot (baseTick 0, every entry
 * flagged kFieldReplace).  Otherwise entries carry only the components that
 * changed, and entities missing from @p current are listed as removed.
 * Unchanged entities produce no entry.
 */
[[nodiscard]] protocol::SnapshotDelta makeDelta(const Snapshot& current, const Snapshot* baseline,
                                                core::Sequence ackedInput);

/**
 * @brief Reconstructs the full snapshot a delta describes.
 * @return kInvalidState when the delta needs a baseline that @p baseline
 *         is not; kMalformedPacket when a patch names an unknown entity.
 */
[[nodiscard]] core::Expected<Snapshot> applyDelta(const protocol::SnapshotDelta& delta,
                                                  const Snapshot* baseline);

} // namespace rift::net::replication

#endif // RIFT_NET_REPLICATION_SNAPSHOT_HPP
