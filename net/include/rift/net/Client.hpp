/**
 * @file Client.hpp
 * @brief Predicting, reconciling and interpolating replication client.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_NET_CLIENT_HPP
    #define RIFT_NET_CLIENT_HPP

#include <rift/net/netcode/Prediction.hpp>
#include <rift/net/netcode/Reconciliation.hpp>
#include <rift/net/protocol/Messages.hpp>
#include <rift/net/transport/ITransport.hpp>
#include <rift/engine/World.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace rift::net {

enum class ClientState : core::u8
{
    Disconnected,
    Connecting,
    Connected
};

/**
 * @struct RenderTransform
 * @brief What the rendering collaborator needs to draw one entity.
 */
struct RenderTransform
{
    math::Vec2f      position{};
    core::f32        rotation{0.0f};
    math::Vec2f      scale{1.0f, 1.0f};
    /// Animation tag of the character state ("idle", "dash", ...), or "prop".
    std::string_view tag{};
};

/**
 * @class Client
 * @brief Mirrors the server world into a local World.
 *
 * The controlled character is simulated locally from each input
 * (prediction) and corrected when snapshots disagree (reconciliation).
 * Every other entity carries the Interpolated tag and is displayed a fixed
 * delay behind the estimated server clock.
 *
 * Local entity ids differ from server ids; the client keeps the mapping.
 */
class Client final : public core::NonCopyable<Client>
{
public:
    Client(engine::World& world, transport::IClientTransport& transport);
    ~Client();

    /** @brief Sends Connect; the handshake completes during poll(). */
    [[nodiscard]] core::Expected<void> connect();

    /** @brief Sends Disconnect and forgets the mirrored world. */
    [[nodiscard]] core::Expected<void> disconnect();

    /**
     * @brief Predicts one local tick with @p command and sends it.
     * @return kNotConnected until the controlled entity has been received,
     *         kInvalidArgument for a non-increasing sequence, kTickOverrun
     *         when the local step overran (the command was still sent).
     */
    [[nodiscard]] core::Expected<void> tick(const protocol::InputCommand& command);

    /**
     * @brief Drains the transport: completes the handshake, applies
     *        snapshots, acknowledges them, feeds the interpolator and
     *        reconciles the controlled entity.
     */
    void poll();

    // --------------------------------------------------------------------- //
    //  Rendering                                                             //
    // --------------------------------------------------------------------- //

    /** @brief Predicted transform for the own entity, interpolated otherwise. */
    [[nodiscard]] std::optional<RenderTransform> renderState(ecs::EntityId entity) const;

    void forEachRenderable(const std::function<void(ecs::EntityId, const RenderTransform&)>& fn) const;

    // --------------------------------------------------------------------- //
    //  State                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] ClientState    state() const noexcept;
    [[nodiscard]] core::ClientId clientId() const noexcept;

    /** @brief Local id of the controlled character (null until received). */
    [[nodiscard]] ecs::EntityId controlledEntity() const noexcept;

    /** @brief Local id mirroring the server entity @p serverId (null if unknown). */
    [[nodiscard]] ecs::EntityId localEntity(core::u32 serverId) const noexcept;

    [[nodiscard]] core::Tick lastSnapshotTick() const noexcept;

    /** @brief Estimated server time in seconds. */
    [[nodiscard]] core::f64 serverTime() const noexcept;

    [[nodiscard]] const netcode::Prediction&      prediction() const noexcept;
    [[nodiscard]] const netcode::ReconcileResult& lastReconcile() const noexcept;

    /** @brief Malformed packets dropped since start. */
    [[nodiscard]] core::u64 malformedDropped() const noexcept;

    [[nodiscard]] engine::World& world() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rift::net

#endif // RIFT_NET_CLIENT_HPP
