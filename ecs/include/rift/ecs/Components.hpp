/**
 * @file Components.hpp
 * @brief Plain-data component structs stored by the Registry.
 *
 * Every component is blittable: no pointers, no owning handles.  They can
 * be copied into snapshots and prediction history byte for byte.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_COMPONENTS_HPP
    #define RIFT_ECS_COMPONENTS_HPP

#include <rift/ecs/Component.hpp>
#include <rift/container/RingBuffer.hpp>
#include <rift/core/Concepts.hpp>
#include <rift/core/Types.hpp>
#include <rift/math/Vec2.hpp>

namespace rift::ecs {

// ========================================================================== //
//  Physical                                                                  //
// ========================================================================== //

struct Transform
{
    math::Vec2f position{};
    math::Vec2f velocity{};
    core::f32   rotation{0.0f};
    math::Vec2f scale{1.0f, 1.0f};

    [[nodiscard]] bool operator==(const Transform&) const = default;
};

/** @brief Solid boxes push each other apart, triggers only report overlap. */
enum class HitboxMode : core::u8
{
    Solid   = 0,
    Trigger = 1
};

/**
 * @struct Hitbox
 * @brief Axis-aligned box relative to the owning Transform.
 *
 * World box = centre (position + offset), extents @c size.
 */
struct Hitbox
{
    math::Vec2f size{1.0f, 1.0f};
    math::Vec2f offset{};
    core::u8    layer{0};
    HitboxMode  mode{HitboxMode::Solid};

    [[nodiscard]] bool operator==(const Hitbox&) const = default;
};

struct Body
{
    core::f32 mass{1.0f};
    bool      isStatic{false};
    core::f32 gravityScale{1.0f};
    bool      grounded{false};

    [[nodiscard]] bool operator==(const Body&) const = default;
};

// ========================================================================== //
//  Character                                                                 //
// ========================================================================== //

enum class ActionState : core::u8
{
    Idle   = 0,
    Move   = 1,
    Jump   = 2,
    Fall   = 3,
    Dash   = 4,
    Attack = 5,
    Hurt   = 6,
    Dead   = 7,

    Count
};

/**
 * @enum ActionFlag
 * @brief Discrete actions carried by an input command.  A set bit means
 *        the action was pressed on that tick.
 */
enum ActionFlag : core::u16
{
    kActionNone   = 0,
    kActionJump   = 1u << 0,
    kActionDash   = 1u << 1,
    kActionAttack = 1u << 2,
};

/** @brief A pressed action waiting for the character to be able to act. */
struct BufferedAction
{
    core::u16 action{kActionNone};
    core::u32 ticksLeft{0};
};

using ActionBuffer = container::RingBuffer<BufferedAction, 8>;

struct Character
{
    core::i32    health{0};
    core::i32    maxHealth{0};
    ActionState  state{ActionState::Idle};
    /// Ticks spent in the current state.
    core::u32    stateTicks{0};
    core::i8     facing{1};
    core::u32    invulnerableTicks{0};
    /// Set once the current attack has hit something.
    bool         attackConnected{false};
    ActionBuffer actions{};
};

// ========================================================================== //
//  Replication                                                               //
// ========================================================================== //

/** @brief Latest input command applied to a controllable entity. */
struct PlayerInput
{
    core::Sequence sequence{0};
    core::Tick     tick{0};
    math::Vec2f    move{};
    core::u16      actionFlags{kActionNone};
};

struct Owner
{
    core::ClientId clientId{core::kNoClient};

    [[nodiscard]] bool operator==(const Owner&) const = default;
};

/** @brief Tag: entity is sent to clients in snapshots. */
struct Replicated {};

/** @brief Tag: entity is a remote entity rendered from interpolated samples. */
struct Interpolated {};

// ========================================================================== //
//  Traits                                                                    //
// ========================================================================== //

template <> struct ComponentTraits<Transform>    { static constexpr ComponentId kId = ComponentId::Transform; };
template <> struct ComponentTraits<Hitbox>       { static constexpr ComponentId kId = ComponentId::Hitbox; };
template <> struct ComponentTraits<Body>         { static constexpr ComponentId kId = ComponentId::Body; };
template <> struct ComponentTraits<Character>    { static constexpr ComponentId kId = ComponentId::Character; };
template <> struct ComponentTraits<PlayerInput>  { static constexpr ComponentId kId = ComponentId::PlayerInput; };
template <> struct ComponentTraits<Owner>        { static constexpr ComponentId kId = ComponentId::Owner; };
template <> struct ComponentTraits<Replicated>   { static constexpr ComponentId kId = ComponentId::Replicated; };
template <> struct ComponentTraits<Interpolated> { static constexpr ComponentId kId = ComponentId::Interpolated; };

static_assert(core::Blittable<Transform>);
static_assert(core::Blittable<Hitbox>);
static_assert(core::Blittable<Body>);
static_assert(core::Blittable<Character>);
static_assert(core::Blittable<PlayerInput>);
static_assert(core::Blittable<Owner>);

} // namespace rift::ecs

#endif // RIFT_ECS_COMPONENTS_HPP
