/**
 * @file Registry.hpp
 * @brief Central entity registry: creates, destroys, stores and queries
 *        entities and their components.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef RIFT_ECS_REGISTRY_HPP
    #define RIFT_ECS_REGISTRY_HPP

#include <rift/ecs/Archetype.hpp>
#include <rift/ecs/Components.hpp>
#include <rift/ecs/Entity.hpp>
#include <rift/core/Expected.hpp>
#include <rift/core/NonCopyable.hpp>
#include <rift/core/Types.hpp>

#include <functional>
#include <memory>
#include <tuple>
#include <vector>

namespace rift::ecs {

class Registry;

/**
 * @class Query
 * @brief Lazy, finite sequence of entities whose archetype contains the
 *        required set and shares nothing with the excluded set.
 *
 * Iterates archetype group by archetype group.  The sequence is stable only
 * while structural mutations are deferred (inside an IterationScope).
 */
class Query final
{
public:
    class Iterator final
    {
    public:
        using value_type      = EntityId;
        using difference_type = std::ptrdiff_t;

        Iterator() = default;

        [[nodiscard]] EntityId operator*() const;
        Iterator& operator++();
        Iterator operator++(int);

        [[nodiscard]] bool operator==(const Iterator& other) const noexcept
        {
            return _group == other._group && _index == other._index;
        }

    private:
        friend class Query;

        Iterator(const Query* query, core::usize group, core::usize index);
        void skipInvalid();

        const Query* _query{nullptr};
        core::usize  _group{0};
        core::usize  _index{0};
    };

    Query(const Registry& registry, std::vector<core::u32> groups);

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

    /** @brief Number of live entities in the sequence. */
    [[nodiscard]] core::usize count() const;
    [[nodiscard]] bool        empty() const;

    /** @brief Materialises the sequence. */
    [[nodiscard]] std::vector<EntityId> collect() const;

    /** @brief Archetype group indices matched by this query. */
    [[nodiscard]] const std::vector<core::u32>& groups() const noexcept { return _groups; }

private:
    [[nodiscard]] const std::vector<EntityId>& groupEntities(core::usize position) const;

    const Registry*        _registry;
    std::vector<core::u32> _groups;
};

/**
 * @class Registry
 * @brief Owns the entity slot table, the archetype groups and one dense
 *        component pool per ComponentId.
 *
 * Entities are created with a unique slot + generation.  On destruction the
 * slot is recycled and the generation is bumped, invalidating stale
 * EntityIds.  Entities sharing an archetype are kept together in a group so
 * that queries walk only matching groups.
 *
 * While an IterationScope is open every structural mutation (create,
 * destroy, add, remove) is queued and applied in issue order when the
 * outermost scope closes.  A destroyed id is rejected immediately all the
 * same.
 */
class Registry final : public core::NonCopyable<Registry>
{
public:
    /**
     * @class IterationScope
     * @brief RAII guard deferring structural mutations while systems iterate.
     */
    class IterationScope final
    {
    public:
        explicit IterationScope(Registry& registry);
        ~IterationScope();

        IterationScope(const IterationScope&)            = delete;
        IterationScope& operator=(const IterationScope&) = delete;

    private:
        Registry& _registry;
    };

    Registry();
    ~Registry();

    Registry(Registry&&) noexcept;
    Registry& operator=(Registry&&) noexcept;

    // --------------------------------------------------------------------- //
    //  Entity lifecycle                                                      //
    // --------------------------------------------------------------------- //

    /**
     * @brief Creates a new entity with an empty archetype.
     *
     * Inside an IterationScope the id is reserved immediately but the entity
     * only joins a group (and becomes visible to queries) at flush time.
     * Component pools grow at the flush too, so references borrowed by the
     * running systems stay valid.
     *
     * @return Entity identifier, or kOutOfMemory when every slot is in use.
     */
    [[nodiscard]] core::Expected<EntityId> createEntity();

    /**
     * @brief Destroys an entity, recycling its slot.  Stale ids are ignored.
     *
     * The id is invalid as soon as this returns, even inside an
     * IterationScope; only the slot recycling waits for the flush.
     */
    void destroyEntity(EntityId id);

    /** @brief Destroys every live entity. */
    void clear();

    /** @brief Tests whether an entity is alive (generation matches). */
    [[nodiscard]] bool isAlive(EntityId id) const noexcept;

    /** @brief Returns the total number of live entities. */
    [[nodiscard]] core::u32 liveCount() const noexcept;

    // --------------------------------------------------------------------- //
    //  Components                                                            //
    // --------------------------------------------------------------------- //

    /**
     * @brief Attaches (or replaces) a component.
     * @return kInvalidEntity if @p id is stale.
     */
    template <Component T>
    [[nodiscard]] core::Expected<void> addComponent(EntityId id, const T& value = T{});

    /**
     * @brief Detaches a component.  Removing an absent component is a no-op.
     * @return kInvalidEntity if @p id is stale.
     */
    template <Component T>
    [[nodiscard]] core::Expected<void> removeComponent(EntityId id);

    [[nodiscard]] core::Expected<void> removeComponent(EntityId id, ComponentId component);

    /**
     * @brief Borrows a component for the current tick.
     * @return nullptr when the entity is stale or lacks the component.
     */
    template <Component T>
    [[nodiscard]] T* getComponent(EntityId id);

    template <Component T>
    [[nodiscard]] const T* getComponent(EntityId id) const;

    template <Component T>
    [[nodiscard]] bool hasComponent(EntityId id) const noexcept;

    [[nodiscard]] bool hasComponent(EntityId id, ComponentId component) const noexcept;

    /** @brief Current archetype of @p id (empty when stale). */
    [[nodiscard]] Archetype archetypeOf(EntityId id) const noexcept;

    // --------------------------------------------------------------------- //
    //  Queries                                                               //
    // --------------------------------------------------------------------- //

    /**
     * @brief Entities whose archetype contains @p required and none of
     *        @p excluded.  The matching group list is cached per key.
     */
    [[nodiscard]] Query query(const Archetype& required, const Archetype& excluded = {}) const;

    /**
     * @brief Calls @p fn(id, Ts&...) for every entity holding all of @p Ts,
     *        with structural mutations deferred for the duration.
     */
    template <Component... Ts, typename Fn>
    void each(Fn&& fn);

    /** @brief True while at least one IterationScope is open. */
    [[nodiscard]] bool isDeferring() const noexcept;

    /** @brief Number of archetype groups created so far. */
    [[nodiscard]] core::usize groupCount() const noexcept;

private:
    friend class Query;

    template <typename... Ts>
    struct Storage
    {
        std::tuple<std::vector<Ts>...> pools;

        template <typename T>
        [[nodiscard]] std::vector<T>& pool() noexcept { return std::get<std::vector<T>>(pools); }

        template <typename T>
        [[nodiscard]] const std::vector<T>& pool() const noexcept { return std::get<std::vector<T>>(pools); }

        void resize(core::usize size) { (std::get<std::vector<Ts>>(pools).resize(size), ...); }

        [[nodiscard]] core::usize size() const noexcept { return std::get<0>(pools).size(); }
    };

    using ComponentPools = Storage<Transform, Hitbox, Body, Character, PlayerInput, Owner, Replicated, Interpolated>;

    void beginIteration() noexcept;
    void endIteration();
    void defer(std::function<void()> command);

    void attach(EntityId id, ComponentId component);
    void detach(EntityId id, ComponentId component);
    void release(core::u32 slot);

    [[nodiscard]] const std::vector<EntityId>& groupEntities(core::u32 group) const;

    struct Impl;
    std::unique_ptr<Impl> _impl;
    ComponentPools        _pools;
};

} // namespace rift::ecs

#include "Registry.inl"

#endif // RIFT_ECS_REGISTRY_HPP
