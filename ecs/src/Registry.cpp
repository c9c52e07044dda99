/**
 * @file Registry.cpp
 * @brief Entity registry: slot table, archetype groups, query cache and
 *        deferred structural mutations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/ecs/Registry.hpp>
#include <rift/core/Log.hpp>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rift::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct Registry::Impl
{
    static constexpr core::u32 kNoGroup  = ~core::u32{0};
    static constexpr core::u32 kMaxSlots = EntityId::kSlotMask; // kSlotMask itself encodes the null id

    struct SlotInfo
    {
        core::u32 generation{0};
        core::u32 group{kNoGroup};
        core::u32 indexInGroup{0};
        Archetype archetype{};
        bool      alive{false};
    };

    struct Group
    {
        Archetype             archetype;
        std::vector<EntityId> entities;
    };

    struct QueryKey
    {
        core::u64 required;
        core::u64 excluded;

        bool operator==(const QueryKey&) const = default;
    };

    struct QueryKeyHash
    {
        std::size_t operator()(const QueryKey& key) const noexcept
        {
            return std::hash<core::u64>{}(key.required * 0x9E3779B97F4A7C15ull ^ key.excluded);
        }
    };

    struct CachedQuery
    {
        Archetype              required;
        Archetype              excluded;
        std::vector<core::u32> groups;
    };

    std::vector<SlotInfo>                                          slots;
    std::vector<core::u32>                                         freeSlots;
    std::vector<Group>                                             groups;
    std::unordered_map<core::u64, core::u32>                       groupByMask;
    std::unordered_map<QueryKey, CachedQuery, QueryKeyHash>         queryCache;
    std::vector<std::function<void()>>                             deferred;
    core::u32                                                      iterationDepth{0};
    core::u32                                                      liveCount{0};

    [[nodiscard]] static bool matches(const Archetype& archetype, const Archetype& required,
                                      const Archetype& excluded) noexcept
    {
        return archetype.contains(required) && !archetype.intersects(excluded);
    }

    core::u32 findOrCreateGroup(const Archetype& archetype)
    {
        if (auto it = groupByMask.find(archetype.bits()); it != groupByMask.end())
        {
            return it->second;
        }

        const auto index = static_cast<core::u32>(groups.size());
        groups.push_back(Group{archetype, {}});
        groupByMask.emplace(archetype.bits(), index);

        // Only cached queries this new group satisfies are stale.
        std::erase_if(queryCache, [&](const auto& entry) {
            return matches(archetype, entry.second.required, entry.second.excluded);
        });
        return index;
    }

    void unlink(core::u32 slot)
    {
        SlotInfo& info = slots[slot];
        if (info.group == kNoGroup)
        {
            return;
        }

        auto& entities = groups[info.group].entities;
        const core::u32 index = info.indexInGroup;
        const EntityId  moved = entities.back();
        entities[index] = moved;
        slots[moved.slot()].indexInGroup = index;
        entities.pop_back();

        info.group        = kNoGroup;
        info.indexInGroup = 0;
    }

    void link(EntityId id)
    {
        SlotInfo& info   = slots[id.slot()];
        const core::u32 group = findOrCreateGroup(info.archetype);
        info.group        = group;
        info.indexInGroup = static_cast<core::u32>(groups[group].entities.size());
        groups[group].entities.push_back(id);
    }
};

// ========================================================================== //
//  Query                                                                     //
// ========================================================================== //

Query::Iterator::Iterator(const Query* query, core::usize group, core::usize index)
    : _query{query}, _group{group}, _index{index}
{
    skipInvalid();
}

void Query::Iterator::skipInvalid()
{
    while (_group < _query->_groups.size())
    {
        const auto& entities = _query->groupEntities(_group);
        if (_index >= entities.size())
        {
            ++_group;
            _index = 0;
            continue;
        }
        // Destroyed inside the current scope, still linked until flush.
        if (!_query->_registry->isAlive(entities[_index]))
        {
            ++_index;
            continue;
        }
        return;
    }
}

EntityId Query::Iterator::operator*() const
{
    return _query->groupEntities(_group)[_index];
}

Query::Iterator& Query::Iterator::operator++()
{
    ++_index;
    skipInvalid();
    return *this;
}

Query::Iterator Query::Iterator::operator++(int)
{
    Iterator previous = *this;
    ++(*this);
    return previous;
}

Query::Query(const Registry& registry, std::vector<core::u32> groups)
    : _registry{&registry}, _groups{std::move(groups)}
{}

Query::Iterator Query::begin() const
{
    return Iterator{this, 0, 0};
}

Query::Iterator Query::end() const
{
    return Iterator{this, _groups.size(), 0};
}

core::usize Query::count() const
{
    core::usize total = 0;
    for (core::usize i = 0; i < _groups.size(); ++i)
    {
        if (!_registry->isDeferring())
        {
            total += groupEntities(i).size();
            continue;
        }
        for (EntityId id : groupEntities(i))
        {
            total += _registry->isAlive(id) ? 1u : 0u;
        }
    }
    return total;
}

bool Query::empty() const
{
    return begin() == end();
}

std::vector<EntityId> Query::collect() const
{
    std::vector<EntityId> result;
    result.reserve(count());
    for (EntityId id : *this)
    {
        result.push_back(id);
    }
    return result;
}

const std::vector<EntityId>& Query::groupEntities(core::usize position) const
{
    return _registry->groupEntities(_groups[position]);
}

// ========================================================================== //
//  IterationScope                                                            //
// ========================================================================== //

Registry::IterationScope::IterationScope(Registry& registry)
    : _registry{registry}
{
    _registry.beginIteration();
}

Registry::IterationScope::~IterationScope()
{
    _registry.endIteration();
}

// ========================================================================== //
//  Registry                                                                  //
// ========================================================================== //

Registry::Registry()
    : _impl{std::make_unique<Impl>()}
{}

Registry::~Registry() = default;

Registry::Registry(Registry&&) noexcept            = default;
Registry& Registry::operator=(Registry&&) noexcept = default;

core::Expected<EntityId> Registry::createEntity()
{
    core::u32 slot = 0;
    if (!_impl->freeSlots.empty())
    {
        slot = _impl->freeSlots.back();
        _impl->freeSlots.pop_back();
    }
    else
    {
        if (_impl->slots.size() >= Impl::kMaxSlots)
        {
            return core::makeError(core::ErrorCode::kOutOfMemory, "Entity slot pool exhausted");
        }
        slot = static_cast<core::u32>(_impl->slots.size());
        _impl->slots.emplace_back();
        // Growing the pools moves every component; wait for the flush when
        // systems may still hold references into them.
        if (!isDeferring())
        {
            _pools.resize(_impl->slots.size());
        }
    }

    auto& info     = _impl->slots[slot];
    info.alive     = true;
    info.archetype = Archetype{};
    ++_impl->liveCount;

    const EntityId id{info.generation, slot};

    if (isDeferring())
    {
        defer([this, id] {
            if (isAlive(id) && _impl->slots[id.slot()].group == Impl::kNoGroup)
            {
                _impl->link(id);
            }
        });
    }
    else
    {
        _impl->link(id);
    }
    return id;
}

void Registry::destroyEntity(EntityId id)
{
    if (!isAlive(id))
    {
        return;
    }

    const core::u32 slot = id.slot();
    auto& info      = _impl->slots[slot];
    info.alive      = false;
    info.archetype  = Archetype{};
    info.generation = (info.generation + 1u) & EntityId::kGenerationMask;
    --_impl->liveCount;

    // The id is dead from here on; the slot stays linked and reserved until
    // the flush so open queries keep a stable layout.
    if (isDeferring())
    {
        defer([this, slot] { release(slot); });
        return;
    }
    release(slot);
}

void Registry::release(core::u32 slot)
{
    _impl->unlink(slot);
    _impl->freeSlots.push_back(slot);
}

void Registry::clear()
{
    std::vector<EntityId> alive;
    alive.reserve(_impl->liveCount);
    for (core::u32 slot = 0; slot < _impl->slots.size(); ++slot)
    {
        const auto& info = _impl->slots[slot];
        if (info.alive)
        {
            alive.emplace_back(info.generation, slot);
        }
    }
    for (EntityId id : alive)
    {
        destroyEntity(id);
    }
}

bool Registry::isAlive(EntityId id) const noexcept
{
    if (!id.isValid() || id.slot() >= _impl->slots.size())
    {
        return false;
    }
    const auto& info = _impl->slots[id.slot()];
    return info.alive && info.generation == id.generation();
}

core::u32 Registry::liveCount() const noexcept
{
    return _impl->liveCount;
}

core::Expected<void> Registry::removeComponent(EntityId id, ComponentId component)
{
    if (!isAlive(id))
    {
        return core::makeError(core::ErrorCode::kInvalidEntity,
                               "removeComponent<" + std::string{toString(component)} +
                               ">: stale entity " + toString(id));
    }

    if (isDeferring())
    {
        defer([this, id, component] {
            if (isAlive(id))
            {
                detach(id, component);
            }
        });
        return {};
    }

    detach(id, component);
    return {};
}

bool Registry::hasComponent(EntityId id, ComponentId component) const noexcept
{
    if (!isAlive(id))
    {
        return false;
    }
    return _impl->slots[id.slot()].archetype.has(component);
}

Archetype Registry::archetypeOf(EntityId id) const noexcept
{
    if (!isAlive(id))
    {
        return {};
    }
    return _impl->slots[id.slot()].archetype;
}

Query Registry::query(const Archetype& required, const Archetype& excluded) const
{
    const Impl::QueryKey key{required.bits(), excluded.bits()};

    if (auto it = _impl->queryCache.find(key); it != _impl->queryCache.end())
    {
        return Query{*this, it->second.groups};
    }

    std::vector<core::u32> matching;
    for (core::u32 g = 0; g < _impl->groups.size(); ++g)
    {
        if (Impl::matches(_impl->groups[g].archetype, required, excluded))
        {
            matching.push_back(g);
        }
    }
    _impl->queryCache.emplace(key, Impl::CachedQuery{required, excluded, matching});
    return Query{*this, std::move(matching)};
}

bool Registry::isDeferring() const noexcept
{
    return _impl->iterationDepth > 0;
}

core::usize Registry::groupCount() const noexcept
{
    return _impl->groups.size();
}

void Registry::beginIteration() noexcept
{
    ++_impl->iterationDepth;
}

void Registry::endIteration()
{
    if (--_impl->iterationDepth > 0)
    {
        return;
    }

    if (_pools.size() < _impl->slots.size())
    {
        _pools.resize(_impl->slots.size());
    }

    // Commands run with deferral off, so they cannot enqueue more work.
    auto commands = std::move(_impl->deferred);
    _impl->deferred.clear();
    if (!commands.empty())
    {
        core::Log::debug("ECS", "flushing " + std::to_string(commands.size()) + " deferred mutations");
    }
    for (auto& command : commands)
    {
        command();
    }
}

void Registry::defer(std::function<void()> command)
{
    _impl->deferred.push_back(std::move(command));
}

void Registry::attach(EntityId id, ComponentId component)
{
    auto& info = _impl->slots[id.slot()];
    if (info.archetype.has(component))
    {
        return;
    }

    _impl->unlink(id.slot());
    info.archetype.add(component);
    _impl->link(id);
}

void Registry::detach(EntityId id, ComponentId component)
{
    auto& info = _impl->slots[id.slot()];
    if (!info.archetype.has(component))
    {
        return;
    }

    _impl->unlink(id.slot());
    info.archetype.remove(component);
    _impl->link(id);
}

const std::vector<EntityId>& Registry::groupEntities(core::u32 group) const
{
    return _impl->groups[group].entities;
}

} // namespace rift::ecs
