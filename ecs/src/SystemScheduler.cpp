/**
 * @file SystemScheduler.cpp
 * @brief Priority-ordered sequential system scheduler.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rift/ecs/SystemScheduler.hpp>
#include <rift/ecs/Registry.hpp>
#include <rift/core/Constants.hpp>
#include <rift/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rift::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct SystemScheduler::Impl
{
    struct Entry
    {
        std::unique_ptr<ISystem> system;
        bool                     enabled{true};
    };

    /// Kept sorted by priority, stable with respect to registration.
    std::vector<Entry> entries;

    [[nodiscard]] Entry* find(std::string_view name) noexcept
    {
        auto it = std::ranges::find_if(entries, [name](const Entry& e) {
            return e.system->descriptor().name == name;
        });
        return it == entries.end() ? nullptr : &*it;
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

SystemScheduler::SystemScheduler()
    : _impl{std::make_unique<Impl>()}
{}

SystemScheduler::~SystemScheduler() = default;

SystemScheduler::SystemScheduler(SystemScheduler&&) noexcept            = default;
SystemScheduler& SystemScheduler::operator=(SystemScheduler&&) noexcept = default;

core::Expected<void> SystemScheduler::registerSystem(std::unique_ptr<ISystem> system)
{
    if (!system)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Null system");
    }

    const SystemDescriptor& desc = system->descriptor();
    if (_impl->find(desc.name) != nullptr)
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "System already registered: " + std::string{desc.name});
    }
    if (_impl->entries.size() >= core::kMaxSystems)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "Too many systems");
    }

    // Insert after every entry of equal or lower priority: ties keep
    // registration order.
    const core::i32 priority = desc.priority;
    auto position = std::ranges::upper_bound(_impl->entries, priority, {},
        [](const Impl::Entry& e) { return e.system->descriptor().priority; });

    core::Log::debug("ECS", "registered system " + std::string{desc.name} +
                            " (priority " + std::to_string(priority) + ")");
    _impl->entries.insert(position, Impl::Entry{std::move(system), true});
    return {};
}

core::Expected<void> SystemScheduler::setEnabled(std::string_view name, bool enabled)
{
    Impl::Entry* entry = _impl->find(name);
    if (entry == nullptr)
    {
        return core::makeError(core::ErrorCode::kNotFound, "Unknown system: " + std::string{name});
    }
    entry->enabled = enabled;
    return {};
}

bool SystemScheduler::isEnabled(std::string_view name) const noexcept
{
    const Impl::Entry* entry = _impl->find(name);
    return entry != nullptr && entry->enabled;
}

ISystem* SystemScheduler::find(std::string_view name) const noexcept
{
    Impl::Entry* entry = _impl->find(name);
    return entry == nullptr ? nullptr : entry->system.get();
}

void SystemScheduler::tick(Registry& registry, core::f32 dt)
{
    Registry::IterationScope scope{registry};

    for (auto& entry : _impl->entries)
    {
        if (!entry.enabled)
        {
            continue;
        }

        const SystemDescriptor& desc = entry.system->descriptor();
        const Query entities = registry.query(desc.required, desc.excluded);
        entry.system->update(registry, entities, dt);
    }
}

std::vector<std::string_view> SystemScheduler::executionOrder() const
{
    std::vector<std::string_view> names;
    names.reserve(_impl->entries.size());
    for (const auto& entry : _impl->entries)
    {
        names.push_back(entry.system->descriptor().name);
    }
    return names;
}

core::u32 SystemScheduler::systemCount() const noexcept
{
    return static_cast<core::u32>(_impl->entries.size());
}

} // namespace rift::ecs
