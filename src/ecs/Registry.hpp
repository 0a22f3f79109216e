#pragma once

#include "ecs/Entity.hpp"

#include <entt/entt.hpp>

#include <utility>

namespace tickwell {

/// Entity registry wrapper providing the component lookups the status
/// systems need. Entities own their components; buff timers are owned by
/// BuffTimerService, not by the entity.
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    // Non-copyable, movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    /// Create a new entity
    Entity create() {
        return m_registry.create();
    }

    /// Check if entity is valid
    bool valid(Entity entity) const {
        return entity != NullEntity && m_registry.valid(entity);
    }

    /// Add a component to an entity
    template<typename Component, typename... Args>
    Component& add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    /// Remove a component from an entity (no-op if it is missing)
    template<typename Component>
    void remove(Entity entity) {
        if (valid(entity)) {
            m_registry.remove<Component>(entity);
        }
    }

    /// Get a component (returns nullptr if the entity or component is missing)
    template<typename Component>
    Component* tryGet(Entity entity) {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    template<typename Component>
    const Component* tryGet(Entity entity) const {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    /// Get a component from an entity (assumes it exists)
    template<typename Component>
    Component& get(Entity entity) {
        return m_registry.get<Component>(entity);
    }

    /// Get a view of entities with specified components
    template<typename... Components>
    auto view() {
        return m_registry.view<Components...>();
    }

private:
    entt::registry m_registry;
};

} // namespace tickwell
