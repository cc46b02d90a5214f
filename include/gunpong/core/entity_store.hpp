/**
 * @file entity_store.hpp
 * @brief Sparse entity/component store backed by an EnTT registry.
 *
 * Entities are EnTT identifiers; components are plain structs. Queries are
 * EnTT views, so the set of components a query touches is checked at compile
 * time and a single pass may read one component while writing another.
 *
 * Example usage:
 * @code
 * EntityStore store;
 * auto ball = store.spawn(Components::Transform{}, Components::Ball{16.0F, 1.0F});
 * for (auto [entity, transform, b] : store.query<Components::Transform, Components::Ball>().each()) {
 *     transform.position += transform.velocity;
 * }
 * store.despawn(ball);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <entt/entt.hpp>

using Entity = entt::entity;

/**
 * @brief Raised when an operation names an entity (or component) that does not exist.
 */
class EntityNotFound : public std::runtime_error {
public:
    explicit EntityNotFound(Entity entity, const std::string& what = "entity not found");

    Entity entity() const { return missing; }

private:
    Entity missing;
};

/**
 * @class EntityStore
 * @brief Owns every simulated entity and its components.
 *
 * Structural changes (spawn, despawn, clear) must not be made while a query
 * returned by this store is being iterated; systems queue them instead.
 */
class EntityStore {
public:
    EntityStore() = default;

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    /**
     * @brief Creates an entity owning the given components.
     * @return The new entity's identifier
     */
    template <typename... Component>
    Entity spawn(Component&&... components) {
        const Entity entity = registry.create();
        ++live;
        (registry.emplace<std::decay_t<Component>>(entity, std::forward<Component>(components)), ...);
        return entity;
    }

    /**
     * @brief Destroys an entity and all of its components.
     * @throws EntityNotFound if the entity is not live
     */
    void despawn(Entity entity);

    /**
     * @brief Despawns an entity that the caller expects to be live.
     *
     * A missing entity is a logic error: when strict, EntityNotFound is
     * thrown, otherwise a warning is logged and the store is left untouched.
     * @return True if the entity was removed
     */
    bool despawnExpected(Entity entity, bool strict);

    /** @brief True if the entity is live. */
    bool contains(Entity entity) const;

    /** @brief True if the entity is live and owns every listed component. */
    template <typename... Component>
    bool has(Entity entity) const {
        return contains(entity) && registry.all_of<Component...>(entity);
    }

    /**
     * @brief Mutable access to one component of a live entity.
     * @throws EntityNotFound if the entity or the component is missing
     */
    template <typename Component>
    Component& get(Entity entity) {
        if (!has<Component>(entity)) {
            throw EntityNotFound(entity, "component not found on entity");
        }
        return registry.get<Component>(entity);
    }

    template <typename Component>
    const Component& get(Entity entity) const {
        if (!has<Component>(entity)) {
            throw EntityNotFound(entity, "component not found on entity");
        }
        return registry.get<Component>(entity);
    }

    /**
     * @brief All live entities owning every listed component.
     *
     * Iterate with each() to receive (entity, components&...).
     */
    template <typename... Component>
    auto query() {
        return registry.view<Component...>();
    }

    /** @brief Read-only variant; components are handed out as const. */
    template <typename... Component>
    auto query() const {
        return registry.view<Component...>();
    }

    /** @brief Number of entities owning every listed component. */
    template <typename... Component>
    std::size_t count() const {
        std::size_t n = 0;
        for (auto entity : registry.view<Component...>()) {
            (void)entity;
            ++n;
        }
        return n;
    }

    /** @brief Removes every entity. */
    void clear();

    /** @brief Number of live entities. */
    std::size_t size() const;

private:
    entt::registry registry;
    std::size_t live = 0;
};
