#include "gunpong/core/entity_store.hpp"

#include <cstdint>
#include <iostream>

namespace {

std::string describe(Entity entity, const std::string& what) {
    return what + " (id " + std::to_string(static_cast<std::uint64_t>(entt::to_integral(entity))) + ")";
}

} // namespace

EntityNotFound::EntityNotFound(Entity entity, const std::string& what)
    : std::runtime_error(describe(entity, what))
    , missing(entity)
{}

void EntityStore::despawn(Entity entity) {
    if (!contains(entity)) {
        throw EntityNotFound(entity);
    }
    registry.destroy(entity);
    --live;
}

bool EntityStore::despawnExpected(Entity entity, bool strict) {
    if (contains(entity)) {
        despawn(entity);
        return true;
    }
    if (strict) {
        throw EntityNotFound(entity, "removal of a dead entity");
    }
    std::cerr << "[EntityStore] Warning: entity " << entt::to_integral(entity)
              << " was already removed" << std::endl;
    return false;
}

bool EntityStore::contains(Entity entity) const {
    return entity != entt::null && registry.valid(entity);
}

void EntityStore::clear() {
    registry.clear();
    live = 0;
}

std::size_t EntityStore::size() const {
    return live;
}
