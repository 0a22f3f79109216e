#pragma once

#include <entt/entt.hpp>

#include <cstdint>

namespace tickwell {

/// Entity handle - wrapper around EnTT entity for convenience
using Entity = entt::entity;

/// Null entity constant
constexpr Entity NullEntity = entt::null;

/// Integral identity of an entity, used for hashing and log output
inline uint32_t entityId(Entity entity) {
    return static_cast<uint32_t>(entt::to_integral(entity));
}

} // namespace tickwell
