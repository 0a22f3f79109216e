#pragma once

#include <algorithm>
#include <string>
#include <utility>

namespace tickwell {

/// Hitpoints of a combatant. Poison and other damage-over-time effects
/// deal integer damage here.
struct Health {
    int current = 10;
    int max = 10;

    Health() = default;
    explicit Health(int hp) : current(hp), max(hp) {}
    Health(int hp, int maxHp) : current(hp), max(maxHp) {}

    /// Apply damage, returns actual damage dealt
    int applyDamage(int amount) {
        if (amount <= 0 || current <= 0) return 0;
        int dealt = std::min(amount, current);
        current -= dealt;
        return dealt;
    }

    bool isAlive() const { return current > 0; }
};

/// Stable name of an entity. Save keys are derived from it so records
/// survive entity ids being reassigned between sessions.
struct Name {
    std::string value;

    Name() = default;
    explicit Name(std::string v) : value(std::move(v)) {}
};

} // namespace tickwell
