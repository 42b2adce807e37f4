// Tower archetypes and their per-level stat tables.
#pragma once

#include <array>
#include <optional>
#include <string>

#include "Types.h"

namespace Tower {

// At or above this speed a tower's shots resolve on the firing tick.
constexpr double kInstantProjectileSpeed = 900.0;

struct TowerLevelStats {
    int damage{0};
    double range{0.0};           // tiles
    int fireCooldownTicks{1};
    double projectileSpeed{1.0}; // tiles/sec
    double splashRadius{0.0};    // tiles
    std::optional<double> slowMultiplier;  // e.g. 0.6 = 40% slow

    bool isInstant() const { return projectileSpeed >= kInstantProjectileSpeed; }
    // A zero multiplier means the level does not slow.
    bool slows() const { return slowMultiplier && *slowMultiplier != 0.0; }
};

struct TowerDefinition {
    TowerType type{TowerType::Cannon};
    std::string name;
    std::string description;
    int baseCost{0};               // placement price, also charged per upgrade
    double sellRefundRatio{0.7};
    TargetingMode defaultTargeting{TargetingMode::First};
    std::array<TowerLevelStats, kMaxTowerLevel> levels{};
};

inline int clampTowerLevel(int level) {
    if (level <= 1) return 1;
    if (level >= kMaxTowerLevel) return kMaxTowerLevel;
    return level;
}

}  // namespace Tower
