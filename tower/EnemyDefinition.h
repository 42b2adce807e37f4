// Data structure describing an enemy archetype.
#pragma once

#include <string>

#include "Types.h"

namespace Tower {

struct EnemyDefinition {
    EnemyType type{EnemyType::Grunt};
    std::string name;
    int baseHp{1};
    double speedTilesPerSecond{1.0};
    int reward{0};
    double armorMultiplier{1.0};  // incoming damage scalar (0.75 = 25% reduction)
    bool isFlying{false};
    int leakDamage{1};            // lives lost on reaching the base
};

}  // namespace Tower
