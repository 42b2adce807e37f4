// Authored wave layouts.
#pragma once

#include <vector>

#include "Types.h"

namespace Tower {

struct WaveSpawn {
    EnemyType type{EnemyType::Grunt};
    int count{1};
    int intervalTicks{1};  // delay between consecutive spawns of this group
};

struct WaveDefinition {
    int waveNumber{1};
    std::vector<WaveSpawn> spawns;
    int endDelayTicks{0};  // suggested pause before the next wave; the host decides
};

}  // namespace Tower
