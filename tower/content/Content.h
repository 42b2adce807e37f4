// Balance data for a run: enemy archetypes, tower tables, waves and run defaults.
#pragma once

#include <array>
#include <string>
#include <vector>

#include "../EnemyDefinition.h"
#include "../TowerDefinition.h"
#include "../WaveDefinition.h"

namespace Tower {

struct RunDefaults {
    int gridSize{60};
    int startingMoney{300};
    int startingLives{20};
    int startingSpeed{1};
};

struct Content {
    std::array<EnemyDefinition, kEnemyTypeCount> enemies{};
    std::array<TowerDefinition, kTowerTypeCount> towers{};
    std::vector<WaveDefinition> waves;  // sorted by waveNumber
    int finalWaveNumber{0};             // clearing this wave is a victory

    RunDefaults run{};
    int slowDurationTicks{70};
    double projectileHitRadius{0.16};   // tiles
    double hardHpMultiplier{1.35};

    const EnemyDefinition& enemy(EnemyType type) const { return enemies[static_cast<std::size_t>(type)]; }
    const TowerDefinition& tower(TowerType type) const { return towers[static_cast<std::size_t>(type)]; }
    EnemyDefinition& enemy(EnemyType type) { return enemies[static_cast<std::size_t>(type)]; }
    TowerDefinition& tower(TowerType type) { return towers[static_cast<std::size_t>(type)]; }

    // Level is clamped to 1..3.
    const TowerLevelStats& towerStats(TowerType type, int level) const {
        return tower(type).levels[static_cast<std::size_t>(clampTowerLevel(level) - 1)];
    }

    int lastAuthoredWaveNumber() const { return waves.empty() ? 0 : waves.back().waveNumber; }
};

// Built-in tables, shared and immutable.
const Content& defaultContent();
Content makeDefaultContent();

// Structural checks run once when content is built or loaded. Returns false
// and fills `error` with the first problem found.
bool validateContent(const Content& content, std::string* error = nullptr);

// Overlay a JSON document onto `out`. On any parse or validation failure the
// problem is logged and `out` is left unchanged.
bool parseContentJson(const std::string& text, Content& out);
bool loadContentFile(const std::string& path, Content& out);

}  // namespace Tower
