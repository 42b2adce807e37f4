// Builds wave spawn queues and releases enemies from them tick by tick.
#pragma once

#include <optional>
#include <vector>

#include "../Types.h"
#include "../content/Content.h"

namespace Tower {

class WaveScheduler {
public:
    explicit WaveScheduler(const Content& content) : content_(content) {}

    // Authored definition for `waveNumber`, or the last authored wave with each
    // group's count raised by scale * 3 (scale = max(1, wave / lastWave)).
    std::optional<WaveDefinition> waveDefinitionFor(int waveNumber) const;

    // Flattened queue; the first entry waits 1 tick, every other entry waits
    // its group's interval.
    std::vector<SpawnQueueEntry> buildSpawnQueue(int waveNumber) const;

    // Begins the next wave. Only legal from Idle or Complete; returns false and
    // leaves `state` alone otherwise.
    bool startWave(GameState& state) const;

    // Spawns due enemies while a wave is active.
    void update(GameState& state) const;

    EnemyInstance spawnEnemy(GameState& state, EnemyType type) const;

    double hpMultiplier(Difficulty difficulty) const {
        return difficulty == Difficulty::Hard ? content_.hardHpMultiplier : 1.0;
    }

private:
    const Content& content_;
};

}  // namespace Tower
