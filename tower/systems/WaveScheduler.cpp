#include "WaveScheduler.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Tower {

std::optional<WaveDefinition> WaveScheduler::waveDefinitionFor(int waveNumber) const {
    for (const auto& w : content_.waves) {
        if (w.waveNumber == waveNumber) return w;
    }
    if (content_.waves.empty()) return std::nullopt;

    const WaveDefinition& last = content_.waves.back();
    const int scale = std::max(1, waveNumber / std::max(1, last.waveNumber));
    WaveDefinition scaled = last;
    scaled.waveNumber = waveNumber;
    for (auto& group : scaled.spawns) {
        group.count += scale * 3;
    }
    return scaled;
}

std::vector<SpawnQueueEntry> WaveScheduler::buildSpawnQueue(int waveNumber) const {
    std::vector<SpawnQueueEntry> queue;
    const auto def = waveDefinitionFor(waveNumber);
    if (!def) return queue;
    for (const auto& group : def->spawns) {
        for (int i = 0; i < group.count; ++i) {
            SpawnQueueEntry entry{};
            entry.enemyType = group.type;
            entry.ticksUntilSpawn = queue.empty() ? 1 : group.intervalTicks;
            queue.push_back(entry);
        }
    }
    return queue;
}

bool WaveScheduler::startWave(GameState& state) const {
    if (state.waveState != WaveState::Idle && state.waveState != WaveState::Complete) return false;
    const int nextWave = state.stats.wave + 1;
    state.waveSpawnQueue = buildSpawnQueue(nextWave);
    state.stats.wave = nextWave;
    state.waveState = WaveState::Spawning;
    return true;
}

void WaveScheduler::update(GameState& state) const {
    if (!isWaveActive(state.waveState)) return;

    auto& queue = state.waveSpawnQueue;
    if (!queue.empty()) {
        queue.front().ticksUntilSpawn -= 1;
        std::size_t released = 0;
        while (released < queue.size() && queue[released].ticksUntilSpawn <= 0) {
            state.enemies.push_back(spawnEnemy(state, queue[released].enemyType));
            ++released;
        }
        queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(released));
    }

    if (state.waveState == WaveState::Spawning && queue.empty()) {
        state.waveState = WaveState::InProgress;
    }
}

EnemyInstance WaveScheduler::spawnEnemy(GameState& state, EnemyType type) const {
    const EnemyDefinition& def = content_.enemy(type);
    const int maxHp = static_cast<int>(std::floor(def.baseHp * hpMultiplier(state.settings.difficulty)));

    EnemyInstance enemy{};
    enemy.id = state.nextEnemyId++;
    enemy.type = type;
    enemy.hp = maxHp;
    enemy.maxHp = maxHp;
    enemy.speedTilesPerSecond = def.speedTilesPerSecond;
    enemy.armorMultiplier = def.armorMultiplier;
    enemy.isFlying = def.isFlying;
    enemy.reward = def.reward;
    enemy.pathIndex = 0;
    enemy.progress = 0.0;
    state.stats.enemiesSpawned += 1;
    return enemy;
}

}  // namespace Tower
