#include "EconomySystem.h"

#include <algorithm>

#include "../Pathing.h"

namespace Tower {

void EconomySystem::collectRewards(GameState& state) const {
    for (const auto& enemy : state.enemies) {
        if (enemy.alive() || isEnemyAtBase(state, enemy)) continue;
        state.money += enemy.reward;
        state.stats.moneyEarned += enemy.reward;
        state.stats.kills += 1;
    }
    state.enemies.erase(std::remove_if(state.enemies.begin(), state.enemies.end(),
                                       [](const EnemyInstance& e) { return !e.alive(); }),
                        state.enemies.end());
}

void EconomySystem::updateWaveState(GameState& state) const {
    if (isWaveActive(state.waveState) && state.waveSpawnQueue.empty() && state.enemies.empty()) {
        if (state.stats.wave >= content_.finalWaveNumber) {
            state.waveState = WaveState::Victory;
            state.speed = 0;
        } else {
            state.waveState = WaveState::Complete;
        }
    }
    if (state.lives <= 0 && state.waveState != WaveState::GameOver) {
        state.waveState = WaveState::GameOver;
        state.speed = 0;
    }
}

}  // namespace Tower
