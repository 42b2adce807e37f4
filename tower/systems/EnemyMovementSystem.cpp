#include "EnemyMovementSystem.h"

#include <algorithm>

#include "../Pathing.h"

namespace Tower {

bool EnemyMovementSystem::advance(const GameState& state, EnemyInstance& enemy, double distance) {
    while (distance > 0.0 && !isEnemyAtBase(state, enemy)) {
        const double remaining = 1.0 - enemy.progress;
        if (distance < remaining) {
            enemy.progress += distance;
            distance = 0.0;
        } else {
            distance -= remaining;
            enemy.pathIndex += 1;
            enemy.progress = 0.0;
        }
    }
    return isEnemyAtBase(state, enemy);
}

void EnemyMovementSystem::update(GameState& state, const Engine::TimeStep& step) const {
    for (auto& enemy : state.enemies) {
        if (!enemy.alive()) continue;

        enemy.slow.tick();
        const double distance = enemy.speedTilesPerSecond * enemy.slow.multiplier * step.deltaSeconds;
        if (!advance(state, enemy, distance)) continue;

        const int damage = content_.enemy(enemy.type).leakDamage;
        state.lives = std::max(0, state.lives - damage);
        state.stats.leaks += damage;
        state.stats.enemiesLeaked += 1;
        enemy.hp = 0;
    }
}

void EnemyMovementSystem::removeDead(GameState& state) {
    state.enemies.erase(std::remove_if(state.enemies.begin(), state.enemies.end(),
                                       [](const EnemyInstance& e) { return !e.alive(); }),
                        state.enemies.end());
}

}  // namespace Tower
