#include "TowerTargetingSystem.h"

#include <limits>

#include "../Pathing.h"

namespace Tower {

const EnemyInstance* TowerTargetingSystem::selectTarget(const GameState& state, const Engine::Vec2& towerPos,
                                                         double range, TargetingMode mode) {
    const double rangeSq = range * range;
    const EnemyInstance* best = nullptr;
    double bestScore = -std::numeric_limits<double>::infinity();

    for (const auto& enemy : state.enemies) {
        if (!enemy.alive()) continue;
        const double d2 = Engine::distanceSquared(towerPos, enemyPosition(state, enemy));
        if (d2 > rangeSq) continue;

        const double score = mode == TargetingMode::First ? enemy.pathIndex + enemy.progress : -d2;
        if (score > bestScore) {
            bestScore = score;
            best = &enemy;
        }
    }
    return best;
}

bool TowerTargetingSystem::tryFire(GameState& state, TowerInstance& tower, const Engine::Vec2& towerPos) const {
    if (tower.cooldownRemainingTicks > 0) {
        tower.cooldownRemainingTicks -= 1;
        return false;
    }

    const TowerLevelStats& stats = content_.towerStats(tower.type, tower.level);
    const EnemyInstance* target = selectTarget(state, towerPos, stats.range, tower.targeting);
    if (!target) return false;

    ProjectileInstance proj{};
    proj.id = state.nextProjectileId++;
    proj.origin = towerPos;
    proj.position = towerPos;
    proj.targetEnemyId = target->id;
    proj.isInstant = stats.isInstant();
    proj.speed = stats.projectileSpeed;
    proj.damage = stats.damage;
    proj.splashRadius = stats.splashRadius;
    if (stats.slows()) {
        proj.slowMultiplier = stats.slowMultiplier;
        proj.slowDurationTicks = content_.slowDurationTicks;
    }
    if (!proj.isInstant) {
        proj.velocity = Engine::directionTo(towerPos, enemyPosition(state, *target)) * stats.projectileSpeed;
    }

    tower.cooldownRemainingTicks = stats.fireCooldownTicks;
    state.projectiles.push_back(proj);
    return true;
}

void TowerTargetingSystem::update(GameState& state) const {
    const bool active = isWaveActive(state.waveState);
    for (auto& tile : state.grid) {
        if (!tile.tower) continue;
        TowerInstance& tower = *tile.tower;
        if (!active) {
            if (tower.cooldownRemainingTicks > 0) tower.cooldownRemainingTicks -= 1;
            continue;
        }
        tryFire(state, tower, towerPosition(tile.x, tile.y));
    }
}

}  // namespace Tower
