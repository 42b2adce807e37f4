#include "ProjectileSystem.h"

#include <utility>
#include <vector>

#include "../../engine/gameplay/Combat.h"
#include "../Pathing.h"

namespace Tower {

namespace {

EnemyInstance* findEnemy(GameState& state, EnemyId id) {
    for (auto& e : state.enemies) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

}  // namespace

void ProjectileSystem::applyHit(GameState& state, const ProjectileInstance& proj, const EnemyInstance& target) {
    const Engine::Vec2 hitPos = enemyPosition(state, target);
    const double splashSq = proj.splashRadius > 0.0 ? proj.splashRadius * proj.splashRadius : 0.0;
    const Engine::Gameplay::DamageEvent dmg{proj.damage, proj.splashRadius};

    for (auto& enemy : state.enemies) {
        if (!enemy.alive()) continue;
        bool hit = enemy.id == proj.targetEnemyId;
        if (!hit && splashSq > 0.0) {
            hit = Engine::distanceSquared(hitPos, enemyPosition(state, enemy)) <= splashSq;
        }
        if (!hit) continue;
        Engine::Gameplay::applyDamage(enemy.hp, dmg, enemy.armorMultiplier);
        if (proj.slows()) {
            enemy.slow.apply(*proj.slowMultiplier, proj.slowDurationTicks);
        }
    }
}

void ProjectileSystem::update(GameState& state, const Engine::TimeStep& step) const {
    const double hitRadiusSq = content_.projectileHitRadius * content_.projectileHitRadius;
    std::vector<ProjectileInstance> remaining;
    remaining.reserve(state.projectiles.size());

    for (const auto& proj : state.projectiles) {
        const EnemyInstance* target = findEnemy(state, proj.targetEnemyId);
        if (!target || !target->alive()) continue;

        const Engine::Vec2 targetPos = enemyPosition(state, *target);
        if (proj.isInstant || Engine::distanceSquared(targetPos, proj.position) <= hitRadiusSq) {
            applyHit(state, proj, *target);
            continue;
        }

        ProjectileInstance moved = proj;
        moved.velocity = Engine::directionTo(proj.position, targetPos) * proj.speed;
        moved.position += moved.velocity * step.deltaSeconds;
        remaining.push_back(moved);
    }

    state.projectiles = std::move(remaining);
}

}  // namespace Tower
