// Projectile hits, splash, slows and homing.
#include <cassert>
#include <cmath>

#include "../tower/InitialState.h"
#include "../tower/Pathing.h"
#include "../tower/systems/ProjectileSystem.h"
#include "../tower/systems/WaveScheduler.h"

using namespace Tower;

namespace {

const Engine::TimeStep kStep{Engine::kFixedTickSeconds, 0.0};

EnemyInstance& addEnemy(GameState& state, EnemyType type, int pathIndex, double progress) {
    EnemyInstance e = WaveScheduler(defaultContent()).spawnEnemy(state, type);
    e.pathIndex = pathIndex;
    e.progress = progress;
    state.enemies.push_back(e);
    return state.enemies.back();
}

ProjectileInstance shot(GameState& state, EnemyId target, int damage, double splash) {
    ProjectileInstance p{};
    p.id = state.nextProjectileId++;
    p.targetEnemyId = target;
    p.damage = damage;
    p.splashRadius = splash;
    return p;
}

}  // namespace

int main() {
    const ProjectileSystem projectiles(defaultContent());
    {
        // Instant splash: target plus neighbours within the radius, armor applied per enemy.
        GameState state = createInitialState("splash", 11, 1);
        addEnemy(state, EnemyType::Grunt, 4, 0.0);    // (4.5, 5.5)
        addEnemy(state, EnemyType::Armored, 4, 0.5);  // 0.5 away
        addEnemy(state, EnemyType::Grunt, 6, 0.0);    // 2.0 away
        ProjectileInstance p = shot(state, 1, 14, 0.6);
        p.isInstant = true;
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[0].hp == 80 - 14);
        assert(state.enemies[1].hp == 140 - 10);
        assert(state.enemies[2].hp == 80);
    }
    {
        // No splash: only the target is hit even when others overlap it.
        GameState state = createInitialState("single", 11, 1);
        addEnemy(state, EnemyType::Grunt, 4, 0.0);
        addEnemy(state, EnemyType::Grunt, 4, 0.0);
        ProjectileInstance p = shot(state, 2, 65, 0.0);
        p.isInstant = true;
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.enemies[0].hp == 80);
        assert(state.enemies[1].hp == 15);
    }
    {
        // Missing or dead targets drop the projectile without damage.
        GameState state = createInitialState("dropped", 11, 1);
        addEnemy(state, EnemyType::Grunt, 4, 0.0).hp = 0;
        addEnemy(state, EnemyType::Grunt, 4, 0.0);
        ProjectileInstance gone = shot(state, 99, 50, 2.0);
        gone.isInstant = true;
        ProjectileInstance dead = shot(state, 1, 50, 2.0);
        dead.isInstant = true;
        state.projectiles.push_back(gone);
        state.projectiles.push_back(dead);
        projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[1].hp == 80);
    }
    {
        // Homing: re-aims at the target and moves speed * dt per tick.
        GameState state = createInitialState("homing", 11, 1);
        addEnemy(state, EnemyType::Grunt, 4, 0.0);  // (4.5, 5.5)
        ProjectileInstance p = shot(state, 1, 18, 0.0);
        p.position = Engine::Vec2{0.5, 2.5};        // 5 tiles away
        p.velocity = Engine::Vec2{7.0, 0.0};        // stale heading
        p.speed = 7.0;
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.projectiles.size() == 1);
        const ProjectileInstance& moved = state.projectiles[0];
        assert(std::fabs(moved.velocity.x - 5.6) < 1e-12 && std::fabs(moved.velocity.y - 4.2) < 1e-12);
        assert(std::fabs(moved.position.x - 0.78) < 1e-12 && std::fabs(moved.position.y - 2.71) < 1e-12);
        assert(state.enemies[0].hp == 80);

        // Keeps flying until within the hit radius, then lands once.
        int guard = 0;
        while (!state.projectiles.empty() && guard++ < 100) projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[0].hp == 62);
    }
    {
        // Within the 0.16 hit radius counts as a hit even for slow shots.
        GameState state = createInitialState("near", 11, 1);
        addEnemy(state, EnemyType::Grunt, 4, 0.0);
        ProjectileInstance p = shot(state, 1, 10, 0.0);
        p.position = Engine::Vec2{4.6, 5.6};
        p.speed = 7.0;
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[0].hp == 70);
    }
    {
        // Slows stack by strongest multiplier and longest duration on every enemy hit.
        GameState state = createInitialState("slow", 11, 1);
        EnemyInstance& slowed = addEnemy(state, EnemyType::Tank, 4, 0.0);
        slowed.slow.apply(0.5, 20);
        addEnemy(state, EnemyType::Tank, 4, 0.25);
        ProjectileInstance p = shot(state, 1, 6, 0.5);
        p.isInstant = true;
        p.slowMultiplier = 0.6;
        p.slowDurationTicks = 40;
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.enemies[0].slow.multiplier == 0.5);
        assert(state.enemies[0].slow.remainingTicks == 40);
        assert(state.enemies[1].slow.multiplier == 0.6);
        assert(state.enemies[1].slow.remainingTicks == 40);
        assert(state.enemies[0].hp == 194 && state.enemies[1].hp == 194);
    }
    {
        // A zero slow multiplier is no slow at all: damage lands, speed is untouched.
        GameState state = createInitialState("noslow", 11, 1);
        addEnemy(state, EnemyType::Tank, 4, 0.0);
        ProjectileInstance p = shot(state, 1, 6, 0.0);
        p.isInstant = true;
        p.slowMultiplier = 0.0;
        p.slowDurationTicks = 70;
        assert(!p.slows());
        state.projectiles.push_back(p);
        projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[0].hp == 194);
        assert(state.enemies[0].slow.multiplier == 1.0);
        assert(state.enemies[0].slow.remainingTicks == 0);
    }
    {
        // Two shots at one target in the same tick: the second is dropped once it dies.
        GameState state = createInitialState("overkill", 11, 1);
        addEnemy(state, EnemyType::Runner, 4, 0.0);
        ProjectileInstance a = shot(state, 1, 65, 0.0);
        a.isInstant = true;
        ProjectileInstance b = shot(state, 1, 65, 0.0);
        b.isInstant = true;
        state.projectiles.push_back(a);
        state.projectiles.push_back(b);
        projectiles.update(state, kStep);
        assert(state.projectiles.empty());
        assert(state.enemies[0].hp == 40 - 65);
    }
    return 0;
}
