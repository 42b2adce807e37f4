#include "Simulation.h"

#include "../engine/core/Time.h"
#include "systems/EconomySystem.h"
#include "systems/EnemyMovementSystem.h"
#include "systems/ProjectileSystem.h"
#include "systems/TowerTargetingSystem.h"
#include "systems/WaveScheduler.h"

namespace Tower {

GameState tick(const GameState& prev, const Content& content) {
    GameState next = prev;
    next.tick = prev.tick + 1;
    if (prev.waveState == WaveState::GameOver) return next;

    const Engine::TimeStep step{Engine::kFixedTickSeconds, static_cast<double>(next.tick) * Engine::kFixedTickSeconds};

    WaveScheduler(content).update(next);

    EnemyMovementSystem(content).update(next, step);
    EnemyMovementSystem::removeDead(next);

    TowerTargetingSystem(content).update(next);
    ProjectileSystem(content).update(next, step);

    EconomySystem(content).update(next);
    return next;
}

GameState startWave(const GameState& prev, const Content& content) {
    GameState next = prev;
    if (!WaveScheduler(content).startWave(next)) return prev;
    return next;
}

}  // namespace Tower
