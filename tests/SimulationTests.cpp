// End-to-end tick behaviour: movement, leaks, rewards, wave states and whole runs.
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <functional>

#include "../tower/InitialState.h"
#include "../tower/Pathing.h"
#include "../tower/Simulation.h"
#include "../tower/meta/StateDigest.h"
#include "../tower/meta/TowerActions.h"

using namespace Tower;

namespace {

bool conserved(const GameState& s) {
    return s.stats.kills + static_cast<int>(s.enemies.size()) + s.stats.enemiesLeaked == s.stats.enemiesSpawned;
}

// Plays waves until Victory/GameOver or `maxWaves`, checking invariants after every tick.
GameState playWaves(GameState state, int maxWaves, const Content& content = defaultContent(),
                    const std::function<void(const GameState&)>& onTick = {}) {
    for (int w = 0; w < maxWaves; ++w) {
        state = startWave(state, content);
        assert(state.waveState == WaveState::Spawning);
        for (int i = 0; i < 40000 && isWaveActive(state.waveState); ++i) {
            state = tick(state, content);
            assert(conserved(state));
            assert(state.lives >= 0);
            if (onTick) onTick(state);
        }
        assert(!isWaveActive(state.waveState));
        if (state.waveState == WaveState::GameOver || state.waveState == WaveState::Victory) break;
    }
    return state;
}

Content singleWave(EnemyType type, int count) {
    Content content = makeDefaultContent();
    content.waves.clear();
    WaveDefinition w{};
    w.waveNumber = 1;
    w.spawns.push_back(WaveSpawn{type, count, 1});
    content.waves.push_back(w);
    content.finalWaveNumber = 5;
    return content;
}

}  // namespace

int main() {
    {
        const GameState s = createInitialState("fresh", 60, 99);
        assert(s.gridSize == 60 && s.grid.size() == 3600);
        assert(s.money == 300 && s.lives == 20 && s.speed == 1);
        assert(s.waveState == WaveState::Idle && s.tick == 0);
        assert(s.path.size() == 60);
        assert(s.spawn == (GridPoint{0, 30}) && s.base == (GridPoint{59, 30}));
        assert(s.tileAt(0, 30)->kind == TileKind::Spawn);
        assert(s.tileAt(59, 30)->kind == TileKind::Base);
        assert(s.tileAt(10, 30)->kind == TileKind::Path);
        assert(s.tileAt(10, 29)->kind == TileKind::Empty);
        assert(s.settings.name == "fresh");
        // Same arguments, same run.
        assert(Meta::stateDigest(s) == Meta::stateDigest(createInitialState("fresh", 60, 99)));
        assert(s.id != createInitialState("fresh", 60, 100).id);
    }
    {
        const GameState demo = createExampleState();
        assert(demo.gridSize == 55 && demo.seed == 424242);
        assert(demo.money == 2500 && demo.lives == 20);
        assert(demo.stats.wave == 3 && demo.waveState == WaveState::Complete);
        int towers = 0;
        for (const auto& tile : demo.grid) {
            if (!tile.tower) continue;
            ++towers;
            assert(tile.tower->level == 2);
        }
        assert(towers == 6);
        assert(demo.tileAt(10, 24)->tower->type == TowerType::Cannon);
        assert(demo.tileAt(22, 30)->tower->type == TowerType::Sniper);
        assert(demo.tileAt(14, 30)->tower->targeting == TargetingMode::Closest);
        const GameState next = startWave(demo);
        assert(next.stats.wave == 4 && next.waveState == WaveState::Spawning);
    }
    {
        // Movement: 1.2 tiles/s for 10 ticks is 0.6 tiles along the path.
        GameState s = startWave(createInitialState("move", 20, 1), singleWave(EnemyType::Grunt, 1));
        const Content content = singleWave(EnemyType::Grunt, 1);
        s = tick(s, content);
        assert(s.enemies.size() == 1);
        assert(s.waveState == WaveState::InProgress);
        assert(std::fabs(s.enemies[0].progress - 0.06) < 1e-12);
        for (int i = 0; i < 9; ++i) s = tick(s, content);
        assert(s.enemies[0].pathIndex == 0);
        assert(std::fabs(s.enemies[0].progress - 0.6) < 1e-9);
        for (int i = 0; i < 10; ++i) s = tick(s, content);
        assert(s.enemies[0].pathIndex == 1);
        assert(std::fabs(s.enemies[0].progress - 0.2) < 1e-9);
        const Engine::Vec2 pos = enemyPosition(s, s.enemies[0]);
        assert(std::fabs(pos.x - 1.7) < 1e-9 && pos.y == 10.5);

        // A slow halves the distance and wears off.
        GameState slowed = s;
        slowed.enemies[0].slow.apply(0.5, 2);
        const double before = slowed.enemies[0].progress;
        slowed = tick(slowed, content);
        assert(std::fabs(slowed.enemies[0].progress - before - 0.03) < 1e-9);
        slowed = tick(slowed, content);
        assert(slowed.enemies[0].slow.multiplier == 1.0);
        assert(std::fabs(slowed.enemies[0].progress - before - 0.09) < 1e-9);
    }
    {
        // Leaks: ordinary enemies cost one life, bosses five; no reward, lives never negative.
        const Content content = singleWave(EnemyType::Boss, 1);
        GameState s = createInitialState("leak", 8, 1);
        s.lives = 3;
        s = startWave(s, content);
        int guard = 0;
        while (s.waveState != WaveState::GameOver && guard++ < 1000) s = tick(s, content);
        assert(s.waveState == WaveState::GameOver);
        assert(s.lives == 0);
        assert(s.stats.leaks == 5);
        assert(s.stats.enemiesLeaked == 1);
        assert(s.stats.kills == 0 && s.money == 300);
        assert(s.speed == 0);
        assert(s.enemies.empty());
        // Queue and enemies were empty on that tick too, yet GameOver wins over Complete.
        assert(s.stats.wave == 1);

        // GameOver is terminal: only the tick counter moves.
        const GameState after = tick(s, content);
        assert(after.tick == s.tick + 1);
        assert(after.waveState == WaveState::GameOver);
        assert(after.lives == 0 && after.money == s.money && after.stats.leaks == s.stats.leaks);
        const GameState restarted = startWave(after, content);
        assert(restarted.waveState == WaveState::GameOver && restarted.stats.wave == 1);
    }
    {
        // Single grunt against a level-1 cannon covering the whole 7-tile path.
        const Content content = singleWave(EnemyType::Grunt, 1);
        GameState s = createInitialState("grunt", 7, 1);
        assert(Meta::grantTower(s, 3, 2, TowerType::Cannon, 1, content));
        s = startWave(s, content);
        int guard = 0;
        while (isWaveActive(s.waveState) && guard++ < 1000) {
            const GameState prev = s;
            const std::uint64_t before = Meta::stateDigest(prev);
            s = tick(prev, content);
            // Input snapshot is never touched.
            assert(Meta::stateDigest(prev) == before);
            assert(conserved(s));
        }
        assert(s.waveState == WaveState::Complete);
        assert(s.stats.kills == 1);
        assert(s.money == 315 && s.stats.moneyEarned == 15);
        assert(s.lives == 20 && s.stats.leaks == 0);
        assert(s.enemies.empty() && s.projectiles.empty());
        assert(s.tick > 60 && s.tick < 100);
        assert(s.speed == 1);

        // Between waves the cooldown drains to zero.
        for (int i = 0; i < 20; ++i) s = tick(s, content);
        assert(s.tileAt(3, 2)->tower->cooldownRemainingTicks == 0);
        assert(s.waveState == WaveState::Complete);
    }
    {
        // No defence: the default waves overrun 20 lives during wave 3.
        const GameState end = playWaves(createInitialState("undefended", 30, 12345), 20);
        assert(end.waveState == WaveState::GameOver);
        assert(end.stats.wave == 3);
        assert(end.lives == 0);
        assert(end.stats.leaks == 20);
        assert(end.stats.kills == 0);
        assert(end.speed == 0);
    }
    {
        // Two rows of level-3 towers hold all twenty waves, including the fallback
        // waves 11-20 that repeat wave 10 with extra bosses and tanks.
        GameState s = createInitialState("defended", 30, 12345);
        s.money = 0;
        const TowerType cycle[] = {TowerType::Tesla, TowerType::Mortar, TowerType::Sniper, TowerType::Ice,
                                   TowerType::Cannon};
        const int mid = 15;
        for (int dy : {-1, 1}) {
            for (int x = 1; x < 29; ++x) {
                assert(Meta::grantTower(s, x, mid + dy, cycle[(x + dy + 5) % 5], 3));
            }
        }
        int maxLiveEnemies = 0;
        int maxLiveBosses = 0;
        const GameState end =
            playWaves(s, 20, defaultContent(), [&maxLiveEnemies, &maxLiveBosses](const GameState& st) {
                maxLiveEnemies = std::max(maxLiveEnemies, static_cast<int>(st.enemies.size()));
                const auto bosses = std::count_if(st.enemies.begin(), st.enemies.end(),
                                                  [](const EnemyInstance& e) { return e.type == EnemyType::Boss; });
                maxLiveBosses = std::max(maxLiveBosses, static_cast<int>(bosses));
            });
        assert(end.waveState == WaveState::Victory);
        assert(end.stats.wave == 20);
        assert(end.speed == 0);
        assert(end.lives == 20 && end.stats.leaks == 0);
        assert(end.stats.kills == end.stats.enemiesSpawned);
        assert(end.money == end.stats.moneyEarned);
        // 157 authored enemies, nine fallback waves of 4 bosses + 13 tanks, then 7 + 16.
        assert(end.stats.enemiesSpawned == 157 + 9 * 17 + 23);
        assert(end.stats.moneyEarned == 12130);
        assert(maxLiveEnemies > 0);
        // Waves 1-10 never field more than one boss.
        assert(maxLiveBosses >= 4);

        // Victory is final for startWave but ticking stays safe.
        assert(startWave(end).waveState == WaveState::Victory);
        const GameState later = tick(end);
        assert(later.waveState == WaveState::Victory && later.tick == end.tick + 1);
    }
    {
        // Determinism: identical inputs give identical snapshots at every tick.
        GameState a = startWave(createExampleState());
        GameState b = startWave(createExampleState());
        for (int i = 0; i < 600; ++i) {
            a = tick(a);
            b = tick(b);
            assert(Meta::stateDigest(a) == Meta::stateDigest(b));
            if (!isWaveActive(a.waveState)) break;
        }
        assert(a.stats.kills == b.stats.kills && a.money == b.money && a.enemies.size() == b.enemies.size());
        assert(Meta::summaryJson(a) == Meta::summaryJson(b));
    }
    {
        // The digest sees every enemy and projectile field, not just positions and hp.
        GameState base = createInitialState("digest", 20, 5);
        EnemyInstance e{};
        e.id = 1;
        e.hp = e.maxHp = 80;
        e.speedTilesPerSecond = 1.2;
        e.reward = 15;
        base.enemies.push_back(e);
        ProjectileInstance p{};
        p.id = 1;
        p.targetEnemyId = 1;
        p.origin = p.position = Engine::Vec2{3.5, 2.5};
        p.speed = 7.0;
        p.damage = 18;
        base.projectiles.push_back(p);
        const std::uint64_t reference = Meta::stateDigest(base);

        const std::function<void(GameState&)> edits[] = {
            [](GameState& s) { s.enemies[0].speedTilesPerSecond = 1.8; },
            [](GameState& s) { s.enemies[0].armorMultiplier = 0.75; },
            [](GameState& s) { s.enemies[0].reward = 16; },
            [](GameState& s) { s.enemies[0].isFlying = true; },
            [](GameState& s) { s.projectiles[0].isInstant = true; },
            [](GameState& s) { s.projectiles[0].speed = 8.0; },
            [](GameState& s) { s.projectiles[0].splashRadius = 1.1; },
            [](GameState& s) { s.projectiles[0].slowMultiplier = 0.72; },
            [](GameState& s) { s.projectiles[0].slowDurationTicks = 70; },
            [](GameState& s) { s.projectiles[0].origin = Engine::Vec2{4.5, 2.5}; },
            [](GameState& s) { s.settings.name = "renamed"; },
        };
        for (const auto& edit : edits) {
            GameState changed = base;
            edit(changed);
            assert(Meta::stateDigest(changed) != reference);
        }
    }
    return 0;
}
