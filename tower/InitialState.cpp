#include "InitialState.h"

#include <sstream>

#include "../engine/core/Logger.h"
#include "Pathing.h"
#include "meta/TowerActions.h"

namespace Tower {

namespace {

std::string makeRunId(const std::string& name, std::uint64_t seed) {
    // FNV-1a over the name keeps ids stable across runs and platforms.
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : name) {
        h ^= c;
        h *= 1099511628211ull;
    }
    std::ostringstream ss;
    ss << "tower-run-" << std::hex << seed << "-" << (h & 0xffffffffull);
    return ss.str();
}

}  // namespace

GameState createInitialState(const std::string& name, int gridSize, std::uint64_t seed, const Content& content) {
    GameState state;
    state.id = makeRunId(name, seed);
    state.seed = seed;
    state.gridSize = gridSize > 0 ? gridSize : 0;
    state.grid.reserve(static_cast<std::size_t>(state.gridSize) * state.gridSize);
    for (int y = 0; y < state.gridSize; ++y) {
        for (int x = 0; x < state.gridSize; ++x) {
            Tile tile{};
            tile.x = x;
            tile.y = y;
            state.grid.push_back(tile);
        }
    }

    const PathLayout layout = generateStraightMidPath(state.gridSize);
    applyPathToGrid(state, layout);
    state.path = layout.path;
    state.spawn = layout.spawn;
    state.base = layout.base;

    state.tick = 0;
    state.speed = content.run.startingSpeed;
    state.money = content.run.startingMoney;
    state.lives = content.run.startingLives;
    state.waveState = WaveState::Idle;
    state.settings.name = name.empty() ? std::string("IsoTower Run") : name;
    state.settings.difficulty = Difficulty::Normal;
    return state;
}

GameState createInitialState(const std::string& name, std::uint64_t seed, const Content& content) {
    return createInitialState(name, content.run.gridSize, seed, content);
}

GameState createExampleState(const Content& content) {
    const int gridSize = 55;
    GameState state = createInitialState("Example Run", gridSize, 424242, content);
    state.money = 2500;
    state.lives = 20;

    const int midY = gridSize / 2;
    struct Placement {
        int x;
        int y;
        TowerType type;
    };
    const Placement placements[] = {
        {10, midY - 3, TowerType::Cannon}, {10, midY + 3, TowerType::Ice},   {14, midY - 3, TowerType::Tesla},
        {14, midY + 3, TowerType::Archer}, {18, midY - 3, TowerType::Mortar}, {22, midY + 3, TowerType::Sniper},
    };
    for (const auto& p : placements) {
        if (!Meta::grantTower(state, p.x, p.y, p.type, 2, content)) {
            Engine::logWarn("Example layout skipped " + std::string(toString(p.type)) + " tower");
        }
    }

    state.stats = RunStats{};
    state.stats.wave = 3;
    state.waveState = WaveState::Complete;
    return state;
}

}  // namespace Tower
