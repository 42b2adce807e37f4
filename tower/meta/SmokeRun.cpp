#include "SmokeRun.h"

#include <string>
#include <utility>

#include "../../engine/core/Logger.h"
#include "../InitialState.h"
#include "../Simulation.h"
#include "StateDigest.h"
#include "TowerActions.h"

namespace Tower::Meta {

SmokeReport runSmoke(const SmokeOptions& options, const Content& content) {
    GameState state = createInitialState(options.name, options.gridSize, options.seed, content);
    state.money = options.startingMoney;

    const int midY = options.gridSize / 2;
    struct Placement {
        int x;
        int y;
        TowerType type;
    };
    const Placement placements[] = {
        {8, midY - 2, TowerType::Tesla},
        {8, midY + 2, TowerType::Cannon},
        {13, midY - 2, TowerType::Mortar},
    };
    for (const auto& p : placements) {
        if (!grantTower(state, p.x, p.y, p.type, kMaxTowerLevel, content)) {
            Engine::logWarn("Smoke layout: no room for " + std::string(toString(p.type)) + " at (" +
                            std::to_string(p.x) + "," + std::to_string(p.y) + ")");
        }
    }

    SmokeReport report;
    for (int w = 0; w < options.waves; ++w) {
        const GameState started = startWave(state, content);
        if (started.waveState == state.waveState) {
            Engine::logInfo("Cannot start another wave from state " + std::string(toString(state.waveState)));
            break;
        }
        state = started;
        report.wavesPlayed += 1;
        Engine::logInfo("Wave " + std::to_string(state.stats.wave) + " started with " +
                        std::to_string(state.waveSpawnQueue.size()) + " enemies queued");

        WaveState last = state.waveState;
        for (int i = 0; i < options.maxTicksPerWave && isWaveActive(state.waveState); ++i) {
            state = tick(state, content);
            if (state.waveState != last) {
                Engine::logDebug("tick " + std::to_string(state.tick) + ": " + std::string(toString(last)) + " -> " +
                                 std::string(toString(state.waveState)));
                last = state.waveState;
            }
        }

        if (isWaveActive(state.waveState)) {
            Engine::logWarn("Wave " + std::to_string(state.stats.wave) + " still running after " +
                            std::to_string(options.maxTicksPerWave) + " ticks");
            break;
        }
        Engine::logInfo("Wave " + std::to_string(state.stats.wave) + " ended " +
                        std::string(toString(state.waveState)) + " at tick " + std::to_string(state.tick) +
                        " (lives " + std::to_string(state.lives) + ", kills " + std::to_string(state.stats.kills) +
                        ")");
        if (state.waveState == WaveState::GameOver || state.waveState == WaveState::Victory) break;
    }

    report.ok = state.waveState != WaveState::GameOver;
    report.summary = summaryJson(state);
    report.summary["ok"] = report.ok;
    report.summary["wavesPlayed"] = report.wavesPlayed;
    report.finalState = std::move(state);
    return report;
}

}  // namespace Tower::Meta
