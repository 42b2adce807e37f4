// Headless scripted run used by the smoke binary and integration tests.
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "../Types.h"
#include "../content/Content.h"

namespace Tower::Meta {

struct SmokeOptions {
    std::string name{"Smoke Test"};
    int gridSize{30};
    std::uint64_t seed{12345};
    int startingMoney{99999};
    int waves{1};             // waves to play before stopping
    int maxTicksPerWave{2000};
};

struct SmokeReport {
    bool ok{false};           // false once the run reaches GameOver
    int wavesPlayed{0};
    GameState finalState;
    nlohmann::json summary;   // summaryJson(finalState) plus ok / wavesPlayed
};

// Places level-3 tesla, cannon and mortar towers beside the path, then plays
// up to `waves` waves, each capped at `maxTicksPerWave` ticks.
SmokeReport runSmoke(const SmokeOptions& options, const Content& content = defaultContent());

}  // namespace Tower::Meta
