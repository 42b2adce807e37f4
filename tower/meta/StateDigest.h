// Run fingerprints and JSON summaries for hosts and determinism checks.
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "../Types.h"

namespace Tower::Meta {

// 64-bit FNV-1a over every simulated field (tick, economy, towers, enemies,
// projectiles, queue, stats). Equal states hash equal on every platform.
std::uint64_t stateDigest(const GameState& state);

std::string digestHex(std::uint64_t digest);

// {tick, wave, waveState, kills, leaks, money, lives, enemiesRemaining,
//  projectilesRemaining, digest}
nlohmann::json summaryJson(const GameState& state);

}  // namespace Tower::Meta
