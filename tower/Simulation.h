// Pure tick function and wave start for a tower-defense run.
#pragma once

#include "Types.h"
#include "content/Content.h"

namespace Tower {

// Advances the run by one fixed 0.05 s step and returns the new snapshot.
// `prev` is never modified. Order within a tick:
//   tick counter, (stop if GameOver), spawn, move/leak, drop leaked,
//   towers, projectiles (including this tick's shots), rewards, transitions.
GameState tick(const GameState& prev, const Content& content = defaultContent());

// Next wave from Idle or Complete; any other state is returned unchanged.
GameState startWave(const GameState& prev, const Content& content = defaultContent());

}  // namespace Tower
