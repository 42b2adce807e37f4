// Construction of fresh and demo run snapshots.
#pragma once

#include <cstdint>
#include <string>

#include "Types.h"
#include "content/Content.h"

namespace Tower {

// Grass grid with a straight mid-row path, starting money/lives/speed from
// `content.run`, state Idle. The run id is derived from name and seed so two
// calls with the same arguments produce identical snapshots.
GameState createInitialState(const std::string& name, int gridSize, std::uint64_t seed,
                             const Content& content = defaultContent());

// Same, using the content's default grid size.
GameState createInitialState(const std::string& name, std::uint64_t seed, const Content& content = defaultContent());

// Demo run: 55x55 grid, seed 424242, 2500 money, six level-2 towers on both
// sides of the path, wave 3 complete.
GameState createExampleState(const Content& content = defaultContent());

}  // namespace Tower
