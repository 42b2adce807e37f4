// Path generation and path-space geometry for enemies and towers.
#pragma once

#include <vector>

#include "../engine/math/Vec2.h"
#include "Types.h"

namespace Tower {

struct PathLayout {
    std::vector<GridPoint> path;
    GridPoint spawn{};
    GridPoint base{};
};

// Single-tile-wide horizontal path on row gridSize / 2, from x = 0 to
// x = gridSize - 1. Spawn is the first waypoint, base the last.
PathLayout generateStraightMidPath(int gridSize);

// Marks path tiles, then the spawn and base tiles. Out-of-bounds points are skipped.
void applyPathToGrid(GameState& state, const PathLayout& layout);

inline bool isBuildableTileKind(TileKind kind) { return kind == TileKind::Empty; }

// Tile-centre coordinates of a grid cell.
inline Engine::Vec2 tileCenter(const GridPoint& p) { return Engine::Vec2{p.x + 0.5, p.y + 0.5}; }
inline Engine::Vec2 towerPosition(int x, int y) { return tileCenter(GridPoint{x, y}); }

// Interpolated position along the current segment.
Engine::Vec2 enemyPosition(const GameState& state, const EnemyInstance& enemy);

inline bool isEnemyAtBase(const GameState& state, const EnemyInstance& enemy) {
    return enemy.pathIndex >= static_cast<int>(state.path.size()) - 1;
}

}  // namespace Tower
