#include "Pathing.h"

#include <algorithm>

namespace Tower {

PathLayout generateStraightMidPath(int gridSize) {
    PathLayout layout;
    const int midY = gridSize / 2;
    layout.path.reserve(static_cast<std::size_t>(std::max(gridSize, 0)));
    for (int x = 0; x < gridSize; ++x) {
        layout.path.push_back(GridPoint{x, midY});
    }
    if (!layout.path.empty()) {
        layout.spawn = layout.path.front();
        layout.base = layout.path.back();
    }
    return layout;
}

void applyPathToGrid(GameState& state, const PathLayout& layout) {
    for (const auto& p : layout.path) {
        if (Tile* tile = state.tileAt(p.x, p.y)) {
            tile->kind = TileKind::Path;
        }
    }
    if (Tile* tile = state.tileAt(layout.spawn.x, layout.spawn.y)) tile->kind = TileKind::Spawn;
    if (Tile* tile = state.tileAt(layout.base.x, layout.base.y)) tile->kind = TileKind::Base;
}

Engine::Vec2 enemyPosition(const GameState& state, const EnemyInstance& enemy) {
    if (state.path.empty()) return tileCenter(state.base);
    const int last = static_cast<int>(state.path.size()) - 1;
    const int fromIndex = std::clamp(enemy.pathIndex, 0, last);
    const int toIndex = std::clamp(enemy.pathIndex + 1, 0, last);
    return Engine::lerp(tileCenter(state.path[static_cast<std::size_t>(fromIndex)]),
                        tileCenter(state.path[static_cast<std::size_t>(toIndex)]), enemy.progress);
}

}  // namespace Tower
