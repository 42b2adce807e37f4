#include "TowerActions.h"

#include <cmath>
#include <string>

#include "../../engine/core/Logger.h"
#include "../Pathing.h"

namespace Tower::Meta {

namespace {

std::string where(int x, int y) { return "(" + std::to_string(x) + "," + std::to_string(y) + ")"; }

// Tile that can take a new tower, or nullptr.
Tile* buildableTile(GameState& state, int x, int y) {
    Tile* tile = state.tileAt(x, y);
    if (!tile) return nullptr;
    if (tile->terrain != Terrain::Grass || !isBuildableTileKind(tile->kind) || tile->tower) return nullptr;
    return tile;
}

TowerInstance makeTower(GameState& state, TowerType type, int level, int totalSpent, const Content& content) {
    TowerInstance tower{};
    tower.id = state.nextTowerId++;
    tower.type = type;
    tower.level = clampTowerLevel(level);
    tower.targeting = content.tower(type).defaultTargeting;
    tower.totalSpent = totalSpent;
    tower.cooldownRemainingTicks = 0;
    return tower;
}

}  // namespace

bool placeTower(GameState& state, int x, int y, TowerType type, const Content& content) {
    Tile* tile = buildableTile(state, x, y);
    if (!tile) {
        Engine::logDebug("Cannot build " + std::string(toString(type)) + " at " + where(x, y));
        return false;
    }
    const int cost = content.tower(type).baseCost;
    if (state.money < cost) {
        Engine::logDebug("Not enough money for " + std::string(toString(type)) + ": need " + std::to_string(cost) +
                         ", have " + std::to_string(state.money));
        return false;
    }
    tile->tower = makeTower(state, type, 1, cost, content);
    state.money -= cost;
    state.stats.moneySpent += cost;
    Engine::logInfo("Placed " + std::string(toString(type)) + " at " + where(x, y) + " for " + std::to_string(cost));
    return true;
}

bool sellTower(GameState& state, int x, int y, const Content& content) {
    Tile* tile = state.tileAt(x, y);
    if (!tile || !tile->tower) return false;
    const TowerInstance& tower = *tile->tower;
    const int refund =
        static_cast<int>(std::floor(tower.totalSpent * content.tower(tower.type).sellRefundRatio));
    Engine::logInfo("Sold " + std::string(toString(tower.type)) + " at " + where(x, y) + " for " +
                    std::to_string(refund));
    state.money += refund;
    tile->tower.reset();
    return true;
}

int upgradeCost(const GameState& state, int x, int y, const Content& content) {
    const Tile* tile = state.tileAt(x, y);
    if (!tile || !tile->tower || tile->tower->level >= kMaxTowerLevel) return -1;
    return content.tower(tile->tower->type).baseCost;
}

bool upgradeTower(GameState& state, int x, int y, const Content& content) {
    const int cost = upgradeCost(state, x, y, content);
    if (cost < 0 || state.money < cost) return false;
    TowerInstance& tower = *state.tileAt(x, y)->tower;
    tower.level += 1;
    tower.totalSpent += cost;
    state.money -= cost;
    state.stats.moneySpent += cost;
    Engine::logInfo("Upgraded " + std::string(toString(tower.type)) + " at " + where(x, y) + " to level " +
                    std::to_string(tower.level));
    return true;
}

bool setTargeting(GameState& state, int x, int y, TargetingMode mode) {
    Tile* tile = state.tileAt(x, y);
    if (!tile || !tile->tower) return false;
    tile->tower->targeting = mode;
    return true;
}

bool setSpeed(GameState& state, int speed) {
    if (speed < 0 || speed > kMaxSpeed) {
        Engine::logWarn("Ignoring speed " + std::to_string(speed) + " (expected 0-3)");
        return false;
    }
    state.speed = speed;
    return true;
}

bool grantTower(GameState& state, int x, int y, TowerType type, int level, const Content& content) {
    Tile* tile = buildableTile(state, x, y);
    if (!tile) return false;
    tile->tower = makeTower(state, type, level, 0, content);
    return true;
}

}  // namespace Tower::Meta
