#pragma once

#include "../Types.h"
#include "../content/Content.h"

namespace Tower::Meta {

// Player-facing run edits. Each returns false and leaves the state untouched
// when the action is not allowed.

// Empty grass tile without a tower and enough money. Charges the base cost.
bool placeTower(GameState& state, int x, int y, TowerType type, const Content& content = defaultContent());

// Removes the tower and refunds floor(totalSpent * sellRefundRatio).
bool sellTower(GameState& state, int x, int y, const Content& content = defaultContent());

// Raises the level by one (max 3), charging the base cost again.
bool upgradeTower(GameState& state, int x, int y, const Content& content = defaultContent());

bool setTargeting(GameState& state, int x, int y, TargetingMode mode);

// 0 pauses, 1..3 fast-forward.
bool setSpeed(GameState& state, int speed);

// Free placement at any level for scripted layouts; totalSpent stays 0 so the
// tower sells for nothing.
bool grantTower(GameState& state, int x, int y, TowerType type, int level, const Content& content = defaultContent());

// Price of the next level, or -1 when the tile has no upgradable tower.
int upgradeCost(const GameState& state, int x, int y, const Content& content = defaultContent());

}  // namespace Tower::Meta
