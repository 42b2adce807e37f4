// Tower cooldowns, target selection and projectile emission.
#pragma once

#include "../../engine/math/Vec2.h"
#include "../Types.h"
#include "../content/Content.h"

namespace Tower {

class TowerTargetingSystem {
public:
    explicit TowerTargetingSystem(const Content& content) : content_(content) {}

    // Scans the grid row-major. Outside an active wave cooldowns only decay.
    void update(GameState& state) const;

    // Best live enemy within range of `towerPos`, or nullptr. First prefers the
    // furthest along the path, Closest the nearest; on equal scores the enemy
    // earlier in spawn order wins.
    static const EnemyInstance* selectTarget(const GameState& state, const Engine::Vec2& towerPos, double range,
                                             TargetingMode mode);

    // Fires if the tower is ready and has a target. Appends at most one projectile.
    bool tryFire(GameState& state, TowerInstance& tower, const Engine::Vec2& towerPos) const;

private:
    const Content& content_;
};

}  // namespace Tower
