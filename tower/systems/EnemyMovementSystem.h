// Advances enemies along the path and resolves leaks at the base.
#pragma once

#include "../../engine/core/Time.h"
#include "../Types.h"
#include "../content/Content.h"

namespace Tower {

class EnemyMovementSystem {
public:
    explicit EnemyMovementSystem(const Content& content) : content_(content) {}

    // Moves every live enemy by speed * slow * dt. Enemies reaching the last
    // waypoint cost lives, count as leaked and are left with hp 0.
    void update(GameState& state, const Engine::TimeStep& step) const;

    // Drops enemies with hp <= 0 without paying rewards.
    static void removeDead(GameState& state);

    // Moves one enemy along the path; returns true when it stopped at the base.
    static bool advance(const GameState& state, EnemyInstance& enemy, double distance);

private:
    const Content& content_;
};

}  // namespace Tower
