// Moves homing projectiles and applies hits, splash and slows.
#pragma once

#include "../../engine/core/Time.h"
#include "../Types.h"
#include "../content/Content.h"

namespace Tower {

class ProjectileSystem {
public:
    explicit ProjectileSystem(const Content& content) : content_(content) {}

    // Resolves every projectile once. Projectiles whose target is gone are
    // dropped; hits are consumed; the rest re-home and move by velocity * dt.
    void update(GameState& state, const Engine::TimeStep& step) const;

    // Damages the target and, with splash, every other live enemy near it.
    static void applyHit(GameState& state, const ProjectileInstance& proj, const EnemyInstance& target);

private:
    const Content& content_;
};

}  // namespace Tower
