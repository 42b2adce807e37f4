// Kill rewards and the end-of-tick wave state transitions.
#pragma once

#include "../Types.h"
#include "../content/Content.h"

namespace Tower {

class EconomySystem {
public:
    explicit EconomySystem(const Content& content) : content_(content) {}

    // Removes dead enemies, paying out for those that did not reach the base.
    void collectRewards(GameState& state) const;

    // Complete/Victory once an active wave is fully spawned and cleared, then
    // GameOver whenever lives are gone. Victory and GameOver stop the clock.
    void updateWaveState(GameState& state) const;

    void update(GameState& state) const {
        collectRewards(state);
        updateWaveState(state);
    }

private:
    const Content& content_;
};

}  // namespace Tower
