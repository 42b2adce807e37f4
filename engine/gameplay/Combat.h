// Core damage and debuff rules shared by every tower-defense system.
#pragma once

#include <algorithm>
#include <cmath>

namespace Engine::Gameplay {

struct DamageEvent {
    int baseDamage = 0;
    double splashRadius = 0.0;  // tiles; 0 = single target
};

// Incoming damage after the target's armor scalar (1.0 = no reduction).
// Rounded down and never negative: 20 dmg vs 0.75 armor deals 15.
inline int computeEffectiveDamage(int baseDamage, double armorMultiplier) {
    const double scaled = std::floor(static_cast<double>(baseDamage) * armorMultiplier);
    return std::max(0, static_cast<int>(scaled));
}

// Returns the hp actually removed. HP may go below zero; callers treat <= 0 as dead.
inline int applyDamage(int& hp, const DamageEvent& dmg, double armorMultiplier) {
    const int effective = computeEffectiveDamage(dmg.baseDamage, armorMultiplier);
    hp -= effective;
    return effective;
}

// Single-slot movement slow. Reapplication keeps the strongest multiplier and
// the longest remaining duration; effects never multiply together.
struct SlowDebuff {
    double multiplier = 1.0;
    int remainingTicks = 0;

    bool active() const { return remainingTicks > 0; }

    void apply(double incomingMultiplier, int incomingTicks) {
        multiplier = std::min(multiplier, incomingMultiplier);
        remainingTicks = std::max(remainingTicks, incomingTicks);
    }

    // One tick of decay; the multiplier resets once the timer runs out.
    void tick() {
        if (remainingTicks <= 0) return;
        remainingTicks -= 1;
        if (remainingTicks <= 0) {
            multiplier = 1.0;
        }
    }
};

}  // namespace Engine::Gameplay
