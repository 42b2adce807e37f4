#include "StateDigest.h"

#include <cstring>
#include <initializer_list>
#include <iomanip>
#include <sstream>

namespace Tower::Meta {

namespace {

class Fnv1a {
public:
    void bytes(const void* data, std::size_t size) {
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            hash_ ^= p[i];
            hash_ *= 1099511628211ull;
        }
    }

    void u64(std::uint64_t v) {
        unsigned char buf[8];
        for (int i = 0; i < 8; ++i) buf[i] = static_cast<unsigned char>((v >> (8 * i)) & 0xff);
        bytes(buf, sizeof(buf));
    }

    void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }

    void flag(bool v) { u64(v ? 1 : 0); }

    void f64(double v) {
        if (v == 0.0) v = 0.0;  // fold -0.0
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        u64(bits);
    }

    void str(const std::string& s) {
        u64(s.size());
        bytes(s.data(), s.size());
    }

    std::uint64_t value() const { return hash_; }

private:
    std::uint64_t hash_{1469598103934665603ull};
};

}  // namespace

std::uint64_t stateDigest(const GameState& state) {
    Fnv1a h;
    h.str(state.id);
    h.u64(state.seed);
    h.i64(state.gridSize);
    h.u64(state.tick);
    h.i64(state.speed);
    h.i64(state.money);
    h.i64(state.lives);
    h.i64(static_cast<int>(state.waveState));
    h.str(state.settings.name);
    h.i64(static_cast<int>(state.settings.difficulty));

    const RunStats& s = state.stats;
    for (int v : {s.wave, s.kills, s.leaks, s.moneyEarned, s.moneySpent, s.enemiesSpawned, s.enemiesLeaked}) {
        h.i64(v);
    }
    h.u64(state.nextEnemyId);
    h.u64(state.nextProjectileId);
    h.u64(state.nextTowerId);

    for (const auto& p : state.path) {
        h.i64(p.x);
        h.i64(p.y);
    }
    h.i64(state.spawn.x);
    h.i64(state.spawn.y);
    h.i64(state.base.x);
    h.i64(state.base.y);

    h.u64(state.grid.size());
    for (const auto& tile : state.grid) {
        h.i64(tile.x);
        h.i64(tile.y);
        h.i64(static_cast<int>(tile.terrain));
        h.i64(static_cast<int>(tile.kind));
        if (!tile.tower) {
            h.u64(0);
            continue;
        }
        const TowerInstance& t = *tile.tower;
        h.u64(t.id);
        h.i64(static_cast<int>(t.type));
        h.i64(t.level);
        h.i64(static_cast<int>(t.targeting));
        h.i64(t.totalSpent);
        h.i64(t.cooldownRemainingTicks);
    }

    h.u64(state.enemies.size());
    for (const auto& e : state.enemies) {
        h.u64(e.id);
        h.i64(static_cast<int>(e.type));
        h.i64(e.hp);
        h.i64(e.maxHp);
        h.f64(e.speedTilesPerSecond);
        h.f64(e.armorMultiplier);
        h.flag(e.isFlying);
        h.i64(e.reward);
        h.i64(e.pathIndex);
        h.f64(e.progress);
        h.f64(e.slow.multiplier);
        h.i64(e.slow.remainingTicks);
    }

    h.u64(state.projectiles.size());
    for (const auto& p : state.projectiles) {
        h.u64(p.id);
        h.u64(p.targetEnemyId);
        h.flag(p.isInstant);
        h.f64(p.origin.x);
        h.f64(p.origin.y);
        h.f64(p.position.x);
        h.f64(p.position.y);
        h.f64(p.velocity.x);
        h.f64(p.velocity.y);
        h.f64(p.speed);
        h.i64(p.damage);
        h.f64(p.splashRadius);
        h.flag(p.slowMultiplier.has_value());
        h.f64(p.slowMultiplier.value_or(1.0));
        h.i64(p.slowDurationTicks);
    }

    h.u64(state.waveSpawnQueue.size());
    for (const auto& q : state.waveSpawnQueue) {
        h.i64(static_cast<int>(q.enemyType));
        h.i64(q.ticksUntilSpawn);
    }
    return h.value();
}

std::string digestHex(std::uint64_t digest) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << digest;
    return ss.str();
}

nlohmann::json summaryJson(const GameState& state) {
    nlohmann::json j;
    j["tick"] = state.tick;
    j["wave"] = state.stats.wave;
    j["waveState"] = std::string(toString(state.waveState));
    j["kills"] = state.stats.kills;
    j["leaks"] = state.stats.leaks;
    j["money"] = state.money;
    j["lives"] = state.lives;
    j["enemiesRemaining"] = state.enemies.size();
    j["projectilesRemaining"] = state.projectiles.size();
    j["digest"] = digestHex(stateDigest(state));
    return j;
}

}  // namespace Tower::Meta
