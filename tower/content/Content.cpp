#include "Content.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace Tower {

namespace {

TowerLevelStats level(int damage, double range, int cooldown, double speed, double splash = 0.0) {
    TowerLevelStats s{};
    s.damage = damage;
    s.range = range;
    s.fireCooldownTicks = cooldown;
    s.projectileSpeed = speed;
    s.splashRadius = splash;
    return s;
}

TowerLevelStats slowing(int damage, double range, int cooldown, double speed, double slow) {
    TowerLevelStats s = level(damage, range, cooldown, speed);
    s.slowMultiplier = slow;
    return s;
}

void setEnemy(Content& c, EnemyType type, const char* name, int hp, double speed, int reward, double armor = 1.0,
              bool flying = false, int leakDamage = 1) {
    EnemyDefinition& d = c.enemy(type);
    d.type = type;
    d.name = name;
    d.baseHp = hp;
    d.speedTilesPerSecond = speed;
    d.reward = reward;
    d.armorMultiplier = armor;
    d.isFlying = flying;
    d.leakDamage = leakDamage;
}

void setTower(Content& c, TowerType type, const char* name, const char* description, int cost,
              TargetingMode targeting, const TowerLevelStats& l1, const TowerLevelStats& l2,
              const TowerLevelStats& l3) {
    TowerDefinition& d = c.tower(type);
    d.type = type;
    d.name = name;
    d.description = description;
    d.baseCost = cost;
    d.sellRefundRatio = 0.7;
    d.defaultTargeting = targeting;
    d.levels = {l1, l2, l3};
}

void addWave(Content& c, int number, std::vector<WaveSpawn> spawns, int endDelay) {
    WaveDefinition w{};
    w.waveNumber = number;
    w.spawns = std::move(spawns);
    w.endDelayTicks = endDelay;
    c.waves.push_back(std::move(w));
}

}  // namespace

Content makeDefaultContent() {
    Content c{};
    using E = EnemyType;

    setEnemy(c, E::Runner, "Runner", 40, 1.8, 10);
    setEnemy(c, E::Grunt, "Grunt", 80, 1.2, 15);
    setEnemy(c, E::Tank, "Tank", 200, 0.8, 30);
    setEnemy(c, E::Armored, "Armored", 140, 1.0, 25, 0.75);
    setEnemy(c, E::Flyer, "Flyer", 90, 1.5, 20, 1.0, true);
    setEnemy(c, E::Boss, "Boss", 900, 0.7, 120, 0.9, false, 5);

    setTower(c, TowerType::Cannon, "Cannon Tower", "Balanced damage and range.", 100, TargetingMode::First,
             level(18, 3.5, 18, 7.0), level(28, 4.0, 16, 7.5), level(42, 4.5, 14, 8.0));
    setTower(c, TowerType::Archer, "Archer Tower", "Fast attacks, lower damage.", 75, TargetingMode::Closest,
             level(8, 3.0, 10, 10.0), level(12, 3.5, 9, 11.0), level(18, 4.0, 8, 12.0));
    setTower(c, TowerType::Tesla, "Tesla Tower", "Arc damage with small splash.", 160, TargetingMode::Closest,
             level(14, 3.0, 14, 999.0, 0.6), level(22, 3.5, 13, 999.0, 0.8), level(34, 4.0, 12, 999.0, 1.0));
    setTower(c, TowerType::Ice, "Ice Tower", "Applies a slowing debuff.", 140, TargetingMode::First,
             slowing(6, 3.0, 14, 8.0, 0.72), slowing(10, 3.5, 13, 8.5, 0.65), slowing(16, 4.0, 12, 9.0, 0.55));
    setTower(c, TowerType::Mortar, "Mortar Tower", "Slow, powerful splash damage.", 220, TargetingMode::First,
             level(40, 4.5, 28, 6.0, 1.1), level(60, 5.0, 26, 6.5, 1.3), level(90, 5.5, 24, 7.0, 1.5));
    setTower(c, TowerType::Sniper, "Sniper Tower", "Long range, high damage, slow fire rate.", 260,
             TargetingMode::First, level(65, 6.5, 34, 16.0), level(95, 7.2, 32, 17.0), level(140, 8.0, 30, 18.0));

    addWave(c, 1, {{E::Grunt, 8, 14}}, 80);
    addWave(c, 2, {{E::Runner, 10, 12}}, 90);
    addWave(c, 3, {{E::Grunt, 10, 12}, {E::Runner, 6, 10}}, 90);
    addWave(c, 4, {{E::Tank, 4, 22}, {E::Grunt, 10, 12}}, 100);
    addWave(c, 5, {{E::Armored, 8, 16}, {E::Runner, 8, 10}}, 110);
    addWave(c, 6, {{E::Flyer, 10, 12}}, 120);
    addWave(c, 7, {{E::Tank, 8, 20}, {E::Armored, 8, 14}}, 130);
    addWave(c, 8, {{E::Grunt, 18, 10}, {E::Runner, 14, 9}}, 140);
    addWave(c, 9, {{E::Flyer, 14, 10}, {E::Armored, 10, 12}}, 150);
    addWave(c, 10, {{E::Boss, 1, 1}, {E::Tank, 10, 18}}, 180);
    // Waves past the last authored one come from the endless fallback.
    c.finalWaveNumber = 20;

    return c;
}

const Content& defaultContent() {
    static const Content kContent = makeDefaultContent();
    return kContent;
}

bool validateContent(const Content& content, std::string* error) {
    std::ostringstream why;
    auto fail = [&]() {
        if (error) *error = why.str();
        return false;
    };

    for (std::size_t i = 0; i < content.enemies.size(); ++i) {
        const EnemyDefinition& e = content.enemies[i];
        if (static_cast<std::size_t>(e.type) != i) {
            why << "enemy slot " << i << " holds " << toString(e.type);
            return fail();
        }
        if (e.baseHp <= 0 || e.speedTilesPerSecond < 0.0 || e.reward < 0 || e.armorMultiplier < 0.0 ||
            e.leakDamage < 0) {
            why << "enemy " << toString(e.type) << " has out-of-range stats";
            return fail();
        }
    }

    for (std::size_t i = 0; i < content.towers.size(); ++i) {
        const TowerDefinition& t = content.towers[i];
        if (static_cast<std::size_t>(t.type) != i) {
            why << "tower slot " << i << " holds " << toString(t.type);
            return fail();
        }
        if (t.baseCost < 0 || t.sellRefundRatio < 0.0) {
            why << "tower " << toString(t.type) << " has a negative cost or refund";
            return fail();
        }
        for (std::size_t l = 0; l < t.levels.size(); ++l) {
            const TowerLevelStats& s = t.levels[l];
            if (s.damage < 0 || s.range <= 0.0 || s.fireCooldownTicks < 0 || s.projectileSpeed <= 0.0 ||
                s.splashRadius < 0.0) {
                why << "tower " << toString(t.type) << " level " << (l + 1) << " has out-of-range stats";
                return fail();
            }
            if (s.slowMultiplier && (*s.slowMultiplier < 0.0 || *s.slowMultiplier > 1.0)) {
                why << "tower " << toString(t.type) << " level " << (l + 1) << " slow must be within 0..1";
                return fail();
            }
        }
    }

    if (content.waves.empty()) {
        why << "no waves authored";
        return fail();
    }
    int prev = 0;
    for (const auto& w : content.waves) {
        if (w.waveNumber <= prev) {
            why << "wave numbers must be strictly increasing (wave " << w.waveNumber << ")";
            return fail();
        }
        prev = w.waveNumber;
        if (w.spawns.empty()) {
            why << "wave " << w.waveNumber << " has no spawn groups";
            return fail();
        }
        for (const auto& s : w.spawns) {
            if (s.count <= 0 || s.intervalTicks <= 0) {
                why << "wave " << w.waveNumber << " has a group with non-positive count or interval";
                return fail();
            }
        }
    }
    if (content.finalWaveNumber < 1) {
        why << "final wave number must be positive";
        return fail();
    }

    const RunDefaults& r = content.run;
    if (r.gridSize < 2 || r.startingLives <= 0 || r.startingMoney < 0 || r.startingSpeed < 0 ||
        r.startingSpeed > kMaxSpeed) {
        why << "run defaults out of range";
        return fail();
    }
    if (content.slowDurationTicks < 0 || content.projectileHitRadius <= 0.0 || content.hardHpMultiplier <= 0.0) {
        why << "simulation constants out of range";
        return fail();
    }
    return true;
}

}  // namespace Tower
