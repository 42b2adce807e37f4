// JSON overlay loader for tower-defense content.
#include "Content.h"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Tower {

using nlohmann::json;

namespace {

// Raised for semantic problems in an otherwise well-formed document.
struct ContentError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void requireKnownKeys(const json& j, std::initializer_list<const char*> allowed, const std::string& where) {
    if (!j.is_object()) throw ContentError(where + " must be an object");
    for (const auto& kv : j.items()) {
        bool known = false;
        for (const char* key : allowed) {
            if (kv.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) throw ContentError("unknown key '" + kv.key() + "' in " + where);
    }
}

void applyEnemy(const json& j, EnemyDefinition& d) {
    requireKnownKeys(j, {"name", "baseHp", "speedTilesPerSecond", "reward", "armorMultiplier", "isFlying", "leakDamage"},
                     "enemy '" + std::string(toString(d.type)) + "'");
    d.name = j.value("name", d.name);
    d.baseHp = j.value("baseHp", d.baseHp);
    d.speedTilesPerSecond = j.value("speedTilesPerSecond", d.speedTilesPerSecond);
    d.reward = j.value("reward", d.reward);
    d.armorMultiplier = j.value("armorMultiplier", d.armorMultiplier);
    d.isFlying = j.value("isFlying", d.isFlying);
    d.leakDamage = j.value("leakDamage", d.leakDamage);
}

TowerLevelStats parseLevel(const json& j) {
    requireKnownKeys(j, {"damage", "range", "fireCooldownTicks", "projectileSpeed", "splashRadius", "slowMultiplier"},
                     "tower level");
    TowerLevelStats s{};
    s.damage = j.at("damage").get<int>();
    s.range = j.at("range").get<double>();
    s.fireCooldownTicks = j.at("fireCooldownTicks").get<int>();
    s.projectileSpeed = j.at("projectileSpeed").get<double>();
    s.splashRadius = j.value("splashRadius", 0.0);
    if (j.contains("slowMultiplier") && !j["slowMultiplier"].is_null()) {
        s.slowMultiplier = j["slowMultiplier"].get<double>();
    }
    return s;
}

void applyTower(const json& j, TowerDefinition& d) {
    requireKnownKeys(j, {"name", "description", "baseCost", "sellRefundRatio", "defaultTargeting", "levels"},
                     "tower '" + std::string(toString(d.type)) + "'");
    d.name = j.value("name", d.name);
    d.description = j.value("description", d.description);
    d.baseCost = j.value("baseCost", d.baseCost);
    d.sellRefundRatio = j.value("sellRefundRatio", d.sellRefundRatio);
    if (j.contains("defaultTargeting")) {
        const auto mode = parseTargetingMode(j["defaultTargeting"].get<std::string>());
        if (!mode) throw ContentError("tower '" + std::string(toString(d.type)) + "' has unknown targeting mode");
        d.defaultTargeting = *mode;
    }
    if (j.contains("levels")) {
        const json& levels = j["levels"];
        if (!levels.is_array() || levels.size() != d.levels.size()) {
            throw ContentError("tower '" + std::string(toString(d.type)) + "' needs exactly 3 levels");
        }
        for (std::size_t i = 0; i < d.levels.size(); ++i) {
            d.levels[i] = parseLevel(levels[i]);
        }
    }
}

WaveDefinition parseWave(const json& j) {
    requireKnownKeys(j, {"waveNumber", "endDelayTicks", "spawns"}, "wave entry");
    WaveDefinition w{};
    w.waveNumber = j.at("waveNumber").get<int>();
    w.endDelayTicks = j.value("endDelayTicks", 0);
    for (const auto& s : j.at("spawns")) {
        requireKnownKeys(s, {"type", "count", "intervalTicks"}, "spawn group");
        const std::string key = s.at("type").get<std::string>();
        const auto type = parseEnemyType(key);
        if (!type) throw ContentError("wave " + std::to_string(w.waveNumber) + " spawns unknown enemy '" + key + "'");
        WaveSpawn spawn{};
        spawn.type = *type;
        spawn.count = s.at("count").get<int>();
        spawn.intervalTicks = s.at("intervalTicks").get<int>();
        w.spawns.push_back(spawn);
    }
    return w;
}

void applyDocument(const json& j, Content& c) {
    requireKnownKeys(j, {"run", "simulation", "enemies", "towers", "waves", "finalWaveNumber"}, "content root");

    if (j.contains("run")) {
        const json& r = j["run"];
        requireKnownKeys(r, {"gridSize", "startingMoney", "startingLives", "startingSpeed"}, "run");
        c.run.gridSize = r.value("gridSize", c.run.gridSize);
        c.run.startingMoney = r.value("startingMoney", c.run.startingMoney);
        c.run.startingLives = r.value("startingLives", c.run.startingLives);
        c.run.startingSpeed = r.value("startingSpeed", c.run.startingSpeed);
    }
    if (j.contains("simulation")) {
        const json& s = j["simulation"];
        requireKnownKeys(s, {"slowDurationTicks", "projectileHitRadius", "hardHpMultiplier"}, "simulation");
        c.slowDurationTicks = s.value("slowDurationTicks", c.slowDurationTicks);
        c.projectileHitRadius = s.value("projectileHitRadius", c.projectileHitRadius);
        c.hardHpMultiplier = s.value("hardHpMultiplier", c.hardHpMultiplier);
    }
    if (j.contains("enemies")) {
        for (const auto& kv : j["enemies"].items()) {
            const auto type = parseEnemyType(kv.key());
            if (!type) throw ContentError("unknown enemy '" + kv.key() + "'");
            applyEnemy(kv.value(), c.enemy(*type));
        }
    }
    if (j.contains("towers")) {
        for (const auto& kv : j["towers"].items()) {
            const auto type = parseTowerType(kv.key());
            if (!type) throw ContentError("unknown tower '" + kv.key() + "'");
            applyTower(kv.value(), c.tower(*type));
        }
    }
    if (j.contains("waves")) {
        std::vector<WaveDefinition> waves;
        for (const auto& w : j["waves"]) {
            waves.push_back(parseWave(w));
        }
        c.waves = std::move(waves);
        // A replaced wave list ends at its own last wave unless told otherwise.
        c.finalWaveNumber = c.lastAuthoredWaveNumber();
    }
    if (j.contains("finalWaveNumber")) {
        c.finalWaveNumber = j["finalWaveNumber"].get<int>();
    }
}

}  // namespace

bool parseContentJson(const std::string& text, Content& out) {
    Content staged = out;
    try {
        applyDocument(json::parse(text), staged);
    } catch (const json::exception& e) {
        Engine::logError(std::string("Content JSON rejected: ") + e.what());
        return false;
    } catch (const ContentError& e) {
        Engine::logError(std::string("Content rejected: ") + e.what());
        return false;
    }

    std::string problem;
    if (!validateContent(staged, &problem)) {
        Engine::logError("Content failed validation: " + problem);
        return false;
    }
    out = std::move(staged);
    return true;
}

bool loadContentFile(const std::string& path, Content& out) {
    if (!std::filesystem::exists(path)) {
        Engine::logWarn("Content file not found: " + path + " (using built-in tables)");
        return false;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Engine::logWarn("Content file unreadable: " + path);
        return false;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    if (!parseContentJson(buf.str(), out)) {
        Engine::logWarn("Keeping previous content after failed load of " + path);
        return false;
    }
    Engine::logInfo("Loaded content from " + path + " (" + std::to_string(out.waves.size()) +
                    " authored waves, final wave " + std::to_string(out.finalWaveNumber) + ")");
    return true;
}

}  // namespace Tower
