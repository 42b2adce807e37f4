#include "Types.h"

namespace Tower {

std::string_view toString(TowerType type) {
    switch (type) {
        case TowerType::Cannon: return "cannon";
        case TowerType::Archer: return "archer";
        case TowerType::Tesla: return "tesla";
        case TowerType::Ice: return "ice";
        case TowerType::Mortar: return "mortar";
        case TowerType::Sniper: return "sniper";
    }
    return "cannon";
}

std::string_view toString(EnemyType type) {
    switch (type) {
        case EnemyType::Runner: return "runner";
        case EnemyType::Grunt: return "grunt";
        case EnemyType::Tank: return "tank";
        case EnemyType::Armored: return "armored";
        case EnemyType::Flyer: return "flyer";
        case EnemyType::Boss: return "boss";
    }
    return "grunt";
}

std::string_view toString(TargetingMode mode) {
    return mode == TargetingMode::Closest ? "closest" : "first";
}

std::string_view toString(WaveState state) {
    switch (state) {
        case WaveState::Idle: return "idle";
        case WaveState::Spawning: return "spawning";
        case WaveState::InProgress: return "in_progress";
        case WaveState::Complete: return "complete";
        case WaveState::Victory: return "victory";
        case WaveState::GameOver: return "game_over";
    }
    return "idle";
}

std::string_view toString(Difficulty difficulty) {
    return difficulty == Difficulty::Hard ? "hard" : "normal";
}

std::string_view toString(TileKind kind) {
    switch (kind) {
        case TileKind::Empty: return "empty";
        case TileKind::Path: return "path";
        case TileKind::Spawn: return "spawn";
        case TileKind::Base: return "base";
    }
    return "empty";
}

std::optional<TowerType> parseTowerType(std::string_view key) {
    if (key == "cannon") return TowerType::Cannon;
    if (key == "archer") return TowerType::Archer;
    if (key == "tesla") return TowerType::Tesla;
    if (key == "ice") return TowerType::Ice;
    if (key == "mortar") return TowerType::Mortar;
    if (key == "sniper") return TowerType::Sniper;
    return std::nullopt;
}

std::optional<EnemyType> parseEnemyType(std::string_view key) {
    if (key == "runner") return EnemyType::Runner;
    if (key == "grunt") return EnemyType::Grunt;
    if (key == "tank") return EnemyType::Tank;
    if (key == "armored") return EnemyType::Armored;
    if (key == "flyer") return EnemyType::Flyer;
    if (key == "boss") return EnemyType::Boss;
    return std::nullopt;
}

std::optional<TargetingMode> parseTargetingMode(std::string_view key) {
    if (key == "first") return TargetingMode::First;
    if (key == "closest") return TargetingMode::Closest;
    return std::nullopt;
}

std::optional<Difficulty> parseDifficulty(std::string_view key) {
    if (key == "normal") return Difficulty::Normal;
    if (key == "hard") return Difficulty::Hard;
    return std::nullopt;
}

}  // namespace Tower
