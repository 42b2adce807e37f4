// Run snapshot types shared by the simulation core and its host.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../engine/gameplay/Combat.h"
#include "../engine/math/Vec2.h"

namespace Tower {

enum class Terrain { Grass, Water };
enum class TileKind { Empty, Path, Spawn, Base };

enum class TowerType { Cannon, Archer, Tesla, Ice, Mortar, Sniper };
enum class TargetingMode { First, Closest };
enum class EnemyType { Runner, Grunt, Tank, Armored, Flyer, Boss };

enum class WaveState { Idle, Spawning, InProgress, Complete, Victory, GameOver };
enum class Difficulty { Normal, Hard };

constexpr int kTowerTypeCount = 6;
constexpr int kEnemyTypeCount = 6;
constexpr int kMaxTowerLevel = 3;
constexpr int kMaxSpeed = 3;

using EnemyId = std::uint32_t;
using ProjectileId = std::uint32_t;
using TowerId = std::uint32_t;

struct GridPoint {
    int x{0};
    int y{0};
};

inline bool operator==(const GridPoint& a, const GridPoint& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const GridPoint& a, const GridPoint& b) { return !(a == b); }

struct TowerInstance {
    TowerId id{0};
    TowerType type{TowerType::Cannon};
    int level{1};
    TargetingMode targeting{TargetingMode::First};
    int totalSpent{0};  // basis for the sell refund
    int cooldownRemainingTicks{0};
};

struct Tile {
    int x{0};
    int y{0};
    Terrain terrain{Terrain::Grass};
    TileKind kind{TileKind::Empty};
    std::optional<TowerInstance> tower;
};

struct EnemyInstance {
    EnemyId id{0};
    EnemyType type{EnemyType::Grunt};
    int hp{0};
    int maxHp{0};
    double speedTilesPerSecond{0.0};
    double armorMultiplier{1.0};
    bool isFlying{false};
    int reward{0};
    // Segment [pathIndex, pathIndex + 1], fractional progress in [0, 1).
    int pathIndex{0};
    double progress{0.0};
    Engine::Gameplay::SlowDebuff slow{};

    bool alive() const { return hp > 0; }
};

struct ProjectileInstance {
    ProjectileId id{0};
    Engine::Vec2 origin{};
    EnemyId targetEnemyId{0};
    bool isInstant{false};
    Engine::Vec2 position{};
    Engine::Vec2 velocity{};
    double speed{0.0};  // tiles/sec, constant while homing
    int damage{0};
    double splashRadius{0.0};
    std::optional<double> slowMultiplier;
    int slowDurationTicks{0};

    bool slows() const { return slowMultiplier && *slowMultiplier != 0.0; }
};

struct SpawnQueueEntry {
    EnemyType enemyType{EnemyType::Grunt};
    int ticksUntilSpawn{0};
};

struct RunSettings {
    std::string name{"IsoTower Run"};
    Difficulty difficulty{Difficulty::Normal};
};

struct RunStats {
    int wave{0};
    int kills{0};
    int leaks{0};  // lives lost, not enemies
    int moneyEarned{0};
    int moneySpent{0};
    int enemiesSpawned{0};
    int enemiesLeaked{0};
};

struct GameState {
    std::string id;
    std::uint64_t seed{0};
    int gridSize{0};
    std::vector<Tile> grid;  // row-major, gridSize * gridSize
    std::uint64_t tick{0};
    int speed{1};

    int money{0};
    int lives{0};

    std::vector<GridPoint> path;
    GridPoint spawn{};
    GridPoint base{};

    std::vector<EnemyInstance> enemies;
    std::vector<ProjectileInstance> projectiles;

    WaveState waveState{WaveState::Idle};
    std::vector<SpawnQueueEntry> waveSpawnQueue;

    RunSettings settings{};
    RunStats stats{};

    EnemyId nextEnemyId{1};
    ProjectileId nextProjectileId{1};
    TowerId nextTowerId{1};

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < gridSize && y < gridSize; }
    Tile* tileAt(int x, int y) {
        return inBounds(x, y) ? &grid[static_cast<std::size_t>(y) * gridSize + x] : nullptr;
    }
    const Tile* tileAt(int x, int y) const {
        return inBounds(x, y) ? &grid[static_cast<std::size_t>(y) * gridSize + x] : nullptr;
    }
};

inline bool isWaveActive(WaveState s) { return s == WaveState::Spawning || s == WaveState::InProgress; }

// Stable lowercase keys used by content files, digests and reports.
std::string_view toString(TowerType type);
std::string_view toString(EnemyType type);
std::string_view toString(TargetingMode mode);
std::string_view toString(WaveState state);
std::string_view toString(Difficulty difficulty);
std::string_view toString(TileKind kind);

std::optional<TowerType> parseTowerType(std::string_view key);
std::optional<EnemyType> parseEnemyType(std::string_view key);
std::optional<TargetingMode> parseTargetingMode(std::string_view key);
std::optional<Difficulty> parseDifficulty(std::string_view key);

}  // namespace Tower
