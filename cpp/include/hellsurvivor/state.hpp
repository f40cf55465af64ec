#pragma once

#include "collision.hpp"
#include "config.hpp"
#include "terrain.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hs {

enum class Direction : uint8_t {
    Up,
    Down,
    Left,
    Right
};

enum class Weapon : uint8_t {
    None,
    Sword,
    Bow,
    Bomb
};

enum class EnemyKind : uint8_t {
    Wanderer,
    Pursuer,
    Boss
};

enum class ItemKind : uint8_t {
    Sword,
    Bow,
    Bomb,
    HealSmall,
    HealMedium,
    HealLarge,
    LootCrate
};

enum class PlayState : uint8_t {
    Playing,
    GameOver
};

struct Player {
    Vec2 pos{kPlayerSpawnX, kPlayerSpawnY};
    Vec2 size{kPlayerWidth, kPlayerHeight};
    int health = kPlayerMaxHealth;
    int max_health = kPlayerMaxHealth;
    Direction facing = Direction::Down;
    float speed_multiplier = 1.0f;

    Weapon weapon = Weapon::None;
    int sword_level = 0;
    int extra_arrows = 0;
    int bomb_level = 0;

    int exp = 0;
    int level = 1;

    bool moving = false;
    int walk_frame = 0;
    int walk_timer = 0;

    bool attacking = false;
    int attack_timer = 0;

    bool dodging = false;
    int dodge_timer = 0;
    int dodge_cooldown = 0;
    Vec2 dodge_dir{0.0f, 1.0f};

    int bow_cooldown = 0;
    int bomb_cooldown = 0;
    int invincible_timer = 0;
};

struct WandererBrain {
    int move_timer = 0;
    Vec2 move_dir{};
    int anim_frame = 0;
    int anim_timer = 0;
};

struct PursuerBrain {
    float slither_phase = 0.0f;
    // Newest head position first.
    std::array<Vec2, kPursuerSegments> trail{};
};

struct BossBrain {
    int blocked_ticks = 0;
};

using EnemyBrain = std::variant<WandererBrain, PursuerBrain, BossBrain>;

struct Enemy {
    EnemyKind kind = EnemyKind::Wanderer;
    Vec2 pos{};
    Vec2 size{};
    float speed = 0.0f;
    int damage = 0;
    int health = 1;
    int wave = 1;
    int damage_cooldown = 0;
    bool facing_right = true;
    bool alive = true;
    EnemyBrain brain{};
};

struct Projectile {
    Vec2 pos{};
    Vec2 dir{};
    int lifetime = kArrowLifetime;
    bool active = true;
};

struct Explosive {
    Vec2 pos{};
    Vec2 vel{};
    int damage = kBombBaseDamage;
    float radius = kBombBaseRadius;
    int fuse = kBombFuse;
    bool exploded = false;
};

struct Item {
    ItemKind kind = ItemKind::HealSmall;
    Vec2 pos{};
    Vec2 size{};
    float bob_phase = 0.0f;
};

enum class EffectKind : uint8_t {
    EnemyDeath,
    EnemyHit,
    Explosion,
    ObstructionDestroyed,
    WeaponDiscarded,
    WeaponEquipped,
    Pickup,
    Upgrade,
    LevelUp,
    PlayerHurt,
    Attack,
    Dodge,
    BossSpawn,
    WaveComplete,
    GameOver
};

struct EffectEvent {
    EffectKind kind = EffectKind::EnemyDeath;
    Vec2 pos{};
    float radius = 0.0f;
    EnemyKind enemy = EnemyKind::Wanderer;
    ItemKind item = ItemKind::Sword;
    int value = 0;
};

struct Particle {
    Vec2 pos{};
    Vec2 vel{};
    int lifetime = 30;
    int max_lifetime = 30;
    float size = 4.0f;
    EffectKind source = EffectKind::EnemyDeath;
};

struct FloatingText {
    Vec2 pos{};
    float dy = -1.5f;
    int lifetime = 45;
    int value = 0;
};

struct WaveState {
    int wave = 1;
    bool active = false;
    bool complete = false;
    int bosses_remaining = 0;
    int kills_since_wave = 0;
    uint64_t start_tick = 0;
    bool loot_dropped = false;
};

struct RunStats {
    int score = 0;
    int total_kills = 0;
    int boss_kills = 0;
    int damage_taken = 0;
};

struct GameState {
    uint64_t seed = 0;
    uint64_t tick = 0;
    PlayState play_state = PlayState::Playing;
    uint64_t final_tick = 0;

    TerrainModel terrain{};
    Rect view{0.0f, 0.0f, kViewWidth, kViewHeight};

    Player player{};
    std::vector<Enemy> enemies;
    std::vector<Projectile> projectiles;
    std::vector<Explosive> explosives;
    std::vector<Item> items;
    std::vector<Particle> particles;
    std::vector<FloatingText> floating_texts;

    WaveState wave{};
    RunStats stats{};

    int enemy_spawn_clock = 0;
    int food_spawn_clock = 0;

    std::string message;
    int message_timer = 0;

    // Effect events raised during the most recent tick.
    std::vector<EffectEvent> events;
};

inline bool game_over(const GameState& state) { return state.play_state == PlayState::GameOver; }

inline void post_message(GameState& state, std::string text, int ticks) {
    state.message = std::move(text);
    state.message_timer = ticks;
}

} // namespace hs
