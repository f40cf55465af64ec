#include "hellsurvivor/actors.hpp"

#include "hellsurvivor/config.hpp"
#include "hellsurvivor/movement.hpp"

#include <algorithm>

namespace hs {

namespace {

int intent_axis(float v) {
    if (v > 0.5f) return 1;
    if (v < -0.5f) return -1;
    return 0;
}

} // namespace

Rect player_rect(const Player& p) { return {p.pos.x, p.pos.y, p.size.x, p.size.y}; }

Vec2 player_center(const Player& p) { return rect_center(player_rect(p)); }

Vec2 facing_vector(Direction d) {
    switch (d) {
    case Direction::Up:
        return {0.0f, -1.0f};
    case Direction::Down:
        return {0.0f, 1.0f};
    case Direction::Left:
        return {-1.0f, 0.0f};
    case Direction::Right:
        return {1.0f, 0.0f};
    }
    return {0.0f, 1.0f};
}

bool begin_attack(Player& p) {
    if (p.weapon != Weapon::Sword || p.attacking || p.dodging) return false;
    p.attacking = true;
    p.attack_timer = kAttackDuration;
    return true;
}

bool begin_dodge(Player& p) {
    if (p.dodge_cooldown > 0 || p.dodging || p.attacking) return false;
    p.dodging = true;
    p.dodge_timer = kDodgeDuration;
    p.dodge_cooldown = kDodgeCooldown;
    p.dodge_dir = facing_vector(p.facing);
    return true;
}

bool begin_shot(Player& p) {
    if (p.weapon != Weapon::Bow || p.bow_cooldown > 0 || p.attacking || p.dodging) return false;
    p.bow_cooldown = kBowCooldown;
    return true;
}

bool begin_throw(Player& p) {
    if (p.weapon != Weapon::Bomb || p.bomb_cooldown > 0 || p.attacking || p.dodging) return false;
    p.bomb_cooldown = kBombCooldown;
    return true;
}

void apply_move_intent(Player& p, const Action& action, const TerrainModel& terrain) {
    if (p.dodging) {
        const Vec2 delta{p.dodge_dir.x * kDodgeSpeed, p.dodge_dir.y * kDodgeSpeed};
        p.pos = resolve_move(terrain, terrain.island(), p.pos, p.size, delta, no_slide()).pos;
        return;
    }

    const int ix = intent_axis(action.move_x);
    const int iy = intent_axis(action.move_y);

    // Later checks win, so a diagonal faces sideways.
    if (iy < 0) p.facing = Direction::Up;
    if (iy > 0) p.facing = Direction::Down;
    if (ix < 0) p.facing = Direction::Left;
    if (ix > 0) p.facing = Direction::Right;
    p.moving = ix != 0 || iy != 0;
    if (!p.moving) return;

    float dx = static_cast<float>(ix);
    float dy = static_cast<float>(iy);
    if (ix != 0 && iy != 0) {
        dx *= kDiagonalScale;
        dy *= kDiagonalScale;
    }

    const float speed = kPlayerSpeed * p.speed_multiplier;
    p.pos = resolve_move(terrain, terrain.island(), p.pos, p.size, {dx * speed, dy * speed}, slide_only()).pos;
}

void tick_player_timers(Player& p) {
    if (p.moving && !p.dodging) {
        p.walk_timer += 1;
        if (p.walk_timer >= kWalkFrameTicks) {
            p.walk_timer = 0;
            p.walk_frame = (p.walk_frame + 1) % kWalkFrames;
        }
    } else {
        p.walk_frame = 0;
        p.walk_timer = 0;
    }

    if (p.attacking) {
        p.attack_timer -= 1;
        if (p.attack_timer <= 0) p.attacking = false;
    }
    if (p.dodging) {
        p.dodge_timer -= 1;
        if (p.dodge_timer <= 0) p.dodging = false;
    }
    p.dodge_cooldown = std::max(0, p.dodge_cooldown - 1);
    p.bow_cooldown = std::max(0, p.bow_cooldown - 1);
    p.bomb_cooldown = std::max(0, p.bomb_cooldown - 1);
    p.invincible_timer = std::max(0, p.invincible_timer - 1);
}

std::optional<Rect> melee_hitbox(const Player& p) {
    if (!p.attacking) return std::nullopt;

    const Vec2 c = player_center(p);
    const float scale = 1.0f + static_cast<float>(p.sword_level) * 0.25f;
    const float range = kAttackRange * scale;
    const float width = kAttackWidth * scale;
    const float half = width * 0.5f;

    switch (p.facing) {
    case Direction::Up:
        return Rect{c.x - half, c.y - range, width, range};
    case Direction::Down:
        return Rect{c.x - half, c.y, width, range};
    case Direction::Left:
        return Rect{c.x - range, c.y - half, range, width};
    case Direction::Right:
        return Rect{c.x, c.y - half, range, width};
    }
    return std::nullopt;
}

bool melee_strike_tick(const Player& p) { return p.attacking && p.attack_timer == kAttackDuration - 1; }

// 2, 3, 5, 6, 8, 9, ...
int sword_damage(const Player& p) { return 2 + p.sword_level + p.sword_level / 2; }

int bomb_damage(const Player& p) { return kBombBaseDamage + p.bomb_level * kBombDamagePerLevel; }

float bomb_radius(const Player& p) {
    return kBombBaseRadius + static_cast<float>(p.bomb_level) * kBombRadiusPerLevel;
}

std::vector<Vec2> arrow_directions(const Player& p) {
    const Vec2 base = facing_vector(p.facing);
    std::vector<Vec2> dirs;
    dirs.reserve(1 + 2 * static_cast<size_t>(std::max(0, p.extra_arrows)));
    dirs.push_back(base);

    for (int i = 0; i < p.extra_arrows; ++i) {
        const float spread = kArrowSpreadStep * static_cast<float>(i + 1);
        if (base.x != 0.0f) {
            dirs.push_back(normalize({base.x, spread}));
            dirs.push_back(normalize({base.x, -spread}));
        } else {
            dirs.push_back(normalize({spread, base.y}));
            dirs.push_back(normalize({-spread, base.y}));
        }
    }
    return dirs;
}

bool take_damage(Player& p, int amount) {
    if (p.invincible_timer > 0 || p.dodging) return false;
    p.health = std::max(0, p.health - amount);
    p.invincible_timer = kInvincibleTicks;
    return true;
}

void heal(Player& p, int amount) { p.health = std::min(p.max_health, p.health + amount); }

int gain_experience(Player& p, int amount) {
    p.exp += amount;
    int levels = 0;
    while (p.exp >= kExpPerLevel) {
        p.exp -= kExpPerLevel;
        p.level += 1;
        p.speed_multiplier += kLevelSpeedBonus;
        p.max_health += kLevelHealthBonus;
        p.health += kLevelHealthBonus;
        ++levels;
    }
    p.health = std::min(p.health, p.max_health);
    return levels;
}

Projectile make_projectile(Vec2 origin, Vec2 dir) {
    Projectile a{};
    a.pos = origin;
    a.dir = dir;
    return a;
}

Rect projectile_rect(const Projectile& a) { return {a.pos.x, a.pos.y, kArrowSize, kArrowSize}; }

void advance_projectile(Projectile& a, const Rect& map) {
    if (!a.active) return;
    a.pos.x += a.dir.x * kArrowSpeed;
    a.pos.y += a.dir.y * kArrowSpeed;
    a.lifetime -= 1;
    if (a.lifetime <= 0 || a.pos.x < map.x || a.pos.x > map.x + map.w || a.pos.y < map.y || a.pos.y > map.y + map.h) {
        a.active = false;
    }
}

Explosive make_explosive(Vec2 origin, Vec2 dir, int damage, float radius) {
    Explosive b{};
    b.pos = origin;
    b.vel = {dir.x * kBombSpeed, dir.y * kBombSpeed};
    b.damage = damage;
    b.radius = radius;
    return b;
}

bool advance_explosive(Explosive& b, const Rect& island) {
    if (b.exploded) return false;
    b.pos.x += b.vel.x;
    b.pos.y += b.vel.y;
    b.vel.x *= kBombDrag;
    b.vel.y *= kBombDrag;
    b.pos = clamp_into(b.pos, {0.0f, 0.0f}, island);
    b.fuse -= 1;
    if (b.fuse <= 0) {
        b.exploded = true;
        return true;
    }
    return false;
}

Item make_item(ItemKind kind, Vec2 pos, float bob_phase) {
    Item item{};
    item.kind = kind;
    item.pos = pos;
    item.bob_phase = bob_phase;
    switch (kind) {
    case ItemKind::Sword:
        item.size = {kSwordItemWidth, kSwordItemHeight};
        break;
    case ItemKind::Bow:
        item.size = {kBowItemWidth, kBowItemHeight};
        break;
    case ItemKind::Bomb:
        item.size = {kBombItemSize, kBombItemSize};
        break;
    case ItemKind::LootCrate:
        item.size = {kLootCrateSize, kLootCrateSize};
        break;
    case ItemKind::HealSmall:
    case ItemKind::HealMedium:
    case ItemKind::HealLarge:
        item.size = {kFoodSize, kFoodSize};
        break;
    }
    return item;
}

Rect item_rect(const Item& item) { return {item.pos.x, item.pos.y, item.size.x, item.size.y}; }

bool is_weapon_item(ItemKind kind) {
    return kind == ItemKind::Sword || kind == ItemKind::Bow || kind == ItemKind::Bomb;
}

bool is_food_item(ItemKind kind) {
    return kind == ItemKind::HealSmall || kind == ItemKind::HealMedium || kind == ItemKind::HealLarge;
}

Weapon weapon_for_item(ItemKind kind) {
    switch (kind) {
    case ItemKind::Sword:
        return Weapon::Sword;
    case ItemKind::Bow:
        return Weapon::Bow;
    case ItemKind::Bomb:
        return Weapon::Bomb;
    default:
        return Weapon::None;
    }
}

int heal_amount(ItemKind kind) {
    switch (kind) {
    case ItemKind::HealSmall:
        return 10;
    case ItemKind::HealMedium:
        return 20;
    case ItemKind::HealLarge:
        return 50;
    default:
        return 0;
    }
}

const char* item_name(ItemKind kind) {
    switch (kind) {
    case ItemKind::Sword:
        return "SWORD";
    case ItemKind::Bow:
        return "BOW";
    case ItemKind::Bomb:
        return "BOMB";
    case ItemKind::HealSmall:
        return "APPLE";
    case ItemKind::HealMedium:
        return "BANANA";
    case ItemKind::HealLarge:
        return "HEART";
    case ItemKind::LootCrate:
        return "CRATE";
    }
    return "?";
}

} // namespace hs
