#pragma once

#include "action.hpp"
#include "state.hpp"
#include "terrain.hpp"

#include <optional>
#include <vector>

namespace hs {

// Player
Rect player_rect(const Player& p);
Vec2 player_center(const Player& p);
Vec2 facing_vector(Direction d);

bool begin_attack(Player& p);
bool begin_dodge(Player& p);
bool begin_shot(Player& p);
bool begin_throw(Player& p);

void apply_move_intent(Player& p, const Action& action, const TerrainModel& terrain);
void tick_player_timers(Player& p);

std::optional<Rect> melee_hitbox(const Player& p);
bool melee_strike_tick(const Player& p);
int sword_damage(const Player& p);
int bomb_damage(const Player& p);
float bomb_radius(const Player& p);
std::vector<Vec2> arrow_directions(const Player& p);

// Returns false when invincibility or a dodge absorbed the hit.
bool take_damage(Player& p, int amount);
void heal(Player& p, int amount);

// Adds experience and returns the number of levels gained.
int gain_experience(Player& p, int amount);

// Projectiles and explosives
Projectile make_projectile(Vec2 origin, Vec2 dir);
Rect projectile_rect(const Projectile& a);
void advance_projectile(Projectile& a, const Rect& map);

Explosive make_explosive(Vec2 origin, Vec2 dir, int damage, float radius);
// Returns true on the tick the fuse runs out.
bool advance_explosive(Explosive& b, const Rect& island);

// Items
Item make_item(ItemKind kind, Vec2 pos, float bob_phase = 0.0f);
Rect item_rect(const Item& item);
bool is_weapon_item(ItemKind kind);
bool is_food_item(ItemKind kind);
Weapon weapon_for_item(ItemKind kind);
int heal_amount(ItemKind kind);
const char* item_name(ItemKind kind);

} // namespace hs
