#include "hellsurvivor/combat.hpp"

#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/enemies.hpp"
#include "hellsurvivor/upgrade.hpp"
#include "hellsurvivor/waves.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace hs {

namespace {

constexpr float kDropChance = 0.1f;
constexpr float kExplosiveDropChance = 0.3f;
constexpr int kBossExp = 50;

int kill_experience(EnemyKind kind, DamageSource source) {
    switch (kind) {
    case EnemyKind::Wanderer:
        return 10;
    case EnemyKind::Pursuer:
        return 20;
    case EnemyKind::Boss:
        // A sword kill on a boss grants no experience.
        return source == DamageSource::Melee ? 0 : kBossExp;
    }
    return 0;
}

void drop_item(GameState& state, ItemKind kind, Vec2 center) {
    const float half = kFoodSize * 0.5f;
    Item item = make_item(kind, {center.x - half, center.y - half});
    item.pos = state.terrain.clamp(item.pos, item.size);
    state.items.push_back(item);
}

void award_experience(GameState& state, int amount) {
    if (amount <= 0) return;
    const int levels = gain_experience(state.player, amount);
    if (levels <= 0) return;

    post_message(state, "LEVEL UP! LV " + std::to_string(state.player.level), kShortMessageTicks);
    EffectEvent ev{};
    ev.kind = EffectKind::LevelUp;
    ev.pos = player_center(state.player);
    ev.value = state.player.level;
    state.events.push_back(ev);
}

void pay_out_kill(GameState& state, const Enemy& enemy, DamageSource source, DeterministicRng& rng) {
    const Vec2 c = enemy_center(enemy);
    const int score = enemy_score(enemy.kind);
    const float drop_chance = source == DamageSource::Explosive ? kExplosiveDropChance : kDropChance;

    state.stats.score += score;

    EffectEvent death{};
    death.kind = EffectKind::EnemyDeath;
    death.pos = c;
    death.enemy = enemy.kind;
    death.value = score;
    state.events.push_back(death);

    award_experience(state, kill_experience(enemy.kind, source));

    if (enemy.kind == EnemyKind::Boss) {
        state.stats.boss_kills += 1;
        if (rng.chance(drop_chance)) drop_item(state, ItemKind::HealLarge, c);
        record_boss_kill(state, c);
        return;
    }

    if (enemy.kind == EnemyKind::Wanderer && rng.chance(drop_chance)) drop_item(state, ItemKind::HealMedium, c);
    state.stats.total_kills += 1;
    state.wave.kills_since_wave += 1;
}

} // namespace

bool apply_enemy_damage(GameState& state, Enemy& enemy, int damage, DamageSource source, DeterministicRng& rng) {
    if (!enemy.alive) return false;

    enemy.health -= damage;
    if (enemy.health > 0) {
        EffectEvent ev{};
        ev.kind = EffectKind::EnemyHit;
        ev.pos = enemy_center(enemy);
        ev.enemy = enemy.kind;
        ev.value = damage;
        state.events.push_back(ev);
        return false;
    }

    enemy.alive = false;
    pay_out_kill(state, enemy, source, rng);
    return true;
}

bool resolve_projectile(GameState& state, Projectile& arrow, DeterministicRng& rng) {
    if (!arrow.active) return false;
    const Rect box = projectile_rect(arrow);
    const size_t count = state.enemies.size();
    for (size_t i = 0; i < count; ++i) {
        Enemy& e = state.enemies[i];
        if (!e.alive || !rects_overlap(box, enemy_rect(e))) continue;
        apply_enemy_damage(state, e, kArrowDamage, DamageSource::Projectile, rng);
        arrow.active = false;
        return true;
    }
    return false;
}

int resolve_explosion(GameState& state, const Explosive& bomb, DeterministicRng& rng) {
    EffectEvent ev{};
    ev.kind = EffectKind::Explosion;
    ev.pos = bomb.pos;
    ev.radius = bomb.radius;
    state.events.push_back(ev);

    int hits = 0;
    const size_t count = state.enemies.size();
    for (size_t i = 0; i < count; ++i) {
        Enemy& e = state.enemies[i];
        if (!e.alive) continue;
        if (distance(enemy_center(e), bomb.pos) > bomb.radius) continue;
        apply_enemy_damage(state, e, bomb.damage, DamageSource::Explosive, rng);
        ++hits;
    }
    return hits;
}

int resolve_melee(GameState& state, DeterministicRng& rng) {
    if (!melee_strike_tick(state.player)) return 0;
    const auto hitbox = melee_hitbox(state.player);
    if (!hitbox) return 0;

    const int damage = sword_damage(state.player);
    int hits = 0;
    const size_t count = state.enemies.size();
    for (size_t i = 0; i < count; ++i) {
        Enemy& e = state.enemies[i];
        if (!e.alive || !rects_overlap(*hitbox, enemy_rect(e))) continue;
        apply_enemy_damage(state, e, damage, DamageSource::Melee, rng);
        ++hits;
    }
    return hits;
}

int resolve_contact_damage(GameState& state) {
    Player& p = state.player;
    if (p.dodging) return 0;

    const Rect body = player_rect(p);
    int hits = 0;
    for (auto& e : state.enemies) {
        if (!e.alive || e.damage_cooldown > 0 || !rects_overlap(body, enemy_rect(e))) continue;

        const int before = p.health;
        if (take_damage(p, e.damage)) {
            state.stats.damage_taken += before - p.health;
            EffectEvent ev{};
            ev.kind = EffectKind::PlayerHurt;
            ev.pos = player_center(p);
            ev.enemy = e.kind;
            ev.value = before - p.health;
            state.events.push_back(ev);
            ++hits;
        }
        e.damage_cooldown = kContactCooldown;
    }
    return hits;
}

void resolve_pickups(GameState& state) {
    Player& p = state.player;
    const Rect body = player_rect(p);
    std::vector<bool> taken(state.items.size(), false);

    for (size_t i = 0; i < state.items.size(); ++i) {
        if (taken[i]) continue;
        const Item& item = state.items[i];
        if (!rects_overlap(body, item_rect(item))) continue;
        taken[i] = true;

        if (is_weapon_item(item.kind)) {
            p.weapon = weapon_for_item(item.kind);
            post_message(state, std::string(item_name(item.kind)) + " CHOSEN!", kShortMessageTicks);

            EffectEvent equipped{};
            equipped.kind = EffectKind::WeaponEquipped;
            equipped.pos = rect_center(item_rect(item));
            equipped.item = item.kind;
            state.events.push_back(equipped);

            for (size_t j = 0; j < state.items.size(); ++j) {
                if (taken[j] || !is_weapon_item(state.items[j].kind)) continue;
                taken[j] = true;
                EffectEvent discarded{};
                discarded.kind = EffectKind::WeaponDiscarded;
                discarded.pos = rect_center(item_rect(state.items[j]));
                discarded.item = state.items[j].kind;
                state.events.push_back(discarded);
            }
        } else if (is_food_item(item.kind)) {
            heal(p, heal_amount(item.kind));
            EffectEvent ev{};
            ev.kind = EffectKind::Pickup;
            ev.pos = rect_center(item_rect(item));
            ev.item = item.kind;
            ev.value = heal_amount(item.kind);
            state.events.push_back(ev);
        } else {
            post_message(state, apply_upgrade(p, upgrade_for_weapon(p.weapon)), kUpgradeMessageTicks);
            EffectEvent ev{};
            ev.kind = EffectKind::Upgrade;
            ev.pos = rect_center(item_rect(item));
            ev.item = item.kind;
            state.events.push_back(ev);
        }
    }

    std::vector<Item> kept;
    kept.reserve(state.items.size());
    for (size_t i = 0; i < state.items.size(); ++i) {
        if (!taken[i]) kept.push_back(state.items[i]);
    }
    state.items.swap(kept);
}

void purge_dead_enemies(GameState& state) {
    state.enemies.erase(
        std::remove_if(state.enemies.begin(), state.enemies.end(), [](const Enemy& e) { return !e.alive; }),
        state.enemies.end());
}

} // namespace hs
