#define BOOST_TEST_MODULE CombatTests
#include <boost/test/unit_test.hpp>

#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/combat.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/enemies.hpp"

#include <algorithm>

using namespace hs;

namespace {

int count_events(const GameState& state, EffectKind kind) {
    return static_cast<int>(std::count_if(state.events.begin(), state.events.end(),
                                          [kind](const EffectEvent& ev) { return ev.kind == kind; }));
}

int count_items(const GameState& state, bool (*pred)(ItemKind)) {
    return static_cast<int>(
        std::count_if(state.items.begin(), state.items.end(), [pred](const Item& it) { return pred(it.kind); }));
}

// Enemy of `kind` whose centre sits exactly on `center`.
Enemy enemy_at(EnemyKind kind, Vec2 center, int wave = 1) {
    Enemy e = make_enemy(kind, {0.0f, 0.0f}, wave);
    e.pos = {center.x - e.size.x * 0.5f, center.y - e.size.y * 0.5f};
    return e;
}

} // namespace

// Empty island, player at (200, 200) facing right.
class ArenaFixture {
  public:
    ArenaFixture() : rng(3) {
        state.player.pos = {200.0f, 200.0f};
        state.player.facing = Direction::Right;
    }

  protected:
    GameState state;
    DeterministicRng rng;
};

// ============================================================================
// MELEE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MeleeTests, ArenaFixture)

BOOST_AUTO_TEST_CASE(SwordKillsWanderer) {
    state.player.weapon = Weapon::Sword;
    state.enemies.push_back(make_enemy(EnemyKind::Wanderer, {215.0f, 203.0f}));
    BOOST_REQUIRE(begin_attack(state.player));

    // Nothing lands before the strike tick.
    BOOST_CHECK_EQUAL(resolve_melee(state, rng), 0);
    tick_player_timers(state.player);
    BOOST_CHECK_EQUAL(resolve_melee(state, rng), 1);

    BOOST_CHECK(!state.enemies.front().alive);
    BOOST_CHECK_EQUAL(state.stats.score, 5);
    BOOST_CHECK_EQUAL(state.player.exp, 10);
    BOOST_CHECK_EQUAL(state.stats.total_kills, 1);
    BOOST_CHECK_EQUAL(state.wave.kills_since_wave, 1);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::EnemyDeath), 1);
    BOOST_CHECK_EQUAL(state.events.front().value, 5);

    purge_dead_enemies(state);
    BOOST_CHECK(state.enemies.empty());
}

BOOST_AUTO_TEST_CASE(EnemyBehindPlayerIsSafe) {
    state.player.weapon = Weapon::Sword;
    state.enemies.push_back(make_enemy(EnemyKind::Wanderer, {170.0f, 203.0f}));
    BOOST_REQUIRE(begin_attack(state.player));
    tick_player_timers(state.player);
    BOOST_CHECK_EQUAL(resolve_melee(state, rng), 0);
    BOOST_CHECK(state.enemies.front().alive);
}

BOOST_AUTO_TEST_CASE(SwordBossKillGrantsNoExperience) {
    state.player.weapon = Weapon::Sword;
    Enemy boss = enemy_at(EnemyKind::Boss, {230.0f, 210.0f});
    boss.health = 1;
    state.enemies.push_back(boss);
    state.wave.active = true;
    state.wave.bosses_remaining = 1;

    BOOST_REQUIRE(begin_attack(state.player));
    tick_player_timers(state.player);
    BOOST_CHECK_EQUAL(resolve_melee(state, rng), 1);
    BOOST_CHECK_EQUAL(state.player.exp, 0);
    BOOST_CHECK_EQUAL(state.stats.score, 100);
    BOOST_CHECK_EQUAL(state.stats.boss_kills, 1);
    BOOST_CHECK_EQUAL(state.stats.total_kills, 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DAMAGE BOOKKEEPING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DamageTests, ArenaFixture)

BOOST_AUTO_TEST_CASE(SecondLethalHitIsIgnored) {
    state.enemies.push_back(make_enemy(EnemyKind::Wanderer, {300.0f, 300.0f}));
    Enemy& e = state.enemies.front();
    BOOST_CHECK(apply_enemy_damage(state, e, 1, DamageSource::Projectile, rng));
    BOOST_CHECK(!apply_enemy_damage(state, e, 1, DamageSource::Explosive, rng));
    BOOST_CHECK_EQUAL(state.stats.score, 5);
    BOOST_CHECK_EQUAL(state.stats.total_kills, 1);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::EnemyDeath), 1);
}

BOOST_AUTO_TEST_CASE(NonLethalHitRaisesHitEvent) {
    state.enemies.push_back(make_enemy(EnemyKind::Boss, {300.0f, 300.0f}));
    BOOST_CHECK(!apply_enemy_damage(state, state.enemies.front(), 2, DamageSource::Projectile, rng));
    BOOST_CHECK_EQUAL(state.enemies.front().health, kBossHealth - 2);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::EnemyHit), 1);
    BOOST_CHECK_EQUAL(state.stats.score, 0);
}

BOOST_AUTO_TEST_CASE(KillExperienceCanLevelUp) {
    state.player.exp = 95;
    state.enemies.push_back(make_enemy(EnemyKind::Pursuer, {300.0f, 300.0f}));
    apply_enemy_damage(state, state.enemies.front(), 1, DamageSource::Projectile, rng);
    BOOST_CHECK_EQUAL(state.player.level, 2);
    BOOST_CHECK_EQUAL(state.player.exp, 15);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::LevelUp), 1);
    BOOST_CHECK_EQUAL(state.message, "LEVEL UP! LV 2");
}

BOOST_AUTO_TEST_CASE(ArrowHitsFirstOverlappingEnemy) {
    state.enemies.push_back(make_enemy(EnemyKind::Wanderer, {300.0f, 300.0f}));
    state.enemies.push_back(make_enemy(EnemyKind::Wanderer, {302.0f, 302.0f}));
    Projectile arrow = make_projectile({305.0f, 305.0f}, {1.0f, 0.0f});
    BOOST_CHECK(resolve_projectile(state, arrow, rng));
    BOOST_CHECK(!arrow.active);
    BOOST_CHECK(!state.enemies[0].alive);
    BOOST_CHECK(state.enemies[1].alive);
}

BOOST_AUTO_TEST_CASE(ExplosionRadiusIsInclusiveDistance) {
    state.enemies.push_back(enemy_at(EnemyKind::Wanderer, {310.0f, 300.0f}));
    state.enemies.push_back(enemy_at(EnemyKind::Wanderer, {350.0f, 300.0f}));
    Explosive bomb = make_explosive({300.0f, 300.0f}, {0.0f, 0.0f}, kBombBaseDamage, kBombBaseRadius);

    BOOST_CHECK_EQUAL(resolve_explosion(state, bomb, rng), 1);
    BOOST_CHECK(!state.enemies[0].alive);
    BOOST_CHECK(state.enemies[1].alive);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::Explosion), 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CONTACT DAMAGE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ContactTests, ArenaFixture)

BOOST_AUTO_TEST_CASE(TouchHurtsThenCoolsDown) {
    state.enemies.push_back(enemy_at(EnemyKind::Boss, player_center(state.player)));
    BOOST_CHECK_EQUAL(resolve_contact_damage(state), 1);
    BOOST_CHECK_EQUAL(state.player.health, kPlayerMaxHealth - kBossDamage);
    BOOST_CHECK_EQUAL(state.enemies.front().damage_cooldown, kContactCooldown);
    BOOST_CHECK_EQUAL(state.stats.damage_taken, kBossDamage);

    state.player.invincible_timer = 0;
    BOOST_CHECK_EQUAL(resolve_contact_damage(state), 0);
    BOOST_CHECK_EQUAL(state.player.health, kPlayerMaxHealth - kBossDamage);
}

BOOST_AUTO_TEST_CASE(InvincibleTouchStillStartsCooldown) {
    state.player.invincible_timer = 10;
    state.enemies.push_back(enemy_at(EnemyKind::Wanderer, player_center(state.player)));
    BOOST_CHECK_EQUAL(resolve_contact_damage(state), 0);
    BOOST_CHECK_EQUAL(state.player.health, kPlayerMaxHealth);
    BOOST_CHECK_EQUAL(state.enemies.front().damage_cooldown, kContactCooldown);
}

BOOST_AUTO_TEST_CASE(DodgeIgnoresContact) {
    BOOST_REQUIRE(begin_dodge(state.player));
    state.enemies.push_back(enemy_at(EnemyKind::Boss, player_center(state.player)));
    BOOST_CHECK_EQUAL(resolve_contact_damage(state), 0);
    BOOST_CHECK_EQUAL(state.player.health, kPlayerMaxHealth);
    BOOST_CHECK_EQUAL(state.enemies.front().damage_cooldown, 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PICKUPS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PickupTests, ArenaFixture)

BOOST_AUTO_TEST_CASE(ChoosingWeaponDiscardsTheOthers) {
    state.items.push_back(make_item(ItemKind::Bow, {202.0f, 202.0f}));
    state.items.push_back(make_item(ItemKind::Sword, {500.0f, 300.0f}));
    state.items.push_back(make_item(ItemKind::Bomb, {600.0f, 300.0f}));
    state.items.push_back(make_item(ItemKind::HealSmall, {700.0f, 300.0f}));

    resolve_pickups(state);
    BOOST_CHECK(state.player.weapon == Weapon::Bow);
    BOOST_CHECK_EQUAL(count_items(state, is_weapon_item), 0);
    BOOST_CHECK_EQUAL(count_items(state, is_food_item), 1);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::WeaponEquipped), 1);
    BOOST_CHECK_EQUAL(count_events(state, EffectKind::WeaponDiscarded), 2);
    BOOST_CHECK_EQUAL(state.message, "BOW CHOSEN!");
}

BOOST_AUTO_TEST_CASE(FoodHealsAndIsConsumed) {
    state.player.health = 50;
    state.items.push_back(make_item(ItemKind::HealLarge, {202.0f, 202.0f}));
    resolve_pickups(state);
    BOOST_CHECK_EQUAL(state.player.health, 100);
    BOOST_CHECK(state.items.empty());
}

BOOST_AUTO_TEST_CASE(LootCrateUpgradesEquippedWeapon) {
    state.player.weapon = Weapon::Bomb;
    state.items.push_back(make_item(ItemKind::LootCrate, {202.0f, 202.0f}));
    resolve_pickups(state);
    BOOST_CHECK_EQUAL(state.player.bomb_level, 1);
    BOOST_CHECK_EQUAL(state.message, "Mega Bomb +1!");
    BOOST_CHECK_EQUAL(state.message_timer, kUpgradeMessageTicks);
    BOOST_CHECK(state.items.empty());
}

BOOST_AUTO_TEST_CASE(DistantItemsStay) {
    state.items.push_back(make_item(ItemKind::Sword, {400.0f, 400.0f}));
    resolve_pickups(state);
    BOOST_CHECK(state.player.weapon == Weapon::None);
    BOOST_CHECK_EQUAL(state.items.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
