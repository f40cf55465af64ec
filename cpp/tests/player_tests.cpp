#define BOOST_TEST_MODULE PlayerTests
#include <boost/test/unit_test.hpp>

#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/upgrade.hpp"

using namespace hs;

class PlayerFixture {
  public:
    PlayerFixture() { player.pos = {200.0f, 200.0f}; }

  protected:
    Player player;
    TerrainModel terrain;
};

// ============================================================================
// MOVEMENT
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MovementTests, PlayerFixture)

BOOST_AUTO_TEST_CASE(DiagonalIsScaledAndFacesSideways) {
    Action action{};
    action.move_x = 1.0f;
    action.move_y = 1.0f;
    apply_move_intent(player, action, terrain);

    const float step = kPlayerSpeed * kDiagonalScale;
    BOOST_CHECK_CLOSE(player.pos.x, 200.0f + step, 0.001f);
    BOOST_CHECK_CLOSE(player.pos.y, 200.0f + step, 0.001f);
    BOOST_CHECK(player.facing == Direction::Right);
    BOOST_CHECK(player.moving);
}

BOOST_AUTO_TEST_CASE(NoIntentKeepsPositionAndFacing) {
    player.facing = Direction::Left;
    apply_move_intent(player, Action{}, terrain);
    BOOST_CHECK_CLOSE(player.pos.x, 200.0f, 0.001f);
    BOOST_CHECK(player.facing == Direction::Left);
    BOOST_CHECK(!player.moving);
}

BOOST_AUTO_TEST_CASE(DodgeDashesAlongFacing) {
    player.facing = Direction::Up;
    BOOST_REQUIRE(begin_dodge(player));

    Action action{};
    action.move_x = 1.0f;
    apply_move_intent(player, action, terrain);
    BOOST_CHECK_CLOSE(player.pos.x, 200.0f, 0.001f);
    BOOST_CHECK_CLOSE(player.pos.y, 200.0f - kDodgeSpeed, 0.001f);

    // Cooldown blocks an immediate second dodge.
    for (int i = 0; i < kDodgeDuration; ++i) tick_player_timers(player);
    BOOST_CHECK(!player.dodging);
    BOOST_CHECK(!begin_dodge(player));
}

BOOST_AUTO_TEST_CASE(MovementStaysOnIsland) {
    player.pos = {kIslandLeft, kIslandTop};
    Action action{};
    action.move_x = -1.0f;
    action.move_y = -1.0f;
    for (int i = 0; i < 10; ++i) apply_move_intent(player, action, terrain);
    BOOST_CHECK_CLOSE(player.pos.x, kIslandLeft, 0.001f);
    BOOST_CHECK_CLOSE(player.pos.y, kIslandTop, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ACTIONS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ActionTests, PlayerFixture)

BOOST_AUTO_TEST_CASE(AttackNeedsSword) {
    BOOST_CHECK(!begin_attack(player));
    player.weapon = Weapon::Sword;
    BOOST_CHECK(begin_attack(player));
    BOOST_CHECK_EQUAL(player.attack_timer, kAttackDuration);
    BOOST_CHECK(!begin_attack(player));
    BOOST_CHECK(!begin_dodge(player));
}

BOOST_AUTO_TEST_CASE(StrikeLandsOnFirstTickOnly) {
    player.weapon = Weapon::Sword;
    BOOST_REQUIRE(begin_attack(player));
    BOOST_CHECK(!melee_strike_tick(player));
    tick_player_timers(player);
    BOOST_CHECK(melee_strike_tick(player));
    tick_player_timers(player);
    BOOST_CHECK(!melee_strike_tick(player));
    for (int i = 0; i < kAttackDuration; ++i) tick_player_timers(player);
    BOOST_CHECK(!player.attacking);
    BOOST_CHECK(!melee_hitbox(player).has_value());
}

BOOST_AUTO_TEST_CASE(HitboxGrowsWithSwordLevel) {
    player.weapon = Weapon::Sword;
    player.facing = Direction::Right;
    BOOST_REQUIRE(begin_attack(player));
    const auto base = melee_hitbox(player);
    BOOST_REQUIRE(base.has_value());
    BOOST_CHECK_CLOSE(base->w, kAttackRange, 0.001f);
    BOOST_CHECK_CLOSE(base->h, kAttackWidth, 0.001f);

    player.sword_level = 2;
    const auto big = melee_hitbox(player);
    BOOST_REQUIRE(big.has_value());
    BOOST_CHECK_CLOSE(big->w, kAttackRange * 1.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(SwordDamageProgression) {
    const int expected[] = {2, 3, 5, 6, 8};
    for (int level = 0; level < 5; ++level) {
        player.sword_level = level;
        BOOST_CHECK_EQUAL(sword_damage(player), expected[level]);
    }
}

BOOST_AUTO_TEST_CASE(BowCooldownGatesShots) {
    player.weapon = Weapon::Bow;
    BOOST_CHECK(begin_shot(player));
    BOOST_CHECK(!begin_shot(player));
    for (int i = 0; i < kBowCooldown; ++i) tick_player_timers(player);
    BOOST_CHECK(begin_shot(player));
}

BOOST_AUTO_TEST_CASE(ExtraArrowsFanOut) {
    player.facing = Direction::Right;
    player.extra_arrows = 2;
    const auto dirs = arrow_directions(player);
    BOOST_REQUIRE_EQUAL(dirs.size(), 5u);
    BOOST_CHECK_CLOSE(dirs[0].x, 1.0f, 0.001f);
    BOOST_CHECK_GT(dirs[1].y, 0.0f);
    BOOST_CHECK_LT(dirs[2].y, 0.0f);
    for (const auto& d : dirs) BOOST_CHECK_CLOSE(length(d), 1.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(BombScalesWithLevel) {
    player.bomb_level = 2;
    BOOST_CHECK_EQUAL(bomb_damage(player), 7);
    BOOST_CHECK_CLOSE(bomb_radius(player), 70.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// HEALTH AND LEVELING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(HealthTests, PlayerFixture)

BOOST_AUTO_TEST_CASE(InvincibilityAbsorbsFollowUpHits) {
    BOOST_CHECK(take_damage(player, 30));
    BOOST_CHECK_EQUAL(player.health, 70);
    BOOST_CHECK(!take_damage(player, 30));
    BOOST_CHECK_EQUAL(player.health, 70);

    for (int i = 0; i < kInvincibleTicks; ++i) tick_player_timers(player);
    BOOST_CHECK(take_damage(player, 80));
    BOOST_CHECK_EQUAL(player.health, 0);
}

BOOST_AUTO_TEST_CASE(DodgingTakesNoDamage) {
    BOOST_REQUIRE(begin_dodge(player));
    BOOST_CHECK(!take_damage(player, 30));
    BOOST_CHECK_EQUAL(player.health, kPlayerMaxHealth);
}

BOOST_AUTO_TEST_CASE(HealClampsToMax) {
    player.health = 95;
    heal(player, 50);
    BOOST_CHECK_EQUAL(player.health, player.max_health);
}

BOOST_AUTO_TEST_CASE(LevelingConsumesExperienceRepeatedly) {
    const int levels = gain_experience(player, 250);
    BOOST_CHECK_EQUAL(levels, 2);
    BOOST_CHECK_EQUAL(player.level, 3);
    BOOST_CHECK_EQUAL(player.exp, 50);
    BOOST_CHECK_EQUAL(player.max_health, kPlayerMaxHealth + 2 * kLevelHealthBonus);
    BOOST_CHECK_EQUAL(player.health, player.max_health);
    BOOST_CHECK_CLOSE(player.speed_multiplier, 1.06f, 0.01f);
}

BOOST_AUTO_TEST_CASE(ExperienceBelowThresholdKeepsLevel) {
    BOOST_CHECK_EQUAL(gain_experience(player, 99), 0);
    BOOST_CHECK_EQUAL(player.level, 1);
    BOOST_CHECK_EQUAL(gain_experience(player, 1), 1);
    BOOST_CHECK_EQUAL(player.exp, 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// UPGRADES
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(UpgradeTests, PlayerFixture)

BOOST_AUTO_TEST_CASE(CrateUpgradeFollowsWeapon) {
    BOOST_CHECK(upgrade_for_weapon(Weapon::Bow) == UpgradeId::MultiArrow);
    BOOST_CHECK(upgrade_for_weapon(Weapon::Bomb) == UpgradeId::MegaBomb);
    BOOST_CHECK(upgrade_for_weapon(Weapon::Sword) == UpgradeId::IronSword);
    BOOST_CHECK(upgrade_for_weapon(Weapon::None) == UpgradeId::IronSword);
}

BOOST_AUTO_TEST_CASE(UpgradeMessages) {
    BOOST_CHECK_EQUAL(apply_upgrade(player, UpgradeId::IronSword), "Sword +1!");
    BOOST_CHECK_EQUAL(apply_upgrade(player, UpgradeId::MultiArrow), "Multi-Arrow! (+1)");
    BOOST_CHECK_EQUAL(apply_upgrade(player, UpgradeId::MegaBomb), "Mega Bomb +1!");
    BOOST_CHECK_EQUAL(apply_upgrade(player, UpgradeId::SpeedBoost), "Speed Boost!");
    BOOST_CHECK_CLOSE(player.speed_multiplier, 1.15f, 0.01f);
}

BOOST_AUTO_TEST_CASE(VitalityRaisesMaxAndHeals) {
    player.health = 20;
    apply_upgrade(player, UpgradeId::Vitality);
    BOOST_CHECK_EQUAL(player.max_health, kVitalityMaxHealth);
    BOOST_CHECK_EQUAL(player.health, kVitalityMaxHealth);
}

BOOST_AUTO_TEST_CASE(CatalogMarksVitalityUnique) {
    const auto catalog = build_upgrade_catalog();
    BOOST_REQUIRE_EQUAL(catalog.size(), static_cast<size_t>(UpgradeId::Count));
    for (const auto& def : catalog) {
        BOOST_CHECK_EQUAL(def.unique, def.id == UpgradeId::Vitality);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PROJECTILES
// ============================================================================

BOOST_AUTO_TEST_SUITE(ProjectileTests)

BOOST_AUTO_TEST_CASE(ArrowExpiresOffMap) {
    Projectile a = make_projectile({955.0f, 100.0f}, {1.0f, 0.0f});
    advance_projectile(a, map_rect());
    BOOST_CHECK(!a.active);
}

BOOST_AUTO_TEST_CASE(ArrowExpiresAfterLifetime) {
    Projectile a = make_projectile({100.0f, 100.0f}, {0.0f, 0.0f});
    for (int i = 0; i < kArrowLifetime - 1; ++i) advance_projectile(a, map_rect());
    BOOST_CHECK(a.active);
    advance_projectile(a, map_rect());
    BOOST_CHECK(!a.active);
}

BOOST_AUTO_TEST_CASE(BombDetonatesWhenFuseRunsOut) {
    Explosive b = make_explosive({300.0f, 300.0f}, {1.0f, 0.0f}, 3, 40.0f);
    for (int i = 0; i < kBombFuse - 1; ++i) BOOST_CHECK(!advance_explosive(b, island_rect()));
    BOOST_CHECK(advance_explosive(b, island_rect()));
    BOOST_CHECK(b.exploded);
    BOOST_CHECK_GT(b.pos.x, 300.0f);
    BOOST_CHECK(!advance_explosive(b, island_rect()));
}

BOOST_AUTO_TEST_CASE(BombStaysOnIsland) {
    Explosive b = make_explosive({kIslandRight - 2.0f, 300.0f}, {1.0f, 0.0f}, 3, 40.0f);
    for (int i = 0; i < 5; ++i) advance_explosive(b, island_rect());
    BOOST_CHECK_LE(b.pos.x, kIslandRight);
}

BOOST_AUTO_TEST_SUITE_END()
