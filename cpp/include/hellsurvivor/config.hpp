#pragma once

#include <cstdint>

namespace hs {

constexpr int kTicksPerSecond = 60;
constexpr float kFixedDt = 1.0f / static_cast<float>(kTicksPerSecond);

constexpr int ms_to_ticks(int ms) { return ms * kTicksPerSecond / 1000; }

// World
constexpr float kMapWidth = 960.0f;
constexpr float kMapHeight = 540.0f;
constexpr float kPlatformMargin = 25.0f;
constexpr float kIslandLeft = kPlatformMargin;
constexpr float kIslandTop = kPlatformMargin;
constexpr float kIslandRight = kMapWidth - kPlatformMargin;
constexpr float kIslandBottom = kMapHeight - kPlatformMargin;
constexpr float kViewWidth = 640.0f;
constexpr float kViewHeight = 360.0f;
constexpr float kSpawnZoneMargin = 30.0f;
constexpr float kSpawnEdgeOffset = 20.0f;

// Obstructions
constexpr int kObstructionCount = 12;
constexpr int kObstructionPlacementAttempts = 500;
constexpr float kObstructionMinDistFromCenter = 80.0f;
constexpr float kObstructionMinSpacing = 60.0f;
constexpr float kObstructionOffsetX = 0.0f;
constexpr float kObstructionOffsetY = -6.0f;
constexpr float kObstructionWidth = 24.0f;
constexpr float kObstructionHeight = 28.0f;

// Player
constexpr float kPlayerWidth = 12.0f;
constexpr float kPlayerHeight = 20.0f;
constexpr float kPlayerSpawnX = kMapWidth * 0.5f;
constexpr float kPlayerSpawnY = kMapHeight * 0.5f;
constexpr float kPlayerSpeed = 1.5f;
constexpr float kDiagonalScale = 0.707f;
constexpr int kPlayerMaxHealth = 100;
constexpr int kVitalityMaxHealth = 150;
constexpr float kAttackRange = 32.0f;
constexpr float kAttackWidth = 28.0f;
constexpr int kAttackDuration = 18;
constexpr int kDodgeDuration = 12;
constexpr float kDodgeSpeed = 5.0f;
constexpr int kDodgeCooldown = 45;
constexpr int kInvincibleTicks = 30;
constexpr int kBowCooldown = 30;
constexpr int kBombCooldown = 90;
constexpr int kExpPerLevel = 100;
constexpr float kLevelSpeedBonus = 0.03f;
constexpr int kLevelHealthBonus = 5;
constexpr int kWalkFrameTicks = 8;
constexpr int kWalkFrames = 4;

// Enemies
constexpr float kWandererSize = 14.0f;
constexpr float kWandererSpeed = 0.6f;
constexpr int kWandererDamage = 5;
constexpr int kWandererHealth = 1;
constexpr float kPursuerSegmentSize = 6.0f;
constexpr int kPursuerSegments = 8;
constexpr float kPursuerSpeed = 0.8f;
constexpr int kPursuerDamage = 10;
constexpr int kPursuerHealth = 1;
constexpr float kBossSize = 32.0f;
constexpr float kBossSpeed = 1.0f;
constexpr int kBossDamage = 30;
constexpr int kBossHealth = 7;
constexpr float kBossSizeScalePerWave = 0.15f;
constexpr float kBossSpeedScalePerWave = 0.2f;
constexpr int kContactCooldown = kTicksPerSecond;
constexpr int kBossStallTicks = kTicksPerSecond;

// Weapons
constexpr float kArrowSpeed = 6.0f;
constexpr int kArrowDamage = 1;
constexpr int kArrowLifetime = 120;
constexpr float kArrowSize = 4.0f;
constexpr float kArrowSpreadStep = 0.1f;
constexpr float kBombSpeed = 4.0f;
constexpr float kBombDrag = 0.95f;
constexpr int kBombFuse = 30;
constexpr int kBombBaseDamage = 3;
constexpr int kBombDamagePerLevel = 2;
constexpr float kBombBaseRadius = 40.0f;
constexpr float kBombRadiusPerLevel = 15.0f;

// Items
constexpr float kSwordItemWidth = 6.0f;
constexpr float kSwordItemHeight = 14.0f;
constexpr float kBowItemWidth = 10.0f;
constexpr float kBowItemHeight = 12.0f;
constexpr float kBombItemSize = 10.0f;
constexpr float kFoodSize = 8.0f;
constexpr float kLootCrateSize = 12.0f;

// Spawning
constexpr int kEnemySpawnIntervalTicks = ms_to_ticks(3000);
constexpr int kEnemySpawnIntervalStepTicks = ms_to_ticks(300);
constexpr int kEnemySpawnIntervalFloorTicks = ms_to_ticks(800);
constexpr int kFoodSpawnIntervalTicks = ms_to_ticks(5000);
constexpr int kMaxEnemies = 12;
constexpr int kMaxEnemiesPerWave = 2;
constexpr int kMaxFood = 8;
constexpr int kInitialFood = 4;
constexpr float kWandererSpawnChance = 0.6f;

// Waves
constexpr int kWaveTimeTriggerTicks = 60 * kTicksPerSecond;
constexpr int kWaveKillTrigger = 10;
constexpr float kBossSpawnInset = 10.0f;
constexpr int kBossSpawnJitter = 20;

// HUD
constexpr int kShortMessageTicks = 90;
constexpr int kUpgradeMessageTicks = 120;
constexpr int kWaveMessageTicks = 150;

enum class RunMode {
    Rendered,
    Headless
};

} // namespace hs
