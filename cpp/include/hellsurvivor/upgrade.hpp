#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hs {

struct Player;
enum class Weapon : uint8_t;

enum class UpgradeId : uint8_t {
    SpeedBoost,
    Vitality,
    IronSword,
    MultiArrow,
    MegaBomb,
    Count
};

struct UpgradeDef {
    UpgradeId id;
    const char* name;
    bool unique;
};

std::vector<UpgradeDef> build_upgrade_catalog();

// Upgrade granted by a loot crate for the currently equipped weapon.
UpgradeId upgrade_for_weapon(Weapon weapon);

// Applies the upgrade and returns the HUD message for it.
std::string apply_upgrade(Player& player, UpgradeId id);

} // namespace hs
