#include "hellsurvivor/upgrade.hpp"

#include "hellsurvivor/config.hpp"
#include "hellsurvivor/state.hpp"

namespace hs {

std::vector<UpgradeDef> build_upgrade_catalog() {
    return {
        {UpgradeId::SpeedBoost, "Speed Boost", false},
        {UpgradeId::Vitality, "Vitality", true},
        {UpgradeId::IronSword, "Iron Sword", false},
        {UpgradeId::MultiArrow, "Multi-Arrow", false},
        {UpgradeId::MegaBomb, "Mega Bomb", false},
    };
}

UpgradeId upgrade_for_weapon(Weapon weapon) {
    switch (weapon) {
    case Weapon::Bow:
        return UpgradeId::MultiArrow;
    case Weapon::Bomb:
        return UpgradeId::MegaBomb;
    case Weapon::Sword:
    case Weapon::None:
        return UpgradeId::IronSword;
    }
    return UpgradeId::IronSword;
}

std::string apply_upgrade(Player& player, UpgradeId id) {
    switch (id) {
    case UpgradeId::SpeedBoost:
        player.speed_multiplier += 0.15f;
        return "Speed Boost!";
    case UpgradeId::Vitality:
        player.max_health = kVitalityMaxHealth;
        player.health = player.max_health;
        return "Vitality Up!";
    case UpgradeId::IronSword:
        player.sword_level += 1;
        return "Sword +" + std::to_string(player.sword_level) + "!";
    case UpgradeId::MultiArrow:
        player.extra_arrows += 1;
        return "Multi-Arrow! (+" + std::to_string(player.extra_arrows) + ")";
    case UpgradeId::MegaBomb:
        player.bomb_level += 1;
        return "Mega Bomb +" + std::to_string(player.bomb_level) + "!";
    case UpgradeId::Count:
        break;
    }
    return {};
}

} // namespace hs
