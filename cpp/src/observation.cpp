#include "hellsurvivor/observation.hpp"

#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/enemies.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace hs {
namespace {

constexpr float kDistanceScale = 500.0f;
constexpr float kUpgradeScale = 5.0f;
constexpr float kLevelScale = 10.0f;
constexpr float kWaveScale = 10.0f;
constexpr float kScoreScale = 1000.0f;
constexpr float kItemKindCount = 7.0f;

float one_hot(bool on) { return on ? 1.0f : 0.0f; }

float max_health_for(const Enemy& e) {
    if (e.kind != EnemyKind::Boss) return 1.0f;
    return static_cast<float>(kBossHealth + (e.wave - 1));
}

template <typename T, typename CenterFn>
std::vector<std::pair<float, const T*>> nearest_to(Vec2 origin, const std::vector<T>& items, CenterFn center) {
    std::vector<std::pair<float, const T*>> out;
    out.reserve(items.size());
    for (const auto& it : items) {
        const Vec2 c = center(it);
        const float dx = c.x - origin.x;
        const float dy = c.y - origin.y;
        out.push_back({dx * dx + dy * dy, &it});
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

} // namespace

std::vector<float> build_observation(const GameState& state) {
    std::vector<float> obs;
    obs.reserve(kObservationDim);

    const auto& p = state.player;
    const Vec2 pc = player_center(p);
    obs.push_back(p.pos.x / kMapWidth);
    obs.push_back(p.pos.y / kMapHeight);
    obs.push_back(static_cast<float>(p.health) / static_cast<float>(std::max(1, p.max_health)));
    obs.push_back(static_cast<float>(p.max_health) / static_cast<float>(kVitalityMaxHealth));
    obs.push_back(one_hot(p.facing == Direction::Up));
    obs.push_back(one_hot(p.facing == Direction::Down));
    obs.push_back(one_hot(p.facing == Direction::Left));
    obs.push_back(one_hot(p.facing == Direction::Right));
    obs.push_back(p.speed_multiplier);
    obs.push_back(one_hot(p.weapon == Weapon::None));
    obs.push_back(one_hot(p.weapon == Weapon::Sword));
    obs.push_back(one_hot(p.weapon == Weapon::Bow));
    obs.push_back(one_hot(p.weapon == Weapon::Bomb));
    obs.push_back(static_cast<float>(p.sword_level) / kUpgradeScale);
    obs.push_back(static_cast<float>(p.extra_arrows) / kUpgradeScale);
    obs.push_back(static_cast<float>(p.bomb_level) / kUpgradeScale);
    obs.push_back(static_cast<float>(p.level) / kLevelScale);
    obs.push_back(static_cast<float>(p.exp) / static_cast<float>(kExpPerLevel));
    obs.push_back(one_hot(p.attacking));
    obs.push_back(one_hot(p.dodging));
    obs.push_back(static_cast<float>(p.dodge_cooldown) / static_cast<float>(kDodgeCooldown));
    obs.push_back(static_cast<float>(p.invincible_timer) / static_cast<float>(kInvincibleTicks));

    const auto enemies = nearest_to(pc, state.enemies, [](const Enemy& e) { return enemy_center(e); });
    for (int i = 0; i < kEnemyObsCount; ++i) {
        if (i < static_cast<int>(enemies.size())) {
            const Enemy& e = *enemies[i].second;
            const Vec2 c = enemy_center(e);
            const Vec2 rel{c.x - pc.x, c.y - pc.y};
            obs.push_back(rel.x / kMapWidth);
            obs.push_back(rel.y / kMapHeight);
            obs.push_back(std::min(1.0f, length(rel) / kDistanceScale));
            obs.push_back(one_hot(e.kind == EnemyKind::Wanderer));
            obs.push_back(one_hot(e.kind == EnemyKind::Pursuer));
            obs.push_back(one_hot(e.kind == EnemyKind::Boss));
            obs.push_back(static_cast<float>(e.health) / max_health_for(e));
        } else {
            obs.insert(obs.end(), {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 0.0f});
        }
    }

    const auto items = nearest_to(pc, state.items, [](const Item& it) { return rect_center(item_rect(it)); });
    for (int i = 0; i < kItemObsCount; ++i) {
        if (i < static_cast<int>(items.size())) {
            const Item& it = *items[i].second;
            const Vec2 c = rect_center(item_rect(it));
            const Vec2 rel{c.x - pc.x, c.y - pc.y};
            obs.push_back(rel.x / kMapWidth);
            obs.push_back(rel.y / kMapHeight);
            obs.push_back(std::min(1.0f, length(rel) / kDistanceScale));
            obs.push_back((static_cast<float>(it.kind) + 0.5f) / kItemKindCount);
        } else {
            obs.insert(obs.end(), {0.0f, 0.0f, 1.0f, 0.0f});
        }
    }

    const auto& w = state.wave;
    const float since_start = static_cast<float>(state.tick - std::min(state.tick, w.start_tick));
    obs.push_back(static_cast<float>(w.wave) / kWaveScale);
    obs.push_back(one_hot(w.active));
    obs.push_back(static_cast<float>(w.bosses_remaining) / kWaveScale);
    obs.push_back(static_cast<float>(w.kills_since_wave) / static_cast<float>(kWaveKillTrigger));
    obs.push_back(std::min(1.0f, since_start / static_cast<float>(kWaveTimeTriggerTicks)));
    obs.push_back(static_cast<float>(state.stats.score) / kScoreScale);

    return obs;
}

} // namespace hs
