#include "hellsurvivor/waves.hpp"

#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/enemies.hpp"

#include <algorithm>
#include <string>

namespace hs {

WavePhase wave_phase(const WaveState& wave) { return wave.active ? WavePhase::Active : WavePhase::Waiting; }

std::array<Vec2, 8> boss_spawn_slots() {
    const float near_left = kIslandLeft + kBossSpawnInset;
    const float near_top = kIslandTop + kBossSpawnInset;
    const float far_right = kIslandRight - kBossSize - kBossSpawnInset;
    const float far_bottom = kIslandBottom - kBossSize - kBossSpawnInset;
    const float mid_x = kMapWidth * 0.5f;
    const float mid_y = kMapHeight * 0.5f;
    return {{
        {far_right, far_bottom},
        {near_left, near_top},
        {far_right, near_top},
        {near_left, far_bottom},
        {mid_x, near_top},
        {mid_x, far_bottom},
        {near_left, mid_y},
        {far_right, mid_y},
    }};
}

bool wave_should_trigger(const GameState& state) {
    if (state.wave.active) return false;
    const uint64_t elapsed = state.tick - std::min(state.tick, state.wave.start_tick);
    return elapsed >= static_cast<uint64_t>(kWaveTimeTriggerTicks) || state.wave.kills_since_wave >= kWaveKillTrigger;
}

int spawn_wave_bosses(GameState& state, DeterministicRng& rng) {
    if (state.wave.active) return 0;

    const int count = std::max(1, state.wave.wave);
    const auto slots = boss_spawn_slots();
    state.wave.bosses_remaining = count;
    state.wave.loot_dropped = false;
    state.wave.complete = false;

    for (int i = 0; i < count; ++i) {
        Vec2 pos = slots[static_cast<size_t>(i) % slots.size()];
        pos.x += static_cast<float>(rng.uniform_int(-kBossSpawnJitter, kBossSpawnJitter));
        pos.y += static_cast<float>(rng.uniform_int(-kBossSpawnJitter, kBossSpawnJitter));
        Enemy boss = make_enemy(EnemyKind::Boss, pos, state.wave.wave);
        boss.pos = state.terrain.clamp(boss.pos, boss.size);
        state.enemies.push_back(boss);
    }

    state.wave.active = true;
    if (count == 1) {
        post_message(state, "WAVE " + std::to_string(state.wave.wave) + ": BOSS SPAWNED!", kWaveMessageTicks);
    } else {
        post_message(state, "WAVE " + std::to_string(state.wave.wave) + ": " + std::to_string(count) + " BOSSES!",
                     kWaveMessageTicks);
    }

    EffectEvent ev{};
    ev.kind = EffectKind::BossSpawn;
    ev.enemy = EnemyKind::Boss;
    ev.value = count;
    state.events.push_back(ev);
    return count;
}

bool check_wave_progression(GameState& state, DeterministicRng& rng) {
    if (!wave_should_trigger(state)) return false;
    return spawn_wave_bosses(state, rng) > 0;
}

bool record_boss_kill(GameState& state, Vec2 drop_center) {
    auto& w = state.wave;
    w.bosses_remaining = std::max(0, w.bosses_remaining - 1);

    if (w.bosses_remaining > 0 || w.loot_dropped) {
        post_message(state, "BOSS DOWN! " + std::to_string(w.bosses_remaining) + " LEFT!", kShortMessageTicks);
        return false;
    }

    const float half = kLootCrateSize * 0.5f;
    Item crate = make_item(ItemKind::LootCrate, {drop_center.x - half, drop_center.y - half});
    crate.pos = state.terrain.clamp(crate.pos, crate.size);
    state.items.push_back(crate);

    w.loot_dropped = true;
    post_message(state, "WAVE " + std::to_string(w.wave) + " COMPLETE!", kWaveMessageTicks);

    EffectEvent ev{};
    ev.kind = EffectKind::WaveComplete;
    ev.pos = drop_center;
    ev.value = w.wave;
    state.events.push_back(ev);

    w.active = false;
    w.complete = true;
    w.kills_since_wave = 0;
    w.start_tick = state.tick;
    w.wave += 1;
    return true;
}

} // namespace hs
