#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/enemies.hpp"
#include "hellsurvivor/scoreboard.hpp"
#include "hellsurvivor/sim.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#ifdef HELLSURVIVOR_WITH_RAYLIB
#include <raylib.h>
#endif

namespace {

constexpr float kAutopilotLowHealth = 0.5f;
constexpr float kAutopilotDodgeRange = 18.0f;
constexpr float kAutopilotRangedRange = 220.0f;
constexpr float kAxisDeadzone = 4.0f;

float axis_toward(float from, float to) {
    const float d = to - from;
    if (d > kAxisDeadzone) return 1.0f;
    if (d < -kAxisDeadzone) return -1.0f;
    return 0.0f;
}

template <typename T, typename CenterFn, typename Pred>
const T* nearest(hs::Vec2 origin, const std::vector<T>& list, CenterFn center, Pred pred) {
    const T* best = nullptr;
    float best_d = std::numeric_limits<float>::max();
    for (const auto& it : list) {
        if (!pred(it)) continue;
        const float d = hs::distance(origin, center(it));
        if (d < best_d) {
            best_d = d;
            best = &it;
        }
    }
    return best;
}

// Scripted player for headless runs: arm up, eat when hurt, grab loot, then
// walk toward the closest enemy and swing or shoot at it.
hs::Action autopilot(const hs::GameState& s) {
    hs::Action action{};
    const auto& p = s.player;
    const hs::Vec2 pc = hs::player_center(p);
    const auto item_center = [](const hs::Item& it) { return hs::rect_center(hs::item_rect(it)); };

    const hs::Item* goal = nullptr;
    if (p.weapon == hs::Weapon::None) {
        goal = nearest(pc, s.items, item_center, [](const hs::Item& it) { return hs::is_weapon_item(it.kind); });
    }
    if (goal == nullptr) {
        goal = nearest(pc, s.items, item_center, [](const hs::Item& it) { return it.kind == hs::ItemKind::LootCrate; });
    }
    if (goal == nullptr &&
        static_cast<float>(p.health) < kAutopilotLowHealth * static_cast<float>(p.max_health)) {
        goal = nearest(pc, s.items, item_center, [](const hs::Item& it) { return hs::is_food_item(it.kind); });
    }

    const hs::Enemy* target = nearest(pc, s.enemies, [](const hs::Enemy& e) { return hs::enemy_center(e); },
                                      [](const hs::Enemy& e) { return e.alive; });

    if (goal != nullptr) {
        const hs::Vec2 g = item_center(*goal);
        action.move_x = axis_toward(pc.x, g.x);
        action.move_y = axis_toward(pc.y, g.y);
    } else if (target != nullptr) {
        const hs::Vec2 t = hs::enemy_center(*target);
        action.move_x = axis_toward(pc.x, t.x);
        action.move_y = axis_toward(pc.y, t.y);
    }

    if (target != nullptr && p.weapon != hs::Weapon::None) {
        const float d = hs::distance(pc, hs::enemy_center(*target));
        const float reach = p.weapon == hs::Weapon::Sword ? hs::kAttackRange : kAutopilotRangedRange;
        action.attack = d <= reach;
        action.dodge = d <= kAutopilotDodgeRange && p.dodge_cooldown == 0 && !p.attacking;
    }
    return action;
}

void log_events(const hs::GameState& s, const std::vector<hs::EffectEvent>& events) {
    for (const auto& ev : events) {
        switch (ev.kind) {
        case hs::EffectKind::BossSpawn:
            std::cout << "  [t=" << s.tick << "] wave " << s.wave.wave << " started, " << s.wave.bosses_remaining
                      << " boss(es)\n";
            break;
        case hs::EffectKind::WaveComplete:
            std::cout << "  [t=" << s.tick << "] wave " << (s.wave.wave - 1) << " complete, score=" << s.stats.score
                      << '\n';
            break;
        case hs::EffectKind::Upgrade:
            std::cout << "  [t=" << s.tick << "] " << s.message << '\n';
            break;
        case hs::EffectKind::GameOver:
            std::cout << "  [t=" << s.tick << "] game over\n";
            break;
        default:
            break;
        }
    }
}

hs::ScoreEntry summarize(const hs::GameState& s) {
    hs::ScoreEntry entry{};
    entry.score = s.stats.score;
    const std::uint64_t ticks = hs::game_over(s) ? s.final_tick : s.tick;
    entry.time_s = static_cast<float>(ticks) * hs::kFixedDt;
    entry.wave = s.wave.wave;
    entry.kills = s.stats.total_kills;
    entry.seed = s.seed;
    return entry;
}

void print_scoreboard(const hs::Scoreboard& board) {
    std::cout << "High scores:\n";
    int rank = 1;
    for (const auto& e : board.entries()) {
        std::cout << "  " << std::setw(2) << rank++ << ". score=" << e.score << " time=" << std::fixed
                  << std::setprecision(1) << e.time_s << "s wave=" << e.wave << " kills=" << e.kills
                  << " seed=" << e.seed << '\n';
    }
}

void print_usage() {
    std::cout << "Usage: hell_survivor [--headless|--rendered] [--seed N] [--max-steps N] [--runs N] [--verbose]\n";
}

#ifdef HELLSURVIVOR_WITH_RAYLIB
constexpr int kWindowScale = 2;

Color item_color(hs::ItemKind kind) {
    switch (kind) {
    case hs::ItemKind::Sword:
        return LIGHTGRAY;
    case hs::ItemKind::Bow:
        return BROWN;
    case hs::ItemKind::Bomb:
        return DARKGRAY;
    case hs::ItemKind::HealSmall:
        return RED;
    case hs::ItemKind::HealMedium:
        return YELLOW;
    case hs::ItemKind::HealLarge:
        return PINK;
    case hs::ItemKind::LootCrate:
        return GOLD;
    }
    return WHITE;
}

void draw_state(const hs::GameState& s, const Camera2D& camera) {
    BeginDrawing();
    ClearBackground({20, 12, 16, 255});

    BeginMode2D(camera);
    const hs::Rect& isl = s.terrain.island();
    DrawRectangleRec({isl.x, isl.y, isl.w, isl.h}, {70, 52, 44, 255});
    for (const auto& o : s.terrain.obstructions()) {
        DrawRectangleRec({o.box.x, o.box.y, o.box.w, o.box.h}, {40, 30, 24, 255});
    }
    for (const auto& it : s.items) {
        const float bob = std::sin(it.bob_phase + static_cast<float>(s.tick) * 0.1f) * 2.0f;
        DrawRectangleRec({it.pos.x, it.pos.y + bob, it.size.x, it.size.y}, item_color(it.kind));
    }
    for (const auto& e : s.enemies) {
        if (e.kind == hs::EnemyKind::Pursuer) {
            const auto& trail = std::get<hs::PursuerBrain>(e.brain).trail;
            for (const auto& seg : trail) DrawCircleV({seg.x, seg.y}, hs::kPursuerSegmentSize * 0.5f, DARKGREEN);
        }
        const Color c = e.kind == hs::EnemyKind::Boss ? MAROON : (e.kind == hs::EnemyKind::Pursuer ? GREEN : PURPLE);
        DrawRectangleRec({e.pos.x, e.pos.y, e.size.x, e.size.y}, c);
    }
    for (const auto& a : s.projectiles) DrawRectangleRec({a.pos.x, a.pos.y, hs::kArrowSize, hs::kArrowSize}, BEIGE);
    for (const auto& b : s.explosives) DrawCircleV({b.pos.x, b.pos.y}, 4.0f, BLACK);
    for (const auto& pt : s.particles) {
        const float alpha = static_cast<float>(pt.lifetime) / static_cast<float>(std::max(1, pt.max_lifetime));
        DrawRectangleRec({pt.pos.x, pt.pos.y, pt.size, pt.size}, Fade(ORANGE, alpha));
    }

    const auto& p = s.player;
    const bool blink = p.invincible_timer > 0 && (p.invincible_timer / 4) % 2 == 0;
    if (!blink) DrawRectangleRec({p.pos.x, p.pos.y, p.size.x, p.size.y}, p.dodging ? SKYBLUE : RAYWHITE);
    if (const auto hitbox = hs::melee_hitbox(p)) {
        DrawRectangleLinesEx({hitbox->x, hitbox->y, hitbox->w, hitbox->h}, 1.0f, WHITE);
    }
    for (const auto& ft : s.floating_texts) {
        DrawText(TextFormat("+%d", ft.value), static_cast<int>(ft.pos.x), static_cast<int>(ft.pos.y), 8, GOLD);
    }
    EndMode2D();

    DrawText(TextFormat("HP %d/%d  LV %d  SCORE %d  WAVE %d", p.health, p.max_health, p.level, s.stats.score,
                        s.wave.wave),
             16, 16, 20, WHITE);
    if (s.message_timer > 0) {
        const int w = MeasureText(s.message.c_str(), 28);
        DrawText(s.message.c_str(), (GetScreenWidth() - w) / 2, 80, 28, GOLD);
    }
    if (hs::game_over(s)) {
        DrawRectangle(0, 0, GetScreenWidth(), GetScreenHeight(), Fade(BLACK, 0.6f));
        DrawText("GAME OVER - press R", GetScreenWidth() / 2 - 160, GetScreenHeight() / 2, 32, RED);
    }
    EndDrawing();
}
#endif

} // namespace

int main(int argc, char** argv) {
#ifdef HELLSURVIVOR_WITH_RAYLIB
    bool headless = false;
#endif
    std::uint64_t seed = 1337;
    int max_steps = 36000;
    int runs = 1;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
#ifndef HELLSURVIVOR_WITH_RAYLIB
            if (arg == "--rendered") {
                std::cerr << "Rendered mode is unavailable: built without raylib.\n";
                return 2;
            }
#endif
            if (arg == "--headless") {
#ifdef HELLSURVIVOR_WITH_RAYLIB
                headless = true;
#endif
            } else if (arg == "--rendered") {
#ifdef HELLSURVIVOR_WITH_RAYLIB
                headless = false;
#endif
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--max-steps" && i + 1 < argc) {
                max_steps = std::stoi(argv[++i]);
            } else if (arg == "--runs" && i + 1 < argc) {
                runs = std::stoi(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << '\n';
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse CLI arguments: " << ex.what() << '\n';
        return 2;
    }

    if (max_steps < 1) {
        std::cerr << "--max-steps must be >= 1\n";
        return 2;
    }
    if (runs < 1) {
        std::cerr << "--runs must be >= 1\n";
        return 2;
    }

    hs::Simulator sim;
    hs::Scoreboard board;
    sim.reset(seed);

#ifdef HELLSURVIVOR_WITH_RAYLIB
    if (!headless) {
        InitWindow(static_cast<int>(hs::kViewWidth) * kWindowScale, static_cast<int>(hs::kViewHeight) * kWindowScale,
                   "Hell Survivor");
        SetTargetFPS(hs::kTicksPerSecond);

        Camera2D camera{};
        camera.offset = {0.0f, 0.0f};
        camera.rotation = 0.0f;
        camera.zoom = static_cast<float>(kWindowScale);

        bool recorded = false;
        while (!WindowShouldClose()) {
            hs::Action action{};
            action.move_x = ((IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT)) ? 1.0f : 0.0f) -
                            ((IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT)) ? 1.0f : 0.0f);
            action.move_y = ((IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN)) ? 1.0f : 0.0f) -
                            ((IsKeyDown(KEY_W) || IsKeyDown(KEY_UP)) ? 1.0f : 0.0f);
            action.attack = IsKeyPressed(KEY_SPACE);
            action.dodge = IsKeyPressed(KEY_LEFT_SHIFT) || IsKeyPressed(KEY_RIGHT_SHIFT);
            action.restart = IsKeyPressed(KEY_R);

            const auto res = sim.step(action);
            const auto& s = sim.state();
            if (verbose) log_events(s, res.events);

            if (res.terminated && !recorded) {
                const int rank = board.record(summarize(s));
                if (rank > 0) std::cout << "New high score, rank " << rank << '\n';
                recorded = true;
            } else if (!res.terminated) {
                recorded = false;
            }

            camera.target = {s.view.x, s.view.y};
            draw_state(s, camera);
        }

        CloseWindow();
        if (!board.empty()) print_scoreboard(board);
        return 0;
    }
#endif

    for (int run = 0; run < runs; ++run) {
        const std::uint64_t run_seed = seed + static_cast<std::uint64_t>(run);
        sim.reset(run_seed);
        if (verbose) std::cout << "run " << (run + 1) << " seed=" << run_seed << '\n';

        for (int i = 0; i < max_steps; ++i) {
            const auto res = sim.step(autopilot(sim.state()));
            if (verbose) log_events(sim.state(), res.events);
            if (res.terminated) break;
        }

        const auto& end_state = sim.state();
        const hs::ScoreEntry entry = summarize(end_state);
        const int rank = board.record(entry);
        std::cout << "seed=" << run_seed << " ticks=" << end_state.tick << " score=" << entry.score
                  << " wave=" << entry.wave << " kills=" << entry.kills << " boss_kills=" << end_state.stats.boss_kills
                  << " level=" << end_state.player.level << " dead=" << (hs::game_over(end_state) ? 1 : 0)
                  << " rank=" << rank << '\n';
    }

    if (runs > 1) print_scoreboard(board);
    return 0;
}
