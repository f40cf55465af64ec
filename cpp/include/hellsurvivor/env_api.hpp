#pragma once

#include "state.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace hs {

struct StepInfo {
    int score = 0;
    int wave = 1;
    int kills = 0;
    int boss_kills = 0;
    int health = 0;
    int level = 1;
    bool wave_active = false;
    int enemies_alive = 0;
    std::unordered_map<std::string, float> scalars;
};

struct StepResult {
    std::vector<float> observation;
    std::vector<EffectEvent> events;
    bool terminated = false;
    StepInfo info;
};

} // namespace hs
