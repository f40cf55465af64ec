#pragma once

#include "state.hpp"

#include <vector>

namespace hs {

constexpr int kEnemyObsCount = 8;
constexpr int kItemObsCount = 4;
constexpr int kPlayerObsDim = 22;
constexpr int kEnemyObsDim = 7;
constexpr int kItemObsDim = 4;
constexpr int kWaveObsDim = 6;
constexpr int kObservationDim =
    kPlayerObsDim + kEnemyObsCount * kEnemyObsDim + kItemObsCount * kItemObsDim + kWaveObsDim;

// Flat, roughly unit-scaled features of a snapshot for scripted consumers.
std::vector<float> build_observation(const GameState& state);

} // namespace hs
