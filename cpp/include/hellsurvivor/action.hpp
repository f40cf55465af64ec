#pragma once

namespace hs {

// One tick of player intent. Movement components are expected in {-1, 0, 1};
// anything else is clamped by the simulator.
struct Action {
    float move_x = 0.0f;
    float move_y = 0.0f;
    bool attack = false;
    bool dodge = false;
    bool restart = false;
};

} // namespace hs
