#include "hellsurvivor/sim.hpp"

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

namespace py = pybind11;

namespace {

const char* effect_name(hs::EffectKind kind) {
    switch (kind) {
    case hs::EffectKind::EnemyDeath:
        return "enemy_death";
    case hs::EffectKind::EnemyHit:
        return "enemy_hit";
    case hs::EffectKind::Explosion:
        return "explosion";
    case hs::EffectKind::ObstructionDestroyed:
        return "obstruction_destroyed";
    case hs::EffectKind::WeaponDiscarded:
        return "weapon_discarded";
    case hs::EffectKind::WeaponEquipped:
        return "weapon_equipped";
    case hs::EffectKind::Pickup:
        return "pickup";
    case hs::EffectKind::Upgrade:
        return "upgrade";
    case hs::EffectKind::LevelUp:
        return "level_up";
    case hs::EffectKind::PlayerHurt:
        return "player_hurt";
    case hs::EffectKind::Attack:
        return "attack";
    case hs::EffectKind::Dodge:
        return "dodge";
    case hs::EffectKind::BossSpawn:
        return "boss_spawn";
    case hs::EffectKind::WaveComplete:
        return "wave_complete";
    case hs::EffectKind::GameOver:
        return "game_over";
    }
    return "unknown";
}

py::array_t<float> as_numpy(const std::vector<float>& v) {
    py::array_t<float> arr(v.size());
    std::memcpy(arr.mutable_data(), v.data(), v.size() * sizeof(float));
    auto view = arr.mutable_unchecked<1>();
    for (py::ssize_t i = 0; i < view.shape(0); ++i) {
        if (!std::isfinite(view(i))) view(i) = 0.0f;
    }
    return arr;
}

float snap_axis(float v) {
    if (!std::isfinite(v)) return 0.0f;
    return std::round(std::clamp(v, -1.0f, 1.0f));
}

hs::Action action_from_array(const py::array_t<float, py::array::c_style | py::array::forcecast>& arr) {
    if (arr.ndim() != 1 || arr.shape(0) != hs::Simulator::action_dim()) {
        throw py::value_error("action must be a float32 array with shape (5,)");
    }

    auto a = arr.unchecked<1>();
    hs::Action out{};
    out.move_x = snap_axis(a(0));
    out.move_y = snap_axis(a(1));
    out.attack = a(2) >= 0.5f;
    out.dodge = a(3) >= 0.5f;
    out.restart = a(4) >= 0.5f;
    return out;
}

class PySimulator {
  public:
    explicit PySimulator(std::uint64_t seed = 0) { reset(seed); }

    py::array_t<float> reset(std::uint64_t seed) { return as_numpy(sim_.reset(seed)); }

    py::tuple step(const py::array_t<float, py::array::c_style | py::array::forcecast>& action) {
        const auto out = sim_.step(action_from_array(action));

        py::dict info;
        info["score"] = out.info.score;
        info["wave"] = out.info.wave;
        info["kills"] = out.info.kills;
        info["boss_kills"] = out.info.boss_kills;
        info["health"] = out.info.health;
        info["level"] = out.info.level;
        info["wave_active"] = out.info.wave_active;
        info["enemies_alive"] = out.info.enemies_alive;
        for (const auto& [key, value] : out.info.scalars) {
            info[py::str(key)] = value;
        }

        py::list events;
        for (const auto& ev : out.events) {
            events.append(py::make_tuple(effect_name(ev.kind), ev.pos.x, ev.pos.y, ev.value));
        }
        info["events"] = events;

        return py::make_tuple(as_numpy(out.observation), out.terminated, info);
    }

    int obs_dim() const { return hs::Simulator::observation_dim(); }
    int action_dim() const { return hs::Simulator::action_dim(); }

    static py::array_t<float> action_low() {
        py::array_t<float> arr(5);
        auto a = arr.mutable_unchecked<1>();
        a(0) = -1.0f; // move_x
        a(1) = -1.0f; // move_y
        a(2) = 0.0f;  // attack
        a(3) = 0.0f;  // dodge
        a(4) = 0.0f;  // restart
        return arr;
    }

    static py::array_t<float> action_high() {
        py::array_t<float> arr(5);
        auto a = arr.mutable_unchecked<1>();
        a(0) = 1.0f;
        a(1) = 1.0f;
        a(2) = 1.0f;
        a(3) = 1.0f;
        a(4) = 1.0f;
        return arr;
    }

  private:
    hs::Simulator sim_{};
};

} // namespace

PYBIND11_MODULE(hell_survivor_core, m) {
    py::class_<PySimulator>(m, "Simulator")
        .def(py::init<std::uint64_t>(), py::arg("seed") = 0)
        .def("reset", &PySimulator::reset, py::arg("seed"))
        .def("step", &PySimulator::step, py::arg("action"))
        .def("obs_dim", &PySimulator::obs_dim)
        .def("action_dim", &PySimulator::action_dim)
        .def_static("action_low", &PySimulator::action_low)
        .def_static("action_high", &PySimulator::action_high);
}
