/**
 * pycrossgrid — Python bindings for the crossgrid multi-agent environment
 *
 * Exposes CrossoverEnv with a gym-style surface:
 *   obs = env.reset()
 *   obs, rewards, dones, info = env.step([0, 3, 1, 4])
 *   img = env.render("rgb_array")      # numpy uint8 (H, W, 3)
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "engine/crossover_env.h"
#include "engine/errors.h"

#include <algorithm>
#include <string>
#include <stdexcept>

namespace py = pybind11;
using namespace crossgrid;

// Helper: RGB frame → numpy (H, W, 3)
static py::array_t<uint8_t> frame_to_numpy(const RenderFrame& frame) {
    py::array_t<uint8_t> arr({static_cast<py::ssize_t>(frame.height),
                              static_cast<py::ssize_t>(frame.width),
                              static_cast<py::ssize_t>(3)});
    std::copy(frame.pixels.begin(), frame.pixels.end(), arr.mutable_data());
    return arr;
}

static RenderMode parse_render_mode(const std::string& mode) {
    if (mode == "human")     return RenderMode::HUMAN;
    if (mode == "rgb_array") return RenderMode::RGB_ARRAY;
    if (mode == "ansi")      return RenderMode::ANSI;
    throw std::invalid_argument("unsupported render mode: " + mode);
}

static py::tuple step_to_tuple(const StepResult& r) {
    py::dict info;
    for (const auto& kv : r.info) info[py::str(kv.first)] = kv.second;
    return py::make_tuple(r.observations, r.rewards, r.dones, info);
}

PYBIND11_MODULE(pycrossgrid, m) {
    m.doc() = "crossgrid multi-agent corridor crossing environment";

    // =========================================================================
    // Errors
    // =========================================================================
    py::register_exception<InvalidAction>(m, "InvalidAction", PyExc_ValueError);
    py::register_exception<ActionCountMismatch>(m, "ActionCountMismatch", PyExc_ValueError);
    py::register_exception<NotInitialized>(m, "NotInitialized", PyExc_RuntimeError);

    // =========================================================================
    // Enums
    // =========================================================================
    py::enum_<Action>(m, "Action")
        .value("DOWN",  Action::DOWN)
        .value("LEFT",  Action::LEFT)
        .value("UP",    Action::UP)
        .value("RIGHT", Action::RIGHT)
        .value("NOOP",  Action::NOOP);

    py::enum_<RenderMode>(m, "RenderMode")
        .value("HUMAN",     RenderMode::HUMAN)
        .value("RGB_ARRAY", RenderMode::RGB_ARRAY)
        .value("ANSI",      RenderMode::ANSI);

    py::enum_<EnvState>(m, "EnvState")
        .value("UNINITIALIZED", EnvState::UNINITIALIZED)
        .value("RUNNING",       EnvState::RUNNING)
        .value("TERMINATED",    EnvState::TERMINATED);

    // =========================================================================
    // Config
    // =========================================================================
    py::class_<CrossoverConfig>(m, "CrossoverConfig")
        .def(py::init<>())
        .def_readwrite("grid_cols",       &CrossoverConfig::grid_cols)
        .def_readwrite("max_steps",       &CrossoverConfig::max_steps)
        .def_readwrite("goal_reward",     &CrossoverConfig::goal_reward)
        .def_readwrite("step_cost",       &CrossoverConfig::step_cost)
        .def_readwrite("full_observable", &CrossoverConfig::full_observable)
        .def_readwrite("cell_size",       &CrossoverConfig::cell_size)
        .def_readwrite("verbose",         &CrossoverConfig::verbose)
        .def_property_readonly("grid_rows", &CrossoverConfig::grid_rows)
        .def_property_readonly("n_agents",  &CrossoverConfig::n_agents);

    // =========================================================================
    // CrossoverEnv
    // =========================================================================
    py::class_<CrossoverEnv>(m, "CrossoverEnv", "4-agent corridor crossing (cooperative)")
        .def(py::init<const CrossoverConfig&>(), py::arg("config") = CrossoverConfig{})
        .def(py::init([](bool full_observable, float step_cost) {
            CrossoverConfig cfg;
            cfg.full_observable = full_observable;
            cfg.step_cost = step_cost;
            return std::make_unique<CrossoverEnv>(cfg);
        }), py::arg("full_observable"), py::arg("step_cost") = 0.0f)
        .def("reset", &CrossoverEnv::reset)
        .def("step", [](CrossoverEnv& env, const std::vector<int>& actions) {
            return step_to_tuple(env.step(actions));
        }, py::arg("actions"))
        .def("observe", &CrossoverEnv::observe)
        .def("render", [](CrossoverEnv& env, const std::string& mode) -> py::object {
            RenderMode rm = parse_render_mode(mode);
            RenderFrame frame = env.render(rm);
            if (rm == RenderMode::RGB_ARRAY) return frame_to_numpy(frame);
            if (rm == RenderMode::HUMAN)     return py::bool_(frame.is_open);
            return py::str(frame.text);
        }, py::arg("mode") = "human")
        .def("close", &CrossoverEnv::close)
        .def("get_action_meanings", &CrossoverEnv::get_action_meanings)
        .def_property_readonly("n_agents",  &CrossoverEnv::n_agents)
        .def_property_readonly("n_actions", &CrossoverEnv::n_actions)
        .def_property_readonly("obs_size",  &CrossoverEnv::obs_size)
        .def_property_readonly("step_count", &CrossoverEnv::step_count)
        .def_property_readonly("state",      &CrossoverEnv::state)
        .def_property_readonly("agent_dones", &CrossoverEnv::agent_dones)
        .def("agent_pos", [](const CrossoverEnv& env, size_t i) {
            if (i >= env.n_agents()) throw py::index_error("agent id out of range");
            const GridPos& p = env.agent_pos(i);
            return py::make_tuple(p.row, p.col);
        }, py::arg("agent_id"))
        .def("goal_pos", [](const CrossoverEnv& env, size_t i) {
            if (i >= env.n_agents()) throw py::index_error("agent id out of range");
            const GridPos& p = env.goal_pos(i);
            return py::make_tuple(p.row, p.col);
        }, py::arg("agent_id"))
        .def("to_string", &CrossoverEnv::to_string)
        .def_property_readonly_static("metadata", [](py::object) {
            py::dict md;
            md["render.modes"] = CrossoverEnv::render_modes();
            return md;
        });

    m.attr("ACTION_MEANING") = action_meanings();

    m.def("version", []() { return "0.1.0"; });
}
