#include "engine/crossover_env.h"
#include "engine/errors.h"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace crossgrid {

namespace {

const CrossoverConfig& validated(const CrossoverConfig& cfg) {
    if (cfg.grid_cols < 4) {
        throw std::invalid_argument("CrossoverConfig: grid_cols must be >= 4, got " +
                                    std::to_string(cfg.grid_cols));
    }
    if (cfg.max_steps == 0) {
        throw std::invalid_argument("CrossoverConfig: max_steps must be > 0");
    }
    if (cfg.cell_size == 0) {
        throw std::invalid_argument("CrossoverConfig: cell_size must be > 0");
    }
    return cfg;
}

} // namespace

CrossoverEnv::CrossoverEnv(const CrossoverConfig& cfg)
    : config_(validated(cfg))
    , grid_(config_.grid_rows(), config_.grid_cols)
    , positions_(config_.n_agents())
    , resolver_(grid_, positions_)
    , obs_builder_(config_.grid_rows(), config_.grid_cols, config_.max_steps,
                   config_.full_observable)
    , dones_(config_.n_agents(), false)
{
    int last_row = static_cast<int>(config_.grid_rows()) - 1;
    int w = static_cast<int>(config_.grid_cols);

    // Lanes run left→right for agents 0/1 and right→left for agents 2/3
    starts_ = {{0, 1}, {last_row, 1}, {0, w - 2}, {last_row, w - 2}};
    goals_  = {{0, w - 1}, {last_row, w - 1}, {0, 0}, {last_row, 0}};

    // Agents are visible (render/to_string) before the first reset
    place_agents_at_start();
}

void CrossoverEnv::place_agents_at_start() {
    grid_.reset_occupancy();
    for (size_t i = 0; i < n_agents(); ++i) {
        resolver_.place(i, starts_[i]);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

Observations CrossoverEnv::reset() {
    place_agents_at_start();
    step_count_ = 0;
    std::fill(dones_.begin(), dones_.end(), false);
    state_ = EnvState::RUNNING;
    return obs_builder_.build(positions_, step_count_);
}

void CrossoverEnv::close() {
    renderer_.reset();
}

void CrossoverEnv::require_initialized(const char* what) const {
    if (state_ == EnvState::UNINITIALIZED) {
        throw NotInitialized(std::string(what) + "() called before reset()");
    }
}

Observations CrossoverEnv::observe() const {
    require_initialized("observe");
    return obs_builder_.build(positions_, step_count_);
}

// =============================================================================
// Step
// =============================================================================

StepResult CrossoverEnv::step(const std::vector<int>& actions) {
    require_initialized("step");
    if (actions.size() != n_agents()) {
        throw ActionCountMismatch("expected " + std::to_string(n_agents()) +
                                  " actions, got " + std::to_string(actions.size()));
    }

    // Decode everything before the first move so a bad code leaves no partial step
    std::vector<Action> decoded;
    decoded.reserve(actions.size());
    for (int code : actions) {
        decoded.push_back(action_from_code(code));
    }
    return step(decoded);
}

StepResult CrossoverEnv::step(const std::vector<Action>& actions) {
    require_initialized("step");
    if (actions.size() != n_agents()) {
        throw ActionCountMismatch("expected " + std::to_string(n_agents()) +
                                  " actions, got " + std::to_string(actions.size()));
    }
    for (Action a : actions) {
        if (static_cast<size_t>(a) >= ACTION_COUNT) {
            throw InvalidAction("action code " + std::to_string(static_cast<int>(a)) +
                                " is not one of 0..4");
        }
    }

    step_count_++;

    StepResult result;
    result.rewards.assign(n_agents(), config_.step_cost);

    // Ascending id: each move sees the grid as left by the previous ones
    for (size_t i = 0; i < n_agents(); ++i) {
        if (dones_[i]) continue;

        resolver_.try_move(i, actions[i]);

        if (positions_[i] == goals_[i]) {
            dones_[i] = true;
            result.rewards[i] = config_.goal_reward;
            if (config_.verbose) {
                printf("[crossover] step %u: agent %zu reached goal (%d,%d)\n",
                       step_count_, i, goals_[i].row, goals_[i].col);
            }
        }
    }

    if (step_count_ >= config_.max_steps) {
        bool was_running = std::find(dones_.begin(), dones_.end(), false) != dones_.end();
        std::fill(dones_.begin(), dones_.end(), true);
        if (config_.verbose && was_running) {
            printf("[crossover] step %u: truncated (max_steps=%u)\n",
                   step_count_, config_.max_steps);
        }
    }

    if (std::find(dones_.begin(), dones_.end(), false) == dones_.end()) {
        state_ = EnvState::TERMINATED;
    }

    result.observations = obs_builder_.build(positions_, step_count_);
    result.dones = dones_;
    return result;
}

// =============================================================================
// Rendering
// =============================================================================

GridRenderer& CrossoverEnv::renderer() {
    if (!renderer_) {
        renderer_ = std::make_unique<GridRenderer>(grid_, goals_, config_.cell_size);
    }
    return *renderer_;
}

RenderFrame CrossoverEnv::render(RenderMode mode) {
    RenderFrame frame;
    switch (mode) {
        case RenderMode::RGB_ARRAY: {
            cv::Mat img = renderer().draw(positions_);
            frame.width  = static_cast<size_t>(img.cols);
            frame.height = static_cast<size_t>(img.rows);
            frame.pixels = GridRenderer::to_rgb_bytes(img);
            break;
        }
        case RenderMode::ANSI:
            frame.text = to_string();
            break;
        case RenderMode::HUMAN:
            frame.text = to_string();
            frame.is_open = std::printf("%s", frame.text.c_str()) >= 0;
            break;
    }
    return frame;
}

std::vector<std::string> CrossoverEnv::render_modes() {
    return {"human", "rgb_array", "ansi"};
}

std::string CrossoverEnv::to_string() const {
    std::ostringstream ss;
    ss << grid_.to_string();
    ss << "step " << step_count_ << "/" << config_.max_steps << " done=[";
    for (size_t i = 0; i < dones_.size(); ++i) {
        ss << (dones_[i] ? '1' : '0');
    }
    ss << "]\n";
    return ss.str();
}

} // namespace crossgrid
