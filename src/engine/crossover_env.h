#pragma once
/**
 * CrossoverEnv — 4 agent 走廊交叉环境 (协作)
 *
 * 每个 agent 从走廊一端出发, 到达另一端的目标格:
 *   agent 0: (0,1)   → (0,W-1)      agent 2: (0,W-2) → (0,0)
 *   agent 1: (2,1)   → (2,W-1)      agent 3: (2,W-2) → (2,0)
 * 所有人必须经过中间通行道 (row 1), 互相让路。
 *
 * 状态机:
 *   UNINITIALIZED --reset()--> RUNNING --所有 agent done--> TERMINATED
 *   reset() 在任何状态都可调用; step() 在 reset() 之前抛 NotInitialized
 *
 * 每一步:
 *   1. 校验动作 (长度/编码), 失败时不修改任何状态
 *   2. 步数 +1, 奖励初始化为 step_cost
 *   3. 按 agent id 升序: 已 done 跳过; 否则移动, 检查是否到达目标
 *      首次到达 → done=true, 奖励 = goal_reward
 *   4. 步数 >= max_steps → 全部 done (截断)
 *
 * 使用方式:
 *   CrossoverEnv env(cfg);
 *   auto obs = env.reset();
 *   auto r = env.step({3, 4, 1, 4});
 */

#include "engine/multi_agent_env.h"
#include "engine/crossover_config.h"
#include "engine/grid_model.h"
#include "engine/movement_resolver.h"
#include "engine/observation_builder.h"
#include "render/grid_renderer.h"
#include <memory>
#include <vector>
#include <string>

namespace crossgrid {

enum class EnvState : uint8_t {
    UNINITIALIZED = 0,
    RUNNING       = 1,
    TERMINATED    = 2   // 所有 agent done (到达目标或截断)
};

class CrossoverEnv : public MultiAgentEnv {
public:
    explicit CrossoverEnv(const CrossoverConfig& cfg = {});

    // Resolver holds references into this object
    CrossoverEnv(const CrossoverEnv&) = delete;
    CrossoverEnv& operator=(const CrossoverEnv&) = delete;

    // --- MultiAgentEnv interface ---
    Observations reset() override;
    StepResult step(const std::vector<int>& actions) override;
    RenderFrame render(RenderMode mode) override;
    void close() override;

    size_t n_agents() const override { return config_.n_agents(); }
    size_t n_actions() const override { return ACTION_COUNT; }
    size_t obs_size() const override { return obs_builder_.obs_size(n_agents()); }

    /** 已解码动作 (跳过编码检查) */
    StepResult step(const std::vector<Action>& actions);

    /** 当前观测 (reset 之前抛 NotInitialized) */
    Observations observe() const;

    // --- 访问器 ---
    const GridPos& agent_pos(size_t agent_id) const { return positions_[agent_id]; }
    const GridPos& start_pos(size_t agent_id) const { return starts_[agent_id]; }
    const GridPos& goal_pos(size_t agent_id) const { return goals_[agent_id]; }
    const std::vector<GridPos>& agent_positions() const { return positions_; }
    const std::vector<bool>& agent_dones() const { return dones_; }
    uint32_t step_count() const { return step_count_; }
    EnvState state() const { return state_; }
    const GridModel& grid() const { return grid_; }
    const CrossoverConfig& config() const { return config_; }

    std::vector<std::string> get_action_meanings() const { return action_meanings(); }

    /** 支持的 render 模式名 */
    static std::vector<std::string> render_modes();

    /** 获取文本表示 (调试) */
    std::string to_string() const;

private:
    void require_initialized(const char* what) const;
    void place_agents_at_start();
    GridRenderer& renderer();

    CrossoverConfig config_;
    GridModel grid_;
    std::vector<GridPos> starts_;
    std::vector<GridPos> goals_;
    std::vector<GridPos> positions_;
    MovementResolver resolver_;
    ObservationBuilder obs_builder_;

    std::vector<bool> dones_;
    uint32_t step_count_ = 0;
    EnvState state_ = EnvState::UNINITIALIZED;

    std::unique_ptr<GridRenderer> renderer_;   // RGB_ARRAY 底图缓存, close() 释放
};

} // namespace crossgrid
