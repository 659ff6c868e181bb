#pragma once
/**
 * CrossoverConfig — CrossOver 环境配置
 *
 * 走廊网格 (3 行 × grid_cols 列):
 *
 *   row 0:  . . # # # # . .     上车道 (agent 0 → 右, agent 2 → 左)
 *   row 1:  . . . . . . . .     中间通行道 (唯一的交叉路径)
 *   row 2:  . . # # # # . .     下车道 (agent 1 → 右, agent 3 → 左)
 *
 * 四个 agent 必须相向穿越中间通行道, 不能占同一格。
 *
 * 固定约定 (与训练脚本的隐式契约):
 *   - 3 行 (两条车道 + 一条通行道), 默认 8 列
 *   - 4 个 agent, 每个 5 个离散动作 (DOWN/LEFT/UP/RIGHT/NOOP)
 *   - 最多 100 步, 到达目标奖励 +5
 */

#include <cstddef>
#include <cstdint>

namespace crossgrid {

struct CrossoverConfig {
    static constexpr size_t kGridRows = 3;   // 两条车道 + 中间通行道
    static constexpr size_t kNumAgents = 4;

    size_t   grid_cols       = 8;      // 走廊长度 (>= 4)
    uint32_t max_steps       = 100;    // 截断步数
    float    goal_reward     = 5.0f;   // 首次到达目标的奖励
    float    step_cost       = 0.0f;   // 其它每一步的奖励 (通常 <= 0)
    bool     full_observable = false;  // true: 每个 agent 观测所有 agent 的拼接向量

    // Rendering
    size_t   cell_size       = 40;     // 像素/格

    // Logging
    bool     verbose         = false;  // 打印到达目标/截断事件

    size_t grid_rows() const { return kGridRows; }
    size_t n_agents()  const { return kNumAgents; }
};

} // namespace crossgrid
