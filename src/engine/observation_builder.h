#pragma once
/**
 * ObservationBuilder — 内部状态 → 每个 agent 的观测向量
 *
 * 单 agent 观测 (3 维):
 *   [ (row+1)/rows, (col+1)/cols, step/max_steps ]
 *   坐标 1-indexed, 避免靠墙格子恰好为 0
 *
 * full_observable: 所有 agent 的 3 维向量按 id 顺序拼接,
 *   每个 agent 得到同一份拷贝 (长度 3 * n_agents)
 */

#include "engine/action.h"
#include <vector>
#include <cstdint>

namespace crossgrid {

using Observation  = std::vector<float>;
using Observations = std::vector<Observation>;

class ObservationBuilder {
public:
    static constexpr size_t kAgentObsSize = 3;

    ObservationBuilder(size_t rows, size_t cols, uint32_t max_steps, bool full_observable)
        : rows_(rows), cols_(cols), max_steps_(max_steps), full_observable_(full_observable) {}

    Observations build(const std::vector<GridPos>& positions, uint32_t step_count) const;

    /** 单个 agent 自身的 3 维向量 */
    Observation agent_obs(const GridPos& pos, uint32_t step_count) const;

    /** 每个 agent 收到的观测长度 */
    size_t obs_size(size_t n_agents) const {
        return full_observable_ ? kAgentObsSize * n_agents : kAgentObsSize;
    }

    bool full_observable() const { return full_observable_; }

private:
    size_t rows_, cols_;
    uint32_t max_steps_;
    bool full_observable_;
};

} // namespace crossgrid
