#pragma once
/**
 * ScriptedCrossingPolicy — 手写基线策略 (无学习)
 *
 * 规则 (每个 agent 独立):
 *   - 已 done                  → NOOP
 *   - 已在目标列               → 纵向移向目标行
 *   - 在车道上 (非通行道)      → 纵向移向通行道
 *       向左走的 agent 等待, 直到所有向右走的 agent 都已 done
 *   - 在通行道上               → 横向移向目标列
 *
 * 向右的 agent (0, 1) 先过, 避免通行道内迎面死锁。
 * 用作 demo 工具和端到端测试的参考解。
 */

#include "engine/crossover_env.h"
#include <vector>

namespace crossgrid {

class ScriptedCrossingPolicy {
public:
    explicit ScriptedCrossingPolicy(const CrossoverEnv& env) : env_(env) {}

    /** 当前状态下所有 agent 的动作编码 */
    std::vector<int> act() const;

    Action act_agent(size_t agent_id) const;

private:
    const CrossoverEnv& env_;

    bool heads_right(size_t agent_id) const {
        return env_.goal_pos(agent_id).col > env_.start_pos(agent_id).col;
    }
};

} // namespace crossgrid
