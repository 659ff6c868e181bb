/**
 * test_crossover_env.cpp — CrossoverEnv 状态机测试
 *
 * 验证:
 *  1. reset: 初始位置/步数/done/状态
 *  2. step 之前 reset → NotInitialized
 *  3. 动作数量不符 → ActionCountMismatch, 不修改状态
 *  4. 非法动作编码 → InvalidAction, 任何 agent 都不移动
 *  5. agent 0 走到目标: 第 8 步奖励 5, done
 *  6. 撞墙不报错, 奖励 = step_cost
 *  7. 同一步争抢同一格: 小 id 先得
 *  8. 100 步截断: 全部 done
 *  9. done 单调 + 目标奖励只给一次 + done 后不再移动
 * 10. 任意动作序列下无重叠占用
 * 11. step_cost 可配置
 * 12. 脚本策略: 所有 agent 都到达目标
 * 13. 多实例互不影响
 * 14. 配置校验
 */

#include "engine/crossover_env.h"
#include "engine/errors.h"
#include "engine/scripted_policy.h"
#include "test_utils.h"

#include <set>
#include <utility>
#include <vector>

using namespace crossgrid;

static const int D = 0, L = 1, U = 2, R = 3, N = 4;

/** 每个 agent 恰好占一格, 且实时网格中的编码与位置一致 */
static bool occupancy_consistent(const CrossoverEnv& env) {
    std::set<std::pair<int, int>> cells;
    for (size_t i = 0; i < env.n_agents(); ++i) {
        const GridPos& p = env.agent_pos(i);
        if (!cells.insert({p.row, p.col}).second) return false;
        if (env.grid().cell(p) != agent_cell_code(i)) return false;
        if (env.grid().wall_exists(p)) return false;
    }
    size_t occupied = 0;
    for (CellCode c : env.grid().live_grid()) {
        if (c > 0) occupied++;
    }
    return occupied == env.n_agents();
}

// =========================================================================
// Test 1: reset
// =========================================================================
static void test_reset() {
    printf("\n--- Test 1: reset ---\n");

    CrossoverEnv env;
    TEST_ASSERT(env.state() == EnvState::UNINITIALIZED, "fresh env uninitialized");

    auto obs = env.reset();
    TEST_ASSERT(env.state() == EnvState::RUNNING, "RUNNING after reset");
    TEST_ASSERT(env.step_count() == 0, "step 0");
    TEST_ASSERT(obs.size() == 4, "4 observations");

    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 at (0,1)");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{2, 1}), "agent 1 at (2,1)");
    TEST_ASSERT(env.agent_pos(2) == (GridPos{0, 6}), "agent 2 at (0,W-2)");
    TEST_ASSERT(env.agent_pos(3) == (GridPos{2, 6}), "agent 3 at (2,W-2)");

    TEST_ASSERT(env.goal_pos(0) == (GridPos{0, 7}), "goal 0 at (0,W-1)");
    TEST_ASSERT(env.goal_pos(1) == (GridPos{2, 7}), "goal 1 at (2,W-1)");
    TEST_ASSERT(env.goal_pos(2) == (GridPos{0, 0}), "goal 2 at (0,0)");
    TEST_ASSERT(env.goal_pos(3) == (GridPos{2, 0}), "goal 3 at (2,0)");

    for (bool d : env.agent_dones()) TEST_ASSERT(!d, "no agent done after reset");
    TEST_ASSERT(occupancy_consistent(env), "occupancy consistent after reset");

    // Play, then reset again: everything restored
    env.step({D, U, D, U});
    env.step({R, N, L, N});
    TEST_ASSERT(env.step_count() == 2, "2 steps taken");
    env.reset();
    TEST_ASSERT(env.step_count() == 0, "step 0 after second reset");
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 restored");
    TEST_ASSERT(env.agent_pos(2) == (GridPos{0, 6}), "agent 2 restored");
    TEST_ASSERT(occupancy_consistent(env), "occupancy consistent after second reset");

    TEST_PASS();
}

// =========================================================================
// Test 2: step before reset
// =========================================================================
static void test_step_before_reset() {
    printf("\n--- Test 2: step before reset ---\n");

    CrossoverEnv env;
    TEST_THROWS(env.step({N, N, N, N}), NotInitialized, "step before reset throws");
    TEST_THROWS(env.observe(), NotInitialized, "observe before reset throws");
    TEST_ASSERT(env.step_count() == 0, "counter untouched");
    TEST_ASSERT(env.state() == EnvState::UNINITIALIZED, "still uninitialized");

    env.reset();
    auto r = env.step({N, N, N, N});
    TEST_ASSERT(env.step_count() == 1, "step works after reset");
    TEST_ASSERT(r.info.empty(), "info empty");

    TEST_PASS();
}

// =========================================================================
// Test 3: action count mismatch
// =========================================================================
static void test_action_count_mismatch() {
    printf("\n--- Test 3: Action count mismatch ---\n");

    CrossoverEnv env;
    env.reset();

    TEST_THROWS(env.step({D, U}), ActionCountMismatch, "2 actions rejected");
    TEST_THROWS(env.step({D, U, N, N, N}), ActionCountMismatch, "5 actions rejected");
    TEST_THROWS(env.step(std::vector<int>{}), ActionCountMismatch, "empty rejected");
    TEST_THROWS(env.step(std::vector<Action>{Action::DOWN}), ActionCountMismatch,
                "decoded overload checks length too");

    TEST_ASSERT(env.step_count() == 0, "no step counted");
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 not moved");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{2, 1}), "agent 1 not moved");

    TEST_PASS();
}

// =========================================================================
// Test 4: invalid action code
// =========================================================================
static void test_invalid_action() {
    printf("\n--- Test 4: Invalid action code ---\n");

    CrossoverEnv env;
    env.reset();

    // Agent 0 has a legal move, agent 3's code is bad: nothing happens
    TEST_THROWS(env.step({D, N, N, 7}), InvalidAction, "code 7 rejected");
    TEST_THROWS(env.step({-1, N, N, N}), InvalidAction, "code -1 rejected");
    TEST_ASSERT(env.step_count() == 0, "no step counted");
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 not moved");
    TEST_ASSERT(occupancy_consistent(env), "occupancy untouched");

    auto r = env.step({D, N, N, N});
    TEST_ASSERT(env.agent_pos(0) == (GridPos{1, 1}), "valid step still works");
    TEST_ASSERT(r.rewards.size() == 4, "4 rewards");

    TEST_PASS();
}

// =========================================================================
// Test 5: agent 0 reaches its goal
// =========================================================================
static void test_agent_reaches_goal() {
    printf("\n--- Test 5: Agent 0 reaches goal ---\n");

    CrossoverEnv env;
    env.reset();

    // (0,1) → (1,1) → (1,2)..(1,7) → (0,7)
    std::vector<int> route = {D, R, R, R, R, R, R, U};
    std::vector<GridPos> expected = {
        {1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}, {1, 6}, {1, 7}, {0, 7}
    };

    for (size_t t = 0; t < route.size(); ++t) {
        auto r = env.step({route[t], N, N, N});
        TEST_ASSERT(env.agent_pos(0) == expected[t], "agent 0 follows the route");
        if (t + 1 < route.size()) {
            TEST_NEAR(r.rewards[0], 0.0f, "reward = step cost before goal");
            TEST_ASSERT(!r.dones[0], "not done before goal");
        } else {
            TEST_NEAR(r.rewards[0], 5.0f, "reward 5 on arrival");
            TEST_ASSERT(r.dones[0], "done on arrival");
        }
        for (size_t i = 1; i < 4; ++i) {
            TEST_NEAR(r.rewards[i], 0.0f, "other agents get step cost");
            TEST_ASSERT(!r.dones[i], "other agents not done");
        }
    }
    TEST_ASSERT(env.step_count() == 8, "8 steps");
    TEST_ASSERT(env.state() == EnvState::RUNNING, "still running (others not done)");

    TEST_PASS();
}

// =========================================================================
// Test 6: walking into a wall
// =========================================================================
static void test_wall_is_not_an_error() {
    printf("\n--- Test 6: Wall is not an error ---\n");

    CrossoverConfig cfg;
    cfg.step_cost = -0.25f;
    CrossoverEnv env(cfg);
    env.reset();

    // (0,2), (2,2), (0,5), (2,5) are lane walls
    auto r = env.step({R, R, L, L});
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 stays");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{2, 1}), "agent 1 stays");
    TEST_ASSERT(env.agent_pos(2) == (GridPos{0, 6}), "agent 2 stays");
    TEST_ASSERT(env.agent_pos(3) == (GridPos{2, 6}), "agent 3 stays");
    for (size_t i = 0; i < 4; ++i) {
        TEST_NEAR(r.rewards[i], -0.25f, "blocked agent gets step cost");
        TEST_ASSERT(!r.dones[i], "blocked agent not done");
    }

    // Off the grid: agent 0 UP from row 0
    r = env.step({U, D, N, N});
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "off-grid move ignored");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{2, 1}), "DOWN off row 2 ignored");
    TEST_NEAR(r.rewards[0], -0.25f, "step cost after off-grid attempt");

    TEST_PASS();
}

// =========================================================================
// Test 7: contention for one cell
// =========================================================================
static void test_lower_id_wins() {
    printf("\n--- Test 7: Lower id wins contention ---\n");

    CrossoverEnv env;
    env.reset();

    // Agents 0 (0,1) and 1 (2,1) both want (1,1)
    env.step({D, U, N, N});
    TEST_ASSERT(env.agent_pos(0) == (GridPos{1, 1}), "agent 0 took (1,1)");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{2, 1}), "agent 1 rejected, stays");
    TEST_ASSERT(occupancy_consistent(env), "no overlap");

    // Agent 0 vacates (1,1) and agent 1 enters it in the same step
    env.step({R, U, N, N});
    TEST_ASSERT(env.agent_pos(0) == (GridPos{1, 2}), "agent 0 moved on");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{1, 1}), "agent 1 entered vacated cell");

    // Reverse roles: agent 2 (0,6) and agent 3 (2,6) both want (1,6)
    env.reset();
    env.step({N, N, D, U});
    TEST_ASSERT(env.agent_pos(2) == (GridPos{1, 6}), "agent 2 took (1,6)");
    TEST_ASSERT(env.agent_pos(3) == (GridPos{2, 6}), "agent 3 rejected");

    // Higher id vacating does not help a lower id in the same step
    env.reset();
    env.step({N, U, N, N});                       // agent 1 → (1,1)
    env.step({D, R, N, N});                       // agent 0 tries (1,1) before agent 1 leaves
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "agent 0 blocked by not-yet-moved agent 1");
    TEST_ASSERT(env.agent_pos(1) == (GridPos{1, 2}), "agent 1 moved afterwards");
    TEST_ASSERT(occupancy_consistent(env), "no overlap");

    TEST_PASS();
}

// =========================================================================
// Test 8: truncation
// =========================================================================
static void test_truncation() {
    printf("\n--- Test 8: Truncation at 100 steps ---\n");

    CrossoverEnv env;
    env.reset();

    for (int t = 1; t < 100; ++t) {
        auto r = env.step({N, N, N, N});
        for (bool d : r.dones) TEST_ASSERT(!d, "not done before step 100");
    }
    TEST_ASSERT(env.state() == EnvState::RUNNING, "running at step 99");

    auto r = env.step({N, N, N, N});
    TEST_ASSERT(env.step_count() == 100, "step 100");
    for (bool d : r.dones) TEST_ASSERT(d, "all done at step 100");
    for (float rew : r.rewards) TEST_NEAR(rew, 0.0f, "truncation gives no bonus");
    TEST_ASSERT(env.state() == EnvState::TERMINATED, "TERMINATED");

    // Agents are stuck where they were, even after more steps
    auto r2 = env.step({D, U, D, U});
    for (bool d : r2.dones) TEST_ASSERT(d, "still done after truncation");
    TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 1}), "done agent does not move");
    for (float rew : r2.rewards) TEST_NEAR(rew, 0.0f, "step cost after truncation");

    // Truncation with a custom budget
    CrossoverConfig cfg;
    cfg.max_steps = 3;
    CrossoverEnv short_env(cfg);
    short_env.reset();
    short_env.step({N, N, N, N});
    short_env.step({N, N, N, N});
    auto r3 = short_env.step({N, N, N, N});
    for (bool d : r3.dones) TEST_ASSERT(d, "max_steps=3 truncates at step 3");

    TEST_PASS();
}

// =========================================================================
// Test 9: done monotonic, bonus once
// =========================================================================
static void test_done_monotonic() {
    printf("\n--- Test 9: Done monotonic, bonus once ---\n");

    CrossoverEnv env;
    env.reset();
    for (int a : {D, R, R, R, R, R, R, U}) env.step({a, N, N, N});
    TEST_ASSERT(env.agent_dones()[0], "agent 0 done");

    // Agent 0 keeps receiving actions; it must not move or score again
    for (int t = 0; t < 10; ++t) {
        int a = (t % 2 == 0) ? D : L;
        auto r = env.step({a, N, N, N});
        TEST_ASSERT(r.dones[0], "done stays true");
        TEST_NEAR(r.rewards[0], 0.0f, "no second bonus");
        TEST_ASSERT(env.agent_pos(0) == (GridPos{0, 7}), "done agent frozen at goal");
    }

    TEST_PASS();
}

// =========================================================================
// Test 10: no overlap under arbitrary actions
// =========================================================================
static void test_no_overlap_fuzz() {
    printf("\n--- Test 10: No overlap under action sweep ---\n");

    // Deterministic sweep through action combinations
    CrossoverEnv env;
    for (int episode = 0; episode < 5; ++episode) {
        env.reset();
        std::vector<bool> prev_dones(4, false);
        uint32_t x = 12345u + static_cast<uint32_t>(episode);
        for (int t = 0; t < 100; ++t) {
            std::vector<int> actions(4);
            for (auto& a : actions) {
                x = x * 1664525u + 1013904223u;   // LCG
                a = static_cast<int>((x >> 16) % 5);
            }
            auto r = env.step(actions);
            TEST_ASSERT(occupancy_consistent(env), "occupancy unique after every step");
            for (size_t i = 0; i < 4; ++i) {
                TEST_ASSERT(!prev_dones[i] || r.dones[i], "done never reverts");
                bool newly_done = r.dones[i] && !prev_dones[i] &&
                                  env.agent_pos(i) == env.goal_pos(i);
                if (r.rewards[i] != 0.0f) {
                    TEST_ASSERT(newly_done, "bonus only on first arrival");
                }
            }
            prev_dones = r.dones;
        }
        for (bool d : prev_dones) TEST_ASSERT(d, "all done at end of episode");
    }

    TEST_PASS();
}

// =========================================================================
// Test 11: configurable step cost
// =========================================================================
static void test_step_cost() {
    printf("\n--- Test 11: Configurable step cost ---\n");

    CrossoverConfig cfg;
    cfg.step_cost = -0.1f;
    CrossoverEnv env(cfg);
    env.reset();

    float total0 = 0.0f;
    for (int a : {D, R, R, R, R, R, R, U}) {
        auto r = env.step({a, N, N, N});
        total0 += r.rewards[0];
        TEST_NEAR(r.rewards[3], -0.1f, "idle agent pays step cost");
    }
    TEST_ASSERT(std::fabs(total0 - 4.3f) < 1e-4f, "7 costs + 1 bonus");

    auto r = env.step({N, N, N, N});
    TEST_NEAR(r.rewards[0], -0.1f, "done agent reward = step cost");

    TEST_PASS();
}

// =========================================================================
// Test 12: scripted policy solves the task
// =========================================================================
static void test_scripted_policy() {
    printf("\n--- Test 12: Scripted policy solves the crossing ---\n");

    for (size_t cols : {size_t(8), size_t(5), size_t(12)}) {
        CrossoverConfig cfg;
        cfg.grid_cols = cols;
        CrossoverEnv env(cfg);
        ScriptedCrossingPolicy policy(env);
        env.reset();

        std::vector<float> returns(4, 0.0f);
        while (env.state() == EnvState::RUNNING) {
            auto r = env.step(policy.act());
            TEST_ASSERT(occupancy_consistent(env), "no overlap under policy");
            for (size_t i = 0; i < 4; ++i) returns[i] += r.rewards[i];
        }

        printf("  cols=%zu solved in %u steps\n", cols, env.step_count());
        TEST_ASSERT(env.step_count() < 100, "solved before truncation");
        for (size_t i = 0; i < 4; ++i) {
            TEST_ASSERT(env.agent_pos(i) == env.goal_pos(i), "agent at goal");
            TEST_NEAR(returns[i], 5.0f, "exactly one bonus per agent");
        }
    }

    // Default corridor: right-movers finish at steps 8 and 9
    CrossoverEnv env;
    ScriptedCrossingPolicy policy(env);
    env.reset();
    for (int t = 1; t <= 9; ++t) {
        auto r = env.step(policy.act());
        if (t == 8) TEST_NEAR(r.rewards[0], 5.0f, "agent 0 arrives at step 8");
        if (t == 9) TEST_NEAR(r.rewards[1], 5.0f, "agent 1 arrives at step 9");
    }

    TEST_PASS();
}

// =========================================================================
// Test 13: independent instances
// =========================================================================
static void test_independent_instances() {
    printf("\n--- Test 13: Independent instances ---\n");

    CrossoverEnv a, b;
    a.reset();
    b.reset();
    a.step({D, N, N, N});
    a.step({R, N, N, N});

    TEST_ASSERT(a.agent_pos(0) == (GridPos{1, 2}), "a moved");
    TEST_ASSERT(b.agent_pos(0) == (GridPos{0, 1}), "b untouched");
    TEST_ASSERT(a.step_count() == 2 && b.step_count() == 0, "separate counters");

    // Through the abstract interface
    MultiAgentEnv& iface = b;
    TEST_ASSERT(iface.n_agents() == 4, "4 agents");
    TEST_ASSERT(iface.n_actions() == 5, "5 actions");
    TEST_ASSERT(iface.obs_size() == 3, "3-dim obs");
    iface.step({D, N, N, N});
    TEST_ASSERT(b.agent_pos(0) == (GridPos{1, 1}), "interface step drives b");

    TEST_PASS();
}

// =========================================================================
// Test 14: config validation
// =========================================================================
static void test_config_validation() {
    printf("\n--- Test 14: Config validation ---\n");

    CrossoverConfig narrow;
    narrow.grid_cols = 3;
    TEST_THROWS(CrossoverEnv{narrow}, std::invalid_argument, "grid_cols < 4 rejected");

    CrossoverConfig no_steps;
    no_steps.max_steps = 0;
    TEST_THROWS(CrossoverEnv{no_steps}, std::invalid_argument, "max_steps = 0 rejected");

    CrossoverConfig min_cols;
    min_cols.grid_cols = 4;
    CrossoverEnv env(min_cols);
    env.reset();
    TEST_ASSERT(env.agent_pos(2) == (GridPos{0, 2}), "W=4: agent 2 at (0,2)");
    TEST_ASSERT(env.goal_pos(0) == (GridPos{0, 3}), "W=4: goal 0 at (0,3)");
    TEST_ASSERT(occupancy_consistent(env), "W=4 layout consistent");

    TEST_PASS();
}

int main() {
    init_test_console();
    printf("=== CrossoverEnv Tests ===\n");

    test_reset();
    test_step_before_reset();
    test_action_count_mismatch();
    test_invalid_action();
    test_agent_reaches_goal();
    test_wall_is_not_an_error();
    test_lower_id_wins();
    test_truncation();
    test_done_monotonic();
    test_no_overlap_fuzz();
    test_step_cost();
    test_scripted_policy();
    test_independent_instances();
    test_config_validation();

    return report_results("CrossoverEnv");
}
