#pragma once
/**
 * MovementResolver — 单个 agent 的动作 → 位置更新
 *
 * 规则:
 *   - NOOP: 直接跳过
 *   - 目标格空闲 (界内/非墙/无 agent): 清旧格, 更新位置, 写新格
 *   - 否则: 静默留在原地 (不是错误)
 *
 * 空位判定基于实时网格 (而非步前快照): 同一步内先处理的 agent
 * 腾出/占据的格子会影响后处理的 agent。调用方按 agent id 升序调用。
 */

#include "engine/grid_model.h"
#include <vector>

namespace crossgrid {

class MovementResolver {
public:
    MovementResolver(GridModel& grid, std::vector<GridPos>& positions)
        : grid_(grid), positions_(positions) {}

    /** @return true 如果 agent 移动了 */
    bool try_move(size_t agent_id, Action action);

    /** 初始放置 (reset 用), 不做空位检查 */
    void place(size_t agent_id, const GridPos& pos);

private:
    GridModel& grid_;
    std::vector<GridPos>& positions_;
};

} // namespace crossgrid
