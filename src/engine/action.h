#pragma once
/**
 * Action — 每个 agent 的 5 路离散动作
 *
 * 编码固定 (训练脚本依赖):
 *   0=DOWN (+1,0)  1=LEFT (0,-1)  2=UP (-1,0)  3=RIGHT (0,+1)  4=NOOP
 *
 * NOOP 不是 (0,0) 位移: 直接跳过, 不做空位检查。
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace crossgrid {

enum class Action : uint8_t {
    DOWN  = 0,
    LEFT  = 1,
    UP    = 2,
    RIGHT = 3,
    NOOP  = 4
};

constexpr size_t ACTION_COUNT = 5;

/** 网格坐标 (row, col), row 向下增长 */
struct GridPos {
    int row = 0;
    int col = 0;

    bool operator==(const GridPos& o) const { return row == o.row && col == o.col; }
    bool operator!=(const GridPos& o) const { return !(*this == o); }
};

struct ActionOffset {
    int drow;
    int dcol;
};

/** Offset table indexed by action code. NOOP's entry is never applied. */
constexpr ActionOffset ACTION_OFFSETS[ACTION_COUNT] = {
    {+1,  0},   // DOWN
    { 0, -1},   // LEFT
    {-1,  0},   // UP
    { 0, +1},   // RIGHT
    { 0,  0},   // NOOP
};

/** 编码 → Action, 超出 0..4 抛 InvalidAction */
Action action_from_code(int code);

const char* action_meaning(Action action);

/** 全部动作含义, 按编码顺序 */
std::vector<std::string> action_meanings();

/** pos + offset(action); NOOP returns pos unchanged */
GridPos apply_action(const GridPos& pos, Action action);

} // namespace crossgrid
