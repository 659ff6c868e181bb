#pragma once
/**
 * GridModel — 占用网格 + 墙壁几何
 *
 * 两张网格:
 *   - base_  : 无 agent 的底图 (墙壁掩码), 构造时计算一次, 之后不变
 *   - live_  : 实时占用网格 = 底图 + 当前 agent 编码
 *
 * 格子编码:
 *   WALL = -1, FREE = 0, agent i 占用时为 i+1
 *
 * set_cell()/clear_cell() 不做任何检查, 调用方 (MovementResolver)
 * 必须先用 is_cell_vacant() 判定合法性。
 */

#include "engine/action.h"
#include <vector>
#include <cstdint>
#include <string>

namespace crossgrid {

using CellCode = int8_t;

constexpr CellCode CELL_WALL = -1;
constexpr CellCode CELL_FREE = 0;

inline CellCode agent_cell_code(size_t agent_id) {
    return static_cast<CellCode>(agent_id + 1);
}

class GridModel {
public:
    GridModel(size_t rows, size_t cols);

    /** 底图: 中间行 + 两侧各两列为 FREE, 其余为 WALL (row-major) */
    static std::vector<CellCode> create_base_grid(size_t rows, size_t cols);

    /** 底图墙壁判定, 不反映 agent 占用; 越界视为墙 */
    bool wall_exists(const GridPos& pos) const;

    /** 在界内且实时网格为 FREE (非墙且无 agent) */
    bool is_cell_vacant(const GridPos& pos) const;

    void set_cell(const GridPos& pos, CellCode value);
    void clear_cell(const GridPos& pos);

    /** live_ ← base_ (移除所有 agent) */
    void reset_occupancy();

    CellCode cell(const GridPos& pos) const;
    bool in_bounds(const GridPos& pos) const {
        return pos.row >= 0 && pos.row < (int)rows_ && pos.col >= 0 && pos.col < (int)cols_;
    }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    const std::vector<CellCode>& base_grid() const { return base_; }
    const std::vector<CellCode>& live_grid() const { return live_; }

    /** 文本表示: '#' 墙, '.' 空, '0'..'9' agent id */
    std::string to_string() const;

private:
    size_t rows_, cols_;
    std::vector<CellCode> base_;
    std::vector<CellCode> live_;

    size_t idx(const GridPos& pos) const {
        return static_cast<size_t>(pos.row) * cols_ + static_cast<size_t>(pos.col);
    }
};

} // namespace crossgrid
