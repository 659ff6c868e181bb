#include "engine/grid_model.h"
#include <sstream>

namespace crossgrid {

GridModel::GridModel(size_t rows, size_t cols)
    : rows_(rows)
    , cols_(cols)
    , base_(create_base_grid(rows, cols))
    , live_(base_)
{}

std::vector<CellCode> GridModel::create_base_grid(size_t rows, size_t cols) {
    // All walls, then carve the crossing row and the two end zones
    std::vector<CellCode> grid(rows * cols, CELL_WALL);
    size_t road = rows / 2;
    for (size_t c = 0; c < cols; ++c) {
        grid[road * cols + c] = CELL_FREE;
    }
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            if (c < 2 || c + 2 >= cols) {
                grid[r * cols + c] = CELL_FREE;
            }
        }
    }
    return grid;
}

bool GridModel::wall_exists(const GridPos& pos) const {
    if (!in_bounds(pos)) return true;
    return base_[idx(pos)] == CELL_WALL;
}

bool GridModel::is_cell_vacant(const GridPos& pos) const {
    return in_bounds(pos) && live_[idx(pos)] == CELL_FREE;
}

void GridModel::set_cell(const GridPos& pos, CellCode value) {
    live_[idx(pos)] = value;
}

void GridModel::clear_cell(const GridPos& pos) {
    live_[idx(pos)] = CELL_FREE;
}

void GridModel::reset_occupancy() {
    live_ = base_;
}

CellCode GridModel::cell(const GridPos& pos) const {
    if (!in_bounds(pos)) return CELL_WALL;
    return live_[idx(pos)];
}

std::string GridModel::to_string() const {
    std::ostringstream ss;
    for (int r = 0; r < (int)rows_; ++r) {
        for (int c = 0; c < (int)cols_; ++c) {
            CellCode v = live_[idx(GridPos{r, c})];
            if (v == CELL_WALL) {
                ss << '#';
            } else if (v == CELL_FREE) {
                ss << '.';
            } else {
                ss << static_cast<char>('0' + (v - 1));
            }
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace crossgrid
