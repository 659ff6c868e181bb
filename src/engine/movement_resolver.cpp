#include "engine/movement_resolver.h"

namespace crossgrid {

bool MovementResolver::try_move(size_t agent_id, Action action) {
    if (action == Action::NOOP) return false;

    GridPos curr = positions_[agent_id];
    GridPos next = apply_action(curr, action);

    // Blocked by wall, bounds or another agent: stay in place
    if (!grid_.is_cell_vacant(next)) return false;

    grid_.clear_cell(curr);
    positions_[agent_id] = next;
    grid_.set_cell(next, agent_cell_code(agent_id));
    return true;
}

void MovementResolver::place(size_t agent_id, const GridPos& pos) {
    positions_[agent_id] = pos;
    grid_.set_cell(pos, agent_cell_code(agent_id));
}

} // namespace crossgrid
