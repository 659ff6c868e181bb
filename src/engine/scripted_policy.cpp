#include "engine/scripted_policy.h"

namespace crossgrid {

Action ScriptedCrossingPolicy::act_agent(size_t agent_id) const {
    if (env_.agent_dones()[agent_id]) return Action::NOOP;

    const GridPos& pos  = env_.agent_pos(agent_id);
    const GridPos& goal = env_.goal_pos(agent_id);
    int road = static_cast<int>(env_.grid().rows() / 2);

    if (pos.col == goal.col) {
        if (pos.row < goal.row) return Action::DOWN;
        if (pos.row > goal.row) return Action::UP;
        return Action::NOOP;
    }

    if (pos.row != road) {
        if (!heads_right(agent_id)) {
            for (size_t j = 0; j < env_.n_agents(); ++j) {
                if (heads_right(j) && !env_.agent_dones()[j]) return Action::NOOP;
            }
        }
        return pos.row < road ? Action::DOWN : Action::UP;
    }

    return pos.col < goal.col ? Action::RIGHT : Action::LEFT;
}

std::vector<int> ScriptedCrossingPolicy::act() const {
    std::vector<int> actions(env_.n_agents());
    for (size_t i = 0; i < env_.n_agents(); ++i) {
        actions[i] = static_cast<int>(act_agent(i));
    }
    return actions;
}

} // namespace crossgrid
