#include "engine/observation_builder.h"

namespace crossgrid {

Observation ObservationBuilder::agent_obs(const GridPos& pos, uint32_t step_count) const {
    return {
        static_cast<float>(pos.row + 1) / static_cast<float>(rows_),
        static_cast<float>(pos.col + 1) / static_cast<float>(cols_),
        static_cast<float>(step_count) / static_cast<float>(max_steps_)
    };
}

Observations ObservationBuilder::build(const std::vector<GridPos>& positions,
                                       uint32_t step_count) const {
    Observations obs;
    obs.reserve(positions.size());
    for (const auto& pos : positions) {
        obs.push_back(agent_obs(pos, step_count));
    }

    if (!full_observable_) return obs;

    Observation joint;
    joint.reserve(kAgentObsSize * positions.size());
    for (const auto& o : obs) {
        joint.insert(joint.end(), o.begin(), o.end());
    }
    return Observations(positions.size(), joint);
}

} // namespace crossgrid
