#include "engine/action.h"
#include "engine/errors.h"

namespace crossgrid {

Action action_from_code(int code) {
    if (code < 0 || code >= static_cast<int>(ACTION_COUNT)) {
        throw InvalidAction("action code " + std::to_string(code) +
                            " is not one of 0..4 (DOWN, LEFT, UP, RIGHT, NOOP)");
    }
    return static_cast<Action>(code);
}

const char* action_meaning(Action action) {
    switch (action) {
        case Action::DOWN:  return "DOWN";
        case Action::LEFT:  return "LEFT";
        case Action::UP:    return "UP";
        case Action::RIGHT: return "RIGHT";
        case Action::NOOP:  return "NOOP";
    }
    return "NOOP";
}

std::vector<std::string> action_meanings() {
    std::vector<std::string> names;
    names.reserve(ACTION_COUNT);
    for (size_t i = 0; i < ACTION_COUNT; ++i) {
        names.emplace_back(action_meaning(static_cast<Action>(i)));
    }
    return names;
}

GridPos apply_action(const GridPos& pos, Action action) {
    if (action == Action::NOOP) return pos;
    const ActionOffset& off = ACTION_OFFSETS[static_cast<size_t>(action)];
    return GridPos{pos.row + off.drow, pos.col + off.dcol};
}

} // namespace crossgrid
