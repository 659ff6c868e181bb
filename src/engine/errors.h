#pragma once
/**
 * 环境使用错误 (调用方 bug, 不是仿真结果)
 *
 * 被墙/边界/其他 agent 挡住的移动不是错误, 静默留在原地。
 */

#include <stdexcept>
#include <string>

namespace crossgrid {

/** 动作编码不在 {0..4} */
class InvalidAction : public std::invalid_argument {
public:
    explicit InvalidAction(const std::string& what) : std::invalid_argument(what) {}
};

/** 动作列表长度 != agent 数 */
class ActionCountMismatch : public std::invalid_argument {
public:
    explicit ActionCountMismatch(const std::string& what) : std::invalid_argument(what) {}
};

/** reset() 之前调用 step()/observe() */
class NotInitialized : public std::logic_error {
public:
    explicit NotInitialized(const std::string& what) : std::logic_error(what) {}
};

} // namespace crossgrid
