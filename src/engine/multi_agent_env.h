#pragma once
/**
 * MultiAgentEnv — 抽象多智能体环境接口
 *
 * 训练循环与环境之间的协议:
 *   - reset()  : 开始新 episode, 返回每个 agent 的初始观测
 *   - step()   : 每个 agent 一个离散动作 → 新观测/奖励/done/info
 *   - render() : 可选, 像素或文本帧
 *   - close()  : 释放渲染资源
 *
 * 设计原则:
 *   - 不依赖任何特定训练框架
 *   - 奖励是本步奖励 (非累计), done 是累计状态
 *   - 一个实例拥有全部状态, 多个实例互不影响
 *
 * 实现:
 *   - CrossoverEnv : 4 agent 走廊交叉 (协作)
 */

#include "engine/observation_builder.h"
#include <vector>
#include <map>
#include <string>
#include <cstdint>

namespace crossgrid {

enum class RenderMode : uint8_t {
    HUMAN     = 0,   // 文本帧打印到 stdout
    RGB_ARRAY = 1,   // 返回像素缓冲区
    ANSI      = 2    // 返回文本帧
};

/** step 附加信息 (目前为空, 预留扩展) */
using StepInfo = std::map<std::string, float>;

struct StepResult {
    Observations       observations;
    std::vector<float> rewards;   // 本步奖励
    std::vector<bool>  dones;     // 累计 done 状态
    StepInfo           info;
};

struct RenderFrame {
    std::vector<uint8_t> pixels;   // RGB_ARRAY: row-major height × width × 3
    size_t width  = 0;
    size_t height = 0;
    std::string text;              // ANSI / HUMAN
    bool is_open  = false;         // HUMAN: 文本帧已写到 stdout
};

class MultiAgentEnv {
public:
    virtual ~MultiAgentEnv() = default;

    // --- Lifecycle ---
    virtual Observations reset() = 0;
    virtual void close() = 0;

    // --- Motor ---
    /** 每个 agent 一个动作编码, 按 agent id 顺序 */
    virtual StepResult step(const std::vector<int>& actions) = 0;

    // --- Rendering ---
    virtual RenderFrame render(RenderMode mode) = 0;

    // --- Spaces ---
    virtual size_t n_agents() const = 0;
    virtual size_t n_actions() const = 0;
    virtual size_t obs_size() const = 0;
};

} // namespace crossgrid
