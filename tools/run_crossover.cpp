/**
 * run_crossover — CrossOver 环境演示 / 基线评估
 *
 * 用法:
 *   run_crossover                         # 1 个 episode, 打印每帧
 *   run_crossover --episodes 5 --quiet    # 只打印每个 episode 的汇总
 *   run_crossover --full-obs              # 联合观测模式
 *   run_crossover --step-cost -0.1        # 每步代价
 *   run_crossover --save last.png         # 最后一帧写成图像 (格式由扩展名决定)
 *
 * 使用手写的 ScriptedCrossingPolicy (向右的 agent 先过)。
 */

#include "engine/crossover_env.h"
#include "engine/scripted_policy.h"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace crossgrid;

int main(int argc, char* argv[]) {
    setvbuf(stdout, NULL, _IONBF, 0);

    // 解析参数
    int episodes = 1;
    bool quiet = false;
    std::string image_file;
    CrossoverConfig cfg;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--episodes") == 0 && i + 1 < argc) {
            episodes = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--full-obs") == 0) {
            cfg.full_observable = true;
        } else if (std::strcmp(argv[i], "--step-cost") == 0 && i + 1 < argc) {
            cfg.step_cost = static_cast<float>(std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--cols") == 0 && i + 1 < argc) {
            cfg.grid_cols = static_cast<size_t>(std::atoi(argv[++i]));
        } else if (std::strcmp(argv[i], "--save") == 0 && i + 1 < argc) {
            image_file = argv[++i];
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else {
            fprintf(stderr, "unknown argument: %s\n", argv[i]);
            return 2;
        }
    }
    cfg.verbose = !quiet;

    if (cfg.grid_cols < 4) {
        fprintf(stderr, "--cols must be >= 4 (got %zu)\n", cfg.grid_cols);
        return 2;
    }

    CrossoverEnv env(cfg);
    ScriptedCrossingPolicy policy(env);

    printf("=== CrossOver (%zux%zu, %zu agents, obs_size=%zu) ===\n\n",
           cfg.grid_rows(), cfg.grid_cols, env.n_agents(), env.obs_size());

    int solved = 0;
    for (int ep = 0; ep < episodes; ++ep) {
        env.reset();
        std::vector<float> returns(env.n_agents(), 0.0f);
        if (!quiet) env.render(RenderMode::HUMAN);

        while (env.state() == EnvState::RUNNING) {
            StepResult r = env.step(policy.act());
            for (size_t i = 0; i < returns.size(); ++i) returns[i] += r.rewards[i];
            if (!quiet) env.render(RenderMode::HUMAN);
        }

        bool all_at_goal = true;
        for (size_t i = 0; i < env.n_agents(); ++i) {
            if (env.agent_pos(i) != env.goal_pos(i)) all_at_goal = false;
        }
        if (all_at_goal) solved++;

        printf("  episode %2d | steps=%3u | returns=[", ep, env.step_count());
        for (size_t i = 0; i < returns.size(); ++i) {
            printf("%s%.2f", i ? ", " : "", returns[i]);
        }
        printf("] | %s\n", all_at_goal ? "all at goal" : "truncated");
    }

    printf("\n  Solved %d/%d episodes\n", solved, episodes);

    if (!image_file.empty()) {
        RenderFrame frame = env.render(RenderMode::RGB_ARRAY);
        cv::Mat rgb(static_cast<int>(frame.height), static_cast<int>(frame.width),
                    CV_8UC3, frame.pixels.data());
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
        bool written = false;
        try {
            written = cv::imwrite(image_file, bgr);
        } catch (const cv::Exception& e) {
            fprintf(stderr, "%s\n", e.what());
        }
        if (!written) {
            fprintf(stderr, "failed to write %s\n", image_file.c_str());
            env.close();
            return 1;
        }
        printf("  Last frame written to %s\n", image_file.c_str());
    }

    env.close();
    return 0;
}
