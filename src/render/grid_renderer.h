#pragma once
/**
 * GridRenderer — CrossOver 网格像素渲染 (OpenCV, BGR)
 *
 * 底图 (构造时画一次):
 *   白色格子 + 灰色网格线, 墙壁填黑, 每个 agent 的目标格用该 agent 的颜色描边
 * 每帧:
 *   底图拷贝 + 每个 agent 画一个实心圆
 *
 * 只读取位置, 不持有仿真状态。
 */

#include "engine/grid_model.h"
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace crossgrid {

namespace colors {
// cv::Scalar 顺序为 (B, G, R)
inline const cv::Scalar WHITE (255, 255, 255);
inline const cv::Scalar BLACK (  0,   0,   0);
inline const cv::Scalar GRAY  (160, 160, 160);
inline const cv::Scalar RED   ( 40,  40, 220);
inline const cv::Scalar BLUE  (220,  90,  40);
inline const cv::Scalar GREEN ( 60, 170,  40);
inline const cv::Scalar ORANGE( 30, 150, 240);
} // namespace colors

class GridRenderer {
public:
    GridRenderer(const GridModel& grid, const std::vector<GridPos>& goals, size_t cell_size);

    /** 当前帧 (CV_8UC3, BGR) */
    cv::Mat draw(const std::vector<GridPos>& agent_positions) const;

    const cv::Mat& base_image() const { return base_img_; }
    size_t cell_size() const { return cell_size_; }

    static cv::Scalar agent_color(size_t agent_id);

    /** BGR 图像 → 行优先 RGB 字节 (height × width × 3) */
    static std::vector<uint8_t> to_rgb_bytes(const cv::Mat& bgr);

private:
    size_t cell_size_;
    cv::Mat base_img_;

    void fill_cell(cv::Mat& img, const GridPos& pos, const cv::Scalar& c) const;
    void draw_cell_outline(cv::Mat& img, const GridPos& pos, const cv::Scalar& c,
                           int thickness) const;
    void draw_circle(cv::Mat& img, const GridPos& pos, const cv::Scalar& c) const;
};

} // namespace crossgrid
