#include "render/grid_renderer.h"
#include <opencv2/imgproc.hpp>

namespace crossgrid {

GridRenderer::GridRenderer(const GridModel& grid, const std::vector<GridPos>& goals,
                           size_t cell_size)
    : cell_size_(cell_size)
    , base_img_(static_cast<int>(grid.rows() * cell_size),
                static_cast<int>(grid.cols() * cell_size), CV_8UC3, colors::WHITE)
{
    // Grid lines
    for (int r = 0; r < (int)grid.rows(); ++r) {
        for (int c = 0; c < (int)grid.cols(); ++c) {
            draw_cell_outline(base_img_, GridPos{r, c}, colors::GRAY, 1);
        }
    }
    for (int r = 0; r < (int)grid.rows(); ++r) {
        for (int c = 0; c < (int)grid.cols(); ++c) {
            if (grid.wall_exists(GridPos{r, c})) {
                fill_cell(base_img_, GridPos{r, c}, colors::BLACK);
            }
        }
    }
    int goal_line = cell_size >= 12 ? 3 : 1;
    for (size_t i = 0; i < goals.size(); ++i) {
        draw_cell_outline(base_img_, goals[i], agent_color(i), goal_line);
    }
}

cv::Scalar GridRenderer::agent_color(size_t agent_id) {
    static const cv::Scalar palette[] = {colors::RED, colors::BLUE, colors::GREEN, colors::ORANGE};
    return palette[agent_id % 4];
}

cv::Mat GridRenderer::draw(const std::vector<GridPos>& agent_positions) const {
    cv::Mat img = base_img_.clone();
    for (size_t i = 0; i < agent_positions.size(); ++i) {
        draw_circle(img, agent_positions[i], agent_color(i));
    }
    return img;
}

std::vector<uint8_t> GridRenderer::to_rgb_bytes(const cv::Mat& bgr) {
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return std::vector<uint8_t>(rgb.datastart, rgb.dataend);
}

void GridRenderer::fill_cell(cv::Mat& img, const GridPos& pos, const cv::Scalar& c) const {
    int s = static_cast<int>(cell_size_);
    cv::Point pt1(pos.col * s, pos.row * s);
    cv::Point pt2((pos.col + 1) * s - 1, (pos.row + 1) * s - 1);
    cv::rectangle(img, pt1, pt2, c, -1);
}

void GridRenderer::draw_cell_outline(cv::Mat& img, const GridPos& pos, const cv::Scalar& c,
                                     int thickness) const {
    // 线条中心内缩半个线宽, 描边不越出本格
    int s = static_cast<int>(cell_size_);
    int inset = thickness / 2;
    cv::Point pt1(pos.col * s + inset, pos.row * s + inset);
    cv::Point pt2((pos.col + 1) * s - 1 - inset, (pos.row + 1) * s - 1 - inset);
    cv::rectangle(img, pt1, pt2, c, thickness);
}

void GridRenderer::draw_circle(cv::Mat& img, const GridPos& pos, const cv::Scalar& c) const {
    int s = static_cast<int>(cell_size_);
    cv::Point center(pos.col * s + s / 2, pos.row * s + s / 2);
    cv::circle(img, center, static_cast<int>(s * 0.35f), c, -1);
}

} // namespace crossgrid
