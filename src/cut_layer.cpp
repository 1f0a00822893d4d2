#include "cut_layer.hpp"
#include <algorithm>
#include <cmath>
using namespace cv;

static Point2d clampToImage(const Point2d& p, const Size& sz) {
    return Point2d(std::min(std::max(p.x, 0.0), (double)(sz.width - 1)),
                   std::min(std::max(p.y, 0.0), (double)(sz.height - 1)));
}

void draw_capsule(cv::Mat& mask, cv::Point2d p0, cv::Point2d p1, double radius) {
    CV_Assert(mask.type() == CV_8U);
    const int bx0 = std::max(0, (int)std::floor(std::min(p0.x, p1.x) - radius) - 1);
    const int by0 = std::max(0, (int)std::floor(std::min(p0.y, p1.y) - radius) - 1);
    const int bx1 = std::min(mask.cols, (int)std::floor(std::max(p0.x, p1.x) + radius) + 2);
    const int by1 = std::min(mask.rows, (int)std::floor(std::max(p0.y, p1.y) + radius) + 2);
    if (bx0 >= bx1 || by0 >= by1) return;

    const double dx = p1.x - p0.x, dy = p1.y - p0.y;
    const double len_sq = dx * dx + dy * dy;
    const double r2 = radius * radius;

    for (int y = by0; y < by1; ++y) {
        uchar* row = mask.ptr<uchar>(y);
        for (int x = bx0; x < bx1; ++x) {
            double px = p0.x, py = p0.y;
            if (len_sq >= 1e-6) {
                double t = ((x - p0.x) * dx + (y - p0.y) * dy) / len_sq;
                t = std::min(1.0, std::max(0.0, t));
                px += t * dx; py += t * dy;
            }
            double ex = x - px, ey = y - py;
            if (ex * ex + ey * ey <= r2) row[x] = 255;
        }
    }
}

void apply_cuts(cv::Mat& mask, const cv::Mat& cut_mask) {
    CV_Assert(mask.size() == cut_mask.size() && mask.type() == CV_8U && cut_mask.type() == CV_8U);
    Mat keep; bitwise_not(cut_mask, keep);
    bitwise_and(mask, keep, mask);
}

CutLayer::CutLayer(const cv::Size& image_size)
    : size_(image_size), cut_(Mat::zeros(image_size, CV_8U)) {
    CV_Assert(image_size.width > 0 && image_size.height > 0);
}

bool CutLayer::paint_stroke(const std::vector<cv::Point2d>& points, double radius) {
    if (!std::isfinite(radius)) return false;

    Stroke s;
    // a radius beyond the image diagonal paints nothing more
    s.radius = std::min(std::max(radius, 0.0), (double)(size_.width + size_.height));
    s.points.reserve(points.size());
    for (const auto& p : points)
        if (std::isfinite(p.x) && std::isfinite(p.y)) s.points.push_back(clampToImage(p, size_));
    if (s.points.empty()) return false;

    double minx = s.points[0].x, maxx = minx, miny = s.points[0].y, maxy = miny;
    for (const auto& p : s.points) {
        minx = std::min(minx, p.x); maxx = std::max(maxx, p.x);
        miny = std::min(miny, p.y); maxy = std::max(maxy, p.y);
    }
    int x0 = (int)std::floor(minx - s.radius) - 1, y0 = (int)std::floor(miny - s.radius) - 1;
    int x1 = (int)std::floor(maxx + s.radius) + 2, y1 = (int)std::floor(maxy + s.radius) + 2;
    s.roi = Rect(x0, y0, x1 - x0, y1 - y0) & Rect(0, 0, size_.width, size_.height);

    // rasterize in roi-local coordinates
    s.cells = Mat::zeros(s.roi.size(), CV_8U);
    const Point2d org(s.roi.x, s.roi.y);
    if (s.points.size() == 1) {
        draw_capsule(s.cells, s.points[0] - org, s.points[0] - org, s.radius);
    } else {
        for (size_t k = 0; k + 1 < s.points.size(); ++k)
            draw_capsule(s.cells, s.points[k] - org, s.points[k + 1] - org, s.radius);
    }

    Mat dst = cut_(s.roi);
    bitwise_or(dst, s.cells, dst);
    strokes_.push_back(std::move(s));
    return true;
}

bool CutLayer::undo_last_stroke() {
    if (strokes_.empty()) return false;
    strokes_.pop_back();
    rebuild();
    return true;
}

bool CutLayer::clear_strokes() {
    if (strokes_.empty()) return false;
    strokes_.clear();
    cut_.setTo(Scalar(0));
    return true;
}

void CutLayer::rebuild() {
    cut_.setTo(Scalar(0));
    for (const auto& s : strokes_) {
        Mat dst = cut_(s.roi);
        bitwise_or(dst, s.cells, dst);
    }
}
