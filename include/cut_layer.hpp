#pragma once
#include <opencv2/core.hpp>
#include <vector>

struct Stroke {
    std::vector<cv::Point2d> points;  // full-image coordinates
    double  radius = 1.0;
    cv::Rect roi;                     // clamped bounding box of the painted cells
    cv::Mat  cells;                   // CV_8U sub-grid over roi, 255 = painted
};

// Operator-painted cut strokes, subtracted from the similarity mask
// before connected-component labeling.
class CutLayer {
public:
    explicit CutLayer(const cv::Size& image_size);

    // Rasterize a rounded polyline; points are clamped to the image,
    // non-finite points dropped. False when nothing was recorded.
    bool paint_stroke(const std::vector<cv::Point2d>& points, double radius);
    // Returns false when there is nothing to undo / clear.
    bool undo_last_stroke();
    bool clear_strokes();

    const cv::Mat& mask() const { return cut_; }
    size_t stroke_count() const { return strokes_.size(); }
    const std::vector<Stroke>& strokes() const { return strokes_; }

private:
    void rebuild();

    cv::Size size_;
    cv::Mat  cut_;   // CV_8U, OR of all strokes
    std::vector<Stroke> strokes_;
};

// Marks cells of `mask` (CV_8U) within `radius` of segment p0-p1.
void draw_capsule(cv::Mat& mask, cv::Point2d p0, cv::Point2d p1, double radius);

// mask = mask AND NOT cut_mask
void apply_cuts(cv::Mat& mask, const cv::Mat& cut_mask);
