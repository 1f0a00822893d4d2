#pragma once
#include "types.hpp"
#include <vector>
#include <opencv2/core.hpp>

struct PreviewParams {
    int    max_side = 600;      // thumbnail longest side
    double blend = 0.6;         // palette weight over the thumbnail
    int    label_margin = 20;   // labels this far outside the viewport are still drawn
    double nearest_zoom = 3.0;  // above this zoom, upscale with nearest neighbor
    double min_zoom = 0.5;
    double max_zoom = 20.0;
    cv::Scalar background = cv::Scalar(0x22, 0x22, 0x22);
};

// Aspect-preserving size with longest side <= max_side, never upscaled.
cv::Size thumbnail_size(const cv::Size& full, int max_side);

// 20 distinct RGB colors, region i uses entry (i-1) % 20.
const std::vector<cv::Vec3b>& preview_palette();

// Colorized label overlay at thumbnail resolution, drawn into a viewport
// with pan/zoom. The overlay is rebuilt once per recompute; render() only
// crops and scales the visible part.
class PreviewRenderer {
public:
    explicit PreviewRenderer(const cv::Mat& rgb, const PreviewParams& params = PreviewParams());

    // labels: CV_32S at full resolution, particles: ranked list with full-image centroids
    void update(const cv::Mat& labels, const std::vector<Particle>& particles);

    // CV_8UC3 RGB buffer of `viewport` size with rank labels.
    cv::Mat render(const cv::Size& viewport) const;

    void zoom_at(const cv::Point2d& cursor, double factor, const cv::Size& viewport);
    void pan(double dx, double dy);
    void reset_view() { view_ = ViewState(); }
    const ViewState& view() const { return view_; }
    void set_view(const ViewState& v);

    // viewport pixel -> full-image pixel (unclamped)
    cv::Point2d canvas_to_image(const cv::Point2d& pt, const cv::Size& viewport) const;
    // true if the viewport pixel falls on the displayed image
    bool contains(const cv::Point2d& pt, const cv::Size& viewport) const;
    // viewport pixels per full-image pixel
    double canvas_scale(const cv::Size& viewport) const;

    const cv::Mat& overlay() const { return overlay_; }
    const cv::Mat& thumbnail() const { return thumb_; }
    const std::vector<cv::Point2d>& thumb_centroids() const { return centroids_; }

private:
    struct Placement {
        double scale;   // viewport px per thumbnail px
        double x0, y0;  // thumbnail origin in the viewport
    };
    Placement place(const cv::Size& viewport) const;
    void draw_labels(cv::Mat& canvas, const Placement& pl) const;

    PreviewParams params_;
    cv::Size full_;
    cv::Mat  thumb_;    // CV_8UC3 RGB
    cv::Mat  overlay_;  // thumb_ blended with region colors
    std::vector<cv::Point2d> centroids_;  // thumbnail coordinates, index = rank - 1
    ViewState view_;
};
