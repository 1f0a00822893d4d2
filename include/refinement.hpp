#pragma once
#include "types.hpp"
#include "color_samples.hpp"
#include "color_segmentation.hpp"
#include "coverage.hpp"
#include "cut_layer.hpp"
#include "preview.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

using SessionClock = std::chrono::steady_clock;

// Coalesces bursts of change requests. Every request supersedes the
// previous one; only the latest token may commit once its delay elapsed.
class RecomputeDebouncer {
public:
    explicit RecomputeDebouncer(std::chrono::milliseconds delay) : delay_(delay) {}

    uint64_t request(SessionClock::time_point now);
    void cancel() { pending_ = false; }
    bool pending() const { return pending_; }
    // latest token if its deadline has passed
    std::optional<uint64_t> due(SessionClock::time_point now) const;
    // true only for the latest pending token; clears the pending state
    bool commit(uint64_t token);

    uint64_t latest() const { return token_; }

private:
    std::chrono::milliseconds delay_;
    uint64_t token_ = 0;
    bool pending_ = false;
    SessionClock::time_point deadline_;
};

struct SessionParams {
    ToleranceSet tolerances;         // used when auto tolerance does not apply
    bool   auto_tolerance = true;
    double scale = 0.0;              // length per pixel, <= 0 = uncalibrated
    int    debounce_ms = 80;
    SegmentationParams segmentation;
    PreviewParams preview;
    bool   debug = false;
};

// One interactive analysis of one image. Owns every piece of derived
// state (HSV cache, cuts, samples, labels, preview); the RGB image is
// shared read-only with the caller.
class RefinementSession {
public:
    using StatsListener = std::function<void(const SegmentationResult&, const CoverageStats&)>;

    RefinementSession(const cv::Mat& rgb, std::vector<cv::Vec3b> seeds,
                      const SessionParams& params = SessionParams());

    void set_listener(StatsListener cb) { listener_ = std::move(cb); }

    // ---- operator input, each schedules a recompute ----
    void set_tolerances(const ToleranceSet& tol, SessionClock::time_point now);
    void set_min_area(int min_area, SessionClock::time_point now);
    // switching on reapplies the sample-derived tolerances right away
    void set_auto_tolerance(bool on, SessionClock::time_point now);
    void set_scale(double scale);

    // pick in full-image pixels, clamped to the image
    void add_sample(cv::Point pt, SessionClock::time_point now);
    // pick in preview coordinates; ignored (false) off the displayed image
    bool add_sample_at_canvas(const cv::Point2d& pt, const cv::Size& viewport, SessionClock::time_point now);
    bool undo_sample(SessionClock::time_point now);

    // false when no stroke was recorded (no finite point)
    bool add_stroke(const std::vector<cv::Point2d>& pts, double radius, SessionClock::time_point now);
    // brush_width in full-image pixels, radius = max(1, width / 2); false for a degenerate viewport
    bool add_stroke_at_canvas(const std::vector<cv::Point2d>& pts, double brush_width,
                              const cv::Size& viewport, SessionClock::time_point now);
    bool undo_stroke(SessionClock::time_point now);
    bool clear_strokes(SessionClock::time_point now);

    // ---- scheduling ----
    bool tick(SessionClock::time_point now);  // recompute if the latest request is due
    bool flush();                             // run a pending request immediately
    bool pending() const { return debounce_.pending(); }
    void recompute();

    // ---- view ----
    cv::Mat render(const cv::Size& viewport) const { return preview_.render(viewport); }
    PreviewRenderer& preview() { return preview_; }
    const PreviewRenderer& preview() const { return preview_; }

    const SegmentationResult& result() const { return result_; }
    const CoverageStats& stats() const { return stats_; }
    const ToleranceSet& tolerances() const { return params_.tolerances; }
    const ColorSampleSet& samples() const { return samples_; }
    const CutLayer& cuts() const { return cuts_; }
    const std::optional<ColorCenter>& center() const { return center_; }
    const cv::Mat& hsv() const { return hsv_; }
    int recompute_count() const { return recomputes_; }

private:
    void on_samples_changed();
    void run(uint64_t token);

    SessionParams params_;
    cv::Mat rgb_;
    cv::Mat hsv_;
    ColorSampleSet samples_;
    std::optional<ColorCenter> center_;
    CutLayer cuts_;
    PreviewRenderer preview_;
    RecomputeDebouncer debounce_;
    SegmentationResult result_;
    CoverageStats stats_;
    StatsListener listener_;
    int recomputes_ = 0;
};
