#include "refinement.hpp"
#include "color_convert.hpp"
#include <algorithm>
#include <iostream>
using namespace cv;
using clk = std::chrono::high_resolution_clock;

uint64_t RecomputeDebouncer::request(SessionClock::time_point now) {
    ++token_;
    pending_ = true;
    deadline_ = now + delay_;
    return token_;
}

std::optional<uint64_t> RecomputeDebouncer::due(SessionClock::time_point now) const {
    if (!pending_ || now < deadline_) return std::nullopt;
    return token_;
}

bool RecomputeDebouncer::commit(uint64_t token) {
    if (!pending_ || token != token_) return false;
    pending_ = false;
    return true;
}

RefinementSession::RefinementSession(const cv::Mat& rgb, std::vector<cv::Vec3b> seeds,
                                     const SessionParams& params)
    : params_(params),
      rgb_(rgb),
      hsv_(rgb_to_hsv_image(rgb)),
      samples_(std::move(seeds)),
      cuts_(rgb.size()),
      preview_(rgb, params.preview),
      debounce_(std::chrono::milliseconds(params.debounce_ms)) {
    params_.segmentation.debug = params_.segmentation.debug || params_.debug;
    on_samples_changed();
    recompute();
}

void RefinementSession::on_samples_changed() {
    center_ = samples_.center();
    if (params_.auto_tolerance && !samples_.empty())
        params_.tolerances = samples_.auto_tolerance(params_.tolerances);
    if (params_.debug && center_) {
        std::cout << "[samples] n=" << samples_.size()
                  << " center_hsv=(" << center_->hsv.h << "," << center_->hsv.s << "," << center_->hsv.v << ")"
                  << " tol=(" << params_.tolerances.hue << "," << params_.tolerances.sat << ","
                  << params_.tolerances.val << ")\n";
    }
}

void RefinementSession::set_tolerances(const ToleranceSet& tol, SessionClock::time_point now) {
    params_.tolerances = tol;
    params_.tolerances.hue = std::max(0.0, tol.hue);
    params_.tolerances.sat = std::max(0.0, tol.sat);
    params_.tolerances.val = std::max(0.0, tol.val);
    params_.tolerances.min_area = std::max(0, tol.min_area);
    debounce_.request(now);
}

void RefinementSession::set_min_area(int min_area, SessionClock::time_point now) {
    params_.tolerances.min_area = std::max(0, min_area);
    debounce_.request(now);
}

void RefinementSession::set_auto_tolerance(bool on, SessionClock::time_point now) {
    const bool was = params_.auto_tolerance;
    params_.auto_tolerance = on;
    if (!on || was || samples_.empty()) return;
    params_.tolerances = samples_.auto_tolerance(params_.tolerances);
    debounce_.request(now);
}

void RefinementSession::set_scale(double scale) {
    params_.scale = scale;
    stats_ = compute_coverage(result_.particles, rgb_.size(), params_.scale);
}

void RefinementSession::add_sample(cv::Point pt, SessionClock::time_point now) {
    pt.x = std::min(std::max(pt.x, 0), rgb_.cols - 1);
    pt.y = std::min(std::max(pt.y, 0), rgb_.rows - 1);
    samples_.add(rgb_.at<Vec3b>(pt));
    on_samples_changed();
    debounce_.request(now);
}

bool RefinementSession::add_sample_at_canvas(const cv::Point2d& pt, const cv::Size& viewport,
                                             SessionClock::time_point now) {
    if (!preview_.contains(pt, viewport)) return false;
    Point2d p = preview_.canvas_to_image(pt, viewport);
    add_sample(Point((int)p.x, (int)p.y), now);
    return true;
}

bool RefinementSession::undo_sample(SessionClock::time_point now) {
    if (!samples_.undo_last()) return false;
    on_samples_changed();
    debounce_.request(now);
    return true;
}

bool RefinementSession::add_stroke(const std::vector<cv::Point2d>& pts, double radius,
                                   SessionClock::time_point now) {
    if (!cuts_.paint_stroke(pts, radius)) return false;
    debounce_.request(now);
    return true;
}

bool RefinementSession::add_stroke_at_canvas(const std::vector<cv::Point2d>& pts, double brush_width,
                                             const cv::Size& viewport, SessionClock::time_point now) {
    // nothing is displayed, so there is no mapping back to the image
    if (viewport.width < 2 || viewport.height < 2) return false;
    std::vector<Point2d> img_pts;
    img_pts.reserve(pts.size());
    for (const auto& p : pts) img_pts.push_back(preview_.canvas_to_image(p, viewport));
    return add_stroke(img_pts, std::max(1.0, brush_width / 2.0), now);
}

bool RefinementSession::undo_stroke(SessionClock::time_point now) {
    if (!cuts_.undo_last_stroke()) return false;
    debounce_.request(now);
    return true;
}

bool RefinementSession::clear_strokes(SessionClock::time_point now) {
    if (!cuts_.clear_strokes()) return false;
    debounce_.request(now);
    return true;
}

bool RefinementSession::tick(SessionClock::time_point now) {
    auto token = debounce_.due(now);
    if (!token) return false;
    run(*token);
    return true;
}

bool RefinementSession::flush() {
    if (!debounce_.pending()) return false;
    run(debounce_.latest());
    return true;
}

void RefinementSession::run(uint64_t token) {
    if (!debounce_.commit(token)) return;
    recompute();
}

void RefinementSession::recompute() {
    auto t0 = clk::now();

    std::optional<HsvColor> c;
    if (center_) c = center_->hsv;
    SegmentationResult r = segment_particles(hsv_, c, params_.tolerances, cuts_.mask(), params_.segmentation);
    preview_.update(r.labels, r.particles);

    // commit only after every stage succeeded
    result_ = std::move(r);
    stats_ = compute_coverage(result_.particles, rgb_.size(), params_.scale);
    ++recomputes_;

    if (params_.debug) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clk::now() - t0).count();
        std::cout << "[recompute] #" << recomputes_ << " status=" << status_to_cstr(result_.status)
                  << " particles=" << stats_.count
                  << " coverage=" << stats_.coverage * 100.0 << "%"
                  << " strokes=" << cuts_.stroke_count() << "\n";
        if (ms > 200) std::cerr << "[warn] recompute took " << ms << " ms (>200ms)\n";
        else          std::cout << "[recompute] took " << ms << " ms\n";
    }

    if (listener_) listener_(result_, stats_);
}
