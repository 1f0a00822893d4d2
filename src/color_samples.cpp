#include "color_samples.hpp"
#include "color_convert.hpp"
#include <algorithm>
#include <cmath>
using namespace cv;
using std::vector;

static const ToleranceSet kDefaultTol{ 15, 50, 50, 10 };

double circular_mean_hue(const std::vector<double>& hues) {
    if (hues.empty()) return 0.0;
    double ms = 0.0, mc = 0.0;
    for (double h : hues) {
        double rad = h * CV_PI / 90.0;  // 0..180 -> 0..2pi
        ms += std::sin(rad);
        mc += std::cos(rad);
    }
    ms /= (double)hues.size();
    mc /= (double)hues.size();
    double c = std::atan2(ms, mc) * 90.0 / CV_PI;
    c = std::fmod(c, 180.0);
    if (c < 0.0) c += 180.0;
    return c >= 180.0 ? 0.0 : c;
}

ColorSampleSet::ColorSampleSet(std::vector<cv::Vec3b> seeds) : seeds_(std::move(seeds)) {}

void ColorSampleSet::add(const cv::Vec3b& rgb) { added_.push_back(rgb); }

bool ColorSampleSet::undo_last() {
    if (added_.empty()) return false;
    added_.pop_back();
    return true;
}

std::vector<cv::Vec3b> ColorSampleSet::all() const {
    vector<Vec3b> pts(seeds_);
    pts.insert(pts.end(), added_.begin(), added_.end());
    return pts;
}

std::optional<ColorCenter> ColorSampleSet::center() const {
    const vector<Vec3b> pts = all();
    if (pts.empty()) return std::nullopt;

    vector<double> hues; hues.reserve(pts.size());
    double ss = 0, sv = 0, sr = 0, sg = 0, sb = 0;
    for (const auto& p : pts) {
        HsvColor c = rgb_to_hsv(p);
        hues.push_back(c.h);
        ss += c.s; sv += c.v;
        sr += p[0]; sg += p[1]; sb += p[2];
    }
    const double n = (double)pts.size();

    ColorCenter cc;
    cc.hsv = HsvColor{ circular_mean_hue(hues), ss / n, sv / n };
    cc.rgb = Vec3b(saturate_cast<uchar>(std::round(sr / n)),
                   saturate_cast<uchar>(std::round(sg / n)),
                   saturate_cast<uchar>(std::round(sb / n)));
    return cc;
}

ToleranceSet ColorSampleSet::auto_tolerance(const ToleranceSet& current) const {
    ToleranceSet t = kDefaultTol;
    t.min_area = current.min_area;

    auto c = center();
    if (!c || size() < 2) return t;

    double dh = 0, ds = 0, dv = 0;
    for (const auto& p : all()) {
        HsvColor hsv = rgb_to_hsv(p);
        dh = std::max(dh, hue_distance(hsv.h, c->hsv.h));
        ds = std::max(ds, std::abs(hsv.s - c->hsv.s));
        dv = std::max(dv, std::abs(hsv.v - c->hsv.v));
    }
    // truncated to whole units, like the operator sliders
    t.hue = (int)std::min(90.0, std::max(5.0, dh * 1.5 + 5.0));
    t.sat = (int)std::min(128.0, std::max(10.0, ds * 1.5 + 10.0));
    t.val = (int)std::min(128.0, std::max(10.0, dv * 1.5 + 10.0));
    return t;
}
