#include "coverage.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>

CoverageStats compute_coverage(const std::vector<Particle>& particles, const cv::Size& img_size, double scale) {
    CoverageStats r;
    r.image_area = (double)img_size.width * (double)img_size.height;
    r.unit_factor = scale > 0.0 ? scale * scale : 1.0;
    r.count = (int)particles.size();
    if (particles.empty()) return r;

    double sum = 0.0, minv = +DBL_MAX, maxv = -DBL_MAX;
    for (const auto& p : particles) {
        r.total_area_px += p.area;
        double a = (double)p.area * r.unit_factor;
        sum += a;
        minv = std::min(minv, a);
        maxv = std::max(maxv, a);
    }
    r.mean = sum / (double)r.count;
    r.min = minv;
    r.max = maxv;

    if (r.count > 1) {
        double s2 = 0.0;
        for (const auto& p : particles) {
            double d = (double)p.area * r.unit_factor - r.mean;
            s2 += d * d;
        }
        r.stddev = std::sqrt(s2 / (double)(r.count - 1));
    }

    if (r.image_area > 0.0) r.coverage = (double)r.total_area_px / r.image_area;
    return r;
}
