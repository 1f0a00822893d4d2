#pragma once
#include "types.hpp"
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

struct CoverageStats {
    int     count = 0;
    int64_t total_area_px = 0;
    double  image_area = 0.0;   // pixels
    double  coverage = 0.0;     // total_area_px / image_area (the output)
    double  unit_factor = 1.0;  // scale^2 when calibrated, else 1
    // per-particle area statistics in calibrated units
    double  mean = 0.0;
    double  stddev = 0.0;       // sample std (n-1), 0 when count <= 1
    double  min = 0.0;
    double  max = 0.0;
};

// scale = length per pixel from calibration, <= 0 means uncalibrated (px^2).
CoverageStats compute_coverage(const std::vector<Particle>& particles, const cv::Size& img_size, double scale);

inline double to_calibrated(int64_t area_px, double scale) {
    return scale > 0.0 ? (double)area_px * scale * scale : (double)area_px;
}
