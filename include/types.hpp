#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

// H in [0,180), S and V in [0,255]
struct HsvColor {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

struct ToleranceSet {
    double hue = 15.0;
    double sat = 50.0;
    double val = 50.0;
    int    min_area = 10;   // pixels
};

struct Particle {
    int         rank;       // 1 = largest
    int64_t     area;       // pixels
    cv::Point2d centroid;   // full-image coordinates
};

enum class SegStatus {
    OK = 0,
    NO_SAMPLES = 1,
    NO_PARTICLES = 2
};

inline const char* status_to_cstr(SegStatus st) {
    switch (st) {
    case SegStatus::OK:           return "OK";
    case SegStatus::NO_SAMPLES:   return "NO_SAMPLES";
    case SegStatus::NO_PARTICLES: return "NO_PARTICLES";
    default:                      return "UNKNOWN";
    }
}

// One recompute cycle worth of output
struct SegmentationResult {
    SegStatus status = SegStatus::NO_SAMPLES;
    cv::Mat   mask;     // CV_8U, 255 = particle pixel (after cuts and min-area)
    cv::Mat   labels;   // CV_32S, 0 = background, 1..N by descending area
    std::vector<Particle> particles;
};

// Pan/zoom of the preview against its fit-to-viewport base scale
struct ViewState {
    double zoom = 1.0;
    double offset_x = 0.0;
    double offset_y = 0.0;
};
