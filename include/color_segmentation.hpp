#pragma once
#include "types.hpp"
#include <optional>
#include <opencv2/core.hpp>

struct SegmentationParams {
    int  connectivity = 4;  // 4 or 8
    bool debug = false;
};

// Pixels of `hsv` (CV_32FC3) within tolerance of `center` on all three channels.
// Hue uses circular distance. Returns CV_8U, 255 = match.
cv::Mat match_hsv(const cv::Mat& hsv, const HsvColor& center, const ToleranceSet& tol);

// match -> subtract cuts -> connected components -> min-area filter and ranking.
// `cut_mask` may be empty. Without a center nothing matches (NO_SAMPLES).
SegmentationResult segment_particles(const cv::Mat& hsv,
                                     const std::optional<HsvColor>& center,
                                     const ToleranceSet& tol,
                                     const cv::Mat& cut_mask,
                                     const SegmentationParams& params);
