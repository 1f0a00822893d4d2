#pragma once
#include "types.hpp"
#include <vector>
#include <opencv2/core.hpp>

struct ComponentResult {
    cv::Mat labels;                  // CV_32S, 0 = background, 1..N by descending area
    std::vector<Particle> particles; // particles[i].rank == i + 1
};

// Labels connected regions of `mask` (CV_8U, nonzero = set).
// Regions smaller than min_area are erased from `mask` and dropped.
// Survivors are ranked by area descending (ties keep label order)
// and relabeled 1..N. Centroids are in mask pixel coordinates.
ComponentResult extract_components(cv::Mat& mask, int min_area, int connectivity = 4);
