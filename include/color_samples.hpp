#pragma once
#include "types.hpp"
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

struct ColorCenter {
    HsvColor  hsv;   // circular-mean hue, arithmetic-mean S and V
    cv::Vec3b rgb;   // rounded mean of raw channels, swatch display only
};

// Reference colors picked by the operator. Seeds are fixed for the
// session; appended samples can be undone one at a time.
class ColorSampleSet {
public:
    ColorSampleSet() = default;
    explicit ColorSampleSet(std::vector<cv::Vec3b> seeds);

    void add(const cv::Vec3b& rgb);
    bool undo_last();   // false when no appended sample is left

    std::vector<cv::Vec3b> all() const;
    size_t size() const { return seeds_.size() + added_.size(); }
    size_t seed_count() const { return seeds_.size(); }
    bool empty() const { return size() == 0; }

    std::optional<ColorCenter> center() const;

    // Tolerances derived from the sample spread; defaults for <= 1 sample.
    // min_area is taken from `current`.
    ToleranceSet auto_tolerance(const ToleranceSet& current) const;

private:
    std::vector<cv::Vec3b> seeds_;
    std::vector<cv::Vec3b> added_;
};

// Circular mean of hues on the 0..180 circle, result in [0,180).
double circular_mean_hue(const std::vector<double>& hues);
