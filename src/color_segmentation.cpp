#include "color_segmentation.hpp"
#include "components.hpp"
#include "cut_layer.hpp"
#include <iostream>
using namespace cv;

static Mat withinTol(const Mat& ch, double center, double tol) {
    Mat d; absdiff(ch, Scalar(center), d);
    return d <= tol;
}

cv::Mat match_hsv(const cv::Mat& hsv, const HsvColor& center, const ToleranceSet& tol) {
    CV_Assert(!hsv.empty() && hsv.type() == CV_32FC3);
    Mat ch[3]; split(hsv, ch);

    // hue wraps at 180
    Mat dh; absdiff(ch[0], Scalar(center.h), dh);
    Mat wrapped; subtract(Scalar(180.0), dh, wrapped);
    Mat dmin = cv::min(dh, wrapped);
    Mat hue_ok = dmin <= tol.hue;

    Mat mask;
    bitwise_and(hue_ok, withinTol(ch[1], center.s, tol.sat), mask);
    bitwise_and(mask, withinTol(ch[2], center.v, tol.val), mask);
    return mask;
}

SegmentationResult segment_particles(const cv::Mat& hsv,
                                     const std::optional<HsvColor>& center,
                                     const ToleranceSet& tol,
                                     const cv::Mat& cut_mask,
                                     const SegmentationParams& params) {
    CV_Assert(!hsv.empty());
    SegmentationResult r;
    if (!center) {
        r.status = SegStatus::NO_SAMPLES;
        r.mask = Mat::zeros(hsv.size(), CV_8U);
        r.labels = Mat::zeros(hsv.size(), CV_32S);
        if (params.debug) std::cout << "[segment] no color samples, skipping match\n";
        return r;
    }

    r.mask = match_hsv(hsv, *center, tol);
    if (!cut_mask.empty()) apply_cuts(r.mask, cut_mask);

    ComponentResult comps = extract_components(r.mask, tol.min_area, params.connectivity);
    r.labels = comps.labels;
    r.particles = std::move(comps.particles);
    r.status = r.particles.empty() ? SegStatus::NO_PARTICLES : SegStatus::OK;

    if (params.debug) {
        std::cout << "[segment] center=(" << center->h << "," << center->s << "," << center->v
                  << ") tol=(" << tol.hue << "," << tol.sat << "," << tol.val
                  << ") min_area=" << tol.min_area
                  << " particles=" << r.particles.size() << "\n";
    }
    return r;
}
