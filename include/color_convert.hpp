#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>

// RGB -> HSV with the half-range hue convention (0..180).
HsvColor rgb_to_hsv(const cv::Vec3b& rgb);

// CV_8UC3 RGB image -> CV_32FC3 (H,S,V), same shape.
cv::Mat rgb_to_hsv_image(const cv::Mat& rgb);

// Circular distance between two hues on the 0..180 circle.
double hue_distance(double a, double b);
