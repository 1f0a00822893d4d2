#include "color_convert.hpp"
#include <algorithm>
#include <cmath>
using namespace cv;

static void hsv_from_unit(float r, float g, float b, float& h, float& s, float& v) {
    float cmax = std::max(std::max(r, g), b);
    float cmin = std::min(std::min(r, g), b);
    float delta = cmax - cmin;

    h = 0.f;
    if (delta > 0.f) {
        if (cmax == r)      h = 60.f * std::fmod((g - b) / delta + 6.f, 6.f);
        else if (cmax == g) h = 60.f * ((b - r) / delta + 2.f);
        else                h = 60.f * ((r - g) / delta + 4.f);
    }
    h *= 0.5f; // 0-360 -> 0-180

    s = cmax > 0.f ? delta / cmax * 255.f : 0.f;
    v = cmax * 255.f;
}

HsvColor rgb_to_hsv(const cv::Vec3b& rgb) {
    float h, s, v;
    hsv_from_unit(rgb[0] / 255.f, rgb[1] / 255.f, rgb[2] / 255.f, h, s, v);
    return HsvColor{ h, s, v };
}

cv::Mat rgb_to_hsv_image(const cv::Mat& rgb) {
    CV_Assert(!rgb.empty() && rgb.type() == CV_8UC3);
    Mat hsv(rgb.size(), CV_32FC3);
    for (int y = 0; y < rgb.rows; ++y) {
        const Vec3b* src = rgb.ptr<Vec3b>(y);
        Vec3f* dst = hsv.ptr<Vec3f>(y);
        for (int x = 0; x < rgb.cols; ++x) {
            hsv_from_unit(src[x][0] / 255.f, src[x][1] / 255.f, src[x][2] / 255.f,
                          dst[x][0], dst[x][1], dst[x][2]);
        }
    }
    return hsv;
}

double hue_distance(double a, double b) {
    double d = std::abs(a - b);
    return std::min(d, 180.0 - d);
}
