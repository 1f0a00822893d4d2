#include <gtest/gtest.h>
#include "color_segmentation.hpp"
#include "color_convert.hpp"
#include <opencv2/core.hpp>

static cv::Mat hsvOf(const cv::Mat& rgb) { return rgb_to_hsv_image(rgb); }

TEST(MatchHsvTest, HueToleranceWrapsAcrossZero) {
    cv::Mat hsv(1, 4, CV_32FC3);
    hsv.at<cv::Vec3f>(0, 0) = cv::Vec3f(175.f, 200.f, 200.f);
    hsv.at<cv::Vec3f>(0, 1) = cv::Vec3f(3.f, 200.f, 200.f);
    hsv.at<cv::Vec3f>(0, 2) = cv::Vec3f(20.f, 200.f, 200.f);
    hsv.at<cv::Vec3f>(0, 3) = cv::Vec3f(160.f, 200.f, 200.f);

    ToleranceSet tol{ 10, 20, 20, 0 };
    cv::Mat m = match_hsv(hsv, HsvColor{ 2, 200, 200 }, tol);
    ASSERT_EQ(m.type(), CV_8U);
    EXPECT_EQ(m.at<uchar>(0, 0), 255);  // distance 7 through the wrap
    EXPECT_EQ(m.at<uchar>(0, 1), 255);
    EXPECT_EQ(m.at<uchar>(0, 2), 0);
    EXPECT_EQ(m.at<uchar>(0, 3), 0);
}

TEST(MatchHsvTest, AllThreeChannelsMustHold) {
    cv::Mat hsv(1, 4, CV_32FC3);
    hsv.at<cv::Vec3f>(0, 0) = cv::Vec3f(50.f, 100.f, 100.f);
    hsv.at<cv::Vec3f>(0, 1) = cv::Vec3f(50.f, 131.f, 100.f);  // sat off by 31
    hsv.at<cv::Vec3f>(0, 2) = cv::Vec3f(50.f, 100.f, 69.f);   // val off by 31
    hsv.at<cv::Vec3f>(0, 3) = cv::Vec3f(50.f, 130.f, 130.f);  // exactly on both bounds

    cv::Mat m = match_hsv(hsv, HsvColor{ 50, 100, 100 }, ToleranceSet{ 5, 30, 30, 0 });
    EXPECT_EQ(m.at<uchar>(0, 0), 255);
    EXPECT_EQ(m.at<uchar>(0, 1), 0);
    EXPECT_EQ(m.at<uchar>(0, 2), 0);
    EXPECT_EQ(m.at<uchar>(0, 3), 255);
}

TEST(SegmentParticlesTest, NoCenterMatchesNothing) {
    cv::Mat rgb(10, 10, CV_8UC3, cv::Scalar(255, 0, 0));
    SegmentationResult r = segment_particles(hsvOf(rgb), std::nullopt, ToleranceSet(), cv::Mat(), SegmentationParams());
    EXPECT_EQ(r.status, SegStatus::NO_SAMPLES);
    EXPECT_TRUE(r.particles.empty());
    EXPECT_EQ(cv::countNonZero(r.mask), 0);
    EXPECT_EQ(r.labels.type(), CV_32S);
    EXPECT_EQ(cv::countNonZero(r.labels), 0);
}

TEST(SegmentParticlesTest, RedSquareOnGreen) {
    cv::Mat rgb(100, 100, CV_8UC3, cv::Scalar(0, 255, 0));
    rgb(cv::Rect(5, 5, 10, 10)).setTo(cv::Scalar(255, 0, 0));

    HsvColor red = rgb_to_hsv(cv::Vec3b(255, 0, 0));
    SegmentationResult r = segment_particles(hsvOf(rgb), red, ToleranceSet{ 5, 20, 20, 0 }, cv::Mat(), SegmentationParams());
    ASSERT_EQ(r.status, SegStatus::OK);
    ASSERT_EQ(r.particles.size(), 1u);
    EXPECT_EQ(r.particles[0].area, 100);
    EXPECT_NEAR(r.particles[0].centroid.x, 9.5, 1e-6);
    EXPECT_NEAR(r.particles[0].centroid.y, 9.5, 1e-6);
}

TEST(SegmentParticlesTest, CutMaskSplitsParticle) {
    cv::Mat rgb(20, 40, CV_8UC3, cv::Scalar(0, 0, 0));
    rgb(cv::Rect(0, 5, 40, 10)).setTo(cv::Scalar(0, 0, 255));
    cv::Mat cut = cv::Mat::zeros(rgb.size(), CV_8U);
    cut.col(19).setTo(255);
    cut.col(20).setTo(255);

    HsvColor blue = rgb_to_hsv(cv::Vec3b(0, 0, 255));
    SegmentationResult r = segment_particles(hsvOf(rgb), blue, ToleranceSet{ 5, 20, 20, 0 }, cut, SegmentationParams());
    ASSERT_EQ(r.particles.size(), 2u);
    EXPECT_EQ(r.particles[0].area, 190);
    EXPECT_EQ(r.particles[1].area, 190);
    EXPECT_EQ(r.mask.at<uchar>(10, 19), 0);
}

TEST(SegmentParticlesTest, NothingInToleranceIsNoParticles) {
    cv::Mat rgb(8, 8, CV_8UC3, cv::Scalar(0, 255, 0));
    HsvColor red = rgb_to_hsv(cv::Vec3b(255, 0, 0));
    SegmentationResult r = segment_particles(hsvOf(rgb), red, ToleranceSet{ 5, 20, 20, 0 }, cv::Mat(), SegmentationParams());
    EXPECT_EQ(r.status, SegStatus::NO_PARTICLES);
    EXPECT_TRUE(r.particles.empty());
    EXPECT_STREQ(status_to_cstr(r.status), "NO_PARTICLES");
}
