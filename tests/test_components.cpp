#include <gtest/gtest.h>
#include "components.hpp"
#include <opencv2/core.hpp>
#include <set>

TEST(ExtractComponentsTest, FullMaskIsOneComponentAtCenter) {
    cv::Mat mask(30, 50, CV_8U, cv::Scalar(255));
    ComponentResult r = extract_components(mask, 0);
    ASSERT_EQ(r.particles.size(), 1u);
    EXPECT_EQ(r.particles[0].rank, 1);
    EXPECT_EQ(r.particles[0].area, 30 * 50);
    EXPECT_NEAR(r.particles[0].centroid.x, 24.5, 1e-6);
    EXPECT_NEAR(r.particles[0].centroid.y, 14.5, 1e-6);
    EXPECT_EQ(cv::countNonZero(r.labels == 1), 30 * 50);
}

TEST(ExtractComponentsTest, EmptyMaskIsNormalResult) {
    cv::Mat mask = cv::Mat::zeros(10, 10, CV_8U);
    ComponentResult r = extract_components(mask, 0);
    EXPECT_TRUE(r.particles.empty());
    ASSERT_EQ(r.labels.type(), CV_32S);
    EXPECT_EQ(r.labels.size(), mask.size());
    EXPECT_EQ(cv::countNonZero(r.labels), 0);
}

TEST(ExtractComponentsTest, MinAreaDropsSmallAndErasesFromMask) {
    cv::Mat mask = cv::Mat::zeros(40, 40, CV_8U);
    mask(cv::Rect(1, 1, 5, 1)).setTo(255);     // area 5
    mask(cv::Rect(10, 10, 10, 5)).setTo(255);  // area 50

    ComponentResult r = extract_components(mask, 10);
    ASSERT_EQ(r.particles.size(), 1u);
    EXPECT_EQ(r.particles[0].area, 50);
    EXPECT_EQ(cv::countNonZero(mask), 50);
    EXPECT_EQ(mask.at<uchar>(1, 3), 0);
    EXPECT_EQ(r.labels.at<int>(1, 3), 0);
    EXPECT_EQ(r.labels.at<int>(12, 12), 1);
}

TEST(ExtractComponentsTest, RanksAreContiguousAndDescending) {
    cv::Mat mask = cv::Mat::zeros(60, 60, CV_8U);
    mask(cv::Rect(0, 0, 3, 3)).setTo(255);     // 9
    mask(cv::Rect(10, 0, 8, 8)).setTo(255);    // 64
    mask(cv::Rect(30, 30, 5, 4)).setTo(255);   // 20
    mask(cv::Rect(0, 40, 2, 2)).setTo(255);    // 4
    mask(cv::Rect(45, 5, 10, 10)).setTo(255);  // 100

    ComponentResult r = extract_components(mask, 0);
    ASSERT_EQ(r.particles.size(), 5u);
    for (size_t i = 0; i < r.particles.size(); ++i) {
        EXPECT_EQ(r.particles[i].rank, (int)i + 1);
        if (i > 0) EXPECT_GE(r.particles[i - 1].area, r.particles[i].area);
    }
    EXPECT_EQ(r.particles[0].area, 100);
    EXPECT_EQ(r.particles[4].area, 4);

    double minv, maxv;
    cv::minMaxLoc(r.labels, &minv, &maxv);
    EXPECT_EQ((int)maxv, 5);
    std::set<int> seen;
    for (int y = 0; y < r.labels.rows; ++y)
        for (int x = 0; x < r.labels.cols; ++x) seen.insert(r.labels.at<int>(y, x));
    EXPECT_EQ(seen, (std::set<int>{ 0, 1, 2, 3, 4, 5 }));

    // label 1 sits on the 10x10 block
    EXPECT_EQ(r.labels.at<int>(10, 50), 1);
    EXPECT_NEAR(r.particles[0].centroid.x, 49.5, 1e-6);
    EXPECT_NEAR(r.particles[0].centroid.y, 9.5, 1e-6);
}

TEST(ExtractComponentsTest, TiesKeepScanOrder) {
    cv::Mat mask = cv::Mat::zeros(10, 30, CV_8U);
    mask(cv::Rect(20, 2, 2, 2)).setTo(255);
    mask(cv::Rect(2, 6, 2, 2)).setTo(255);
    mask(cv::Rect(10, 0, 2, 2)).setTo(255);

    ComponentResult r = extract_components(mask, 0);
    ASSERT_EQ(r.particles.size(), 3u);
    // raster scan meets (10,0) first, then (20,2), then (2,6)
    EXPECT_EQ(r.labels.at<int>(0, 10), 1);
    EXPECT_EQ(r.labels.at<int>(2, 20), 2);
    EXPECT_EQ(r.labels.at<int>(6, 2), 3);
}

TEST(ExtractComponentsTest, ConnectivityDecidesDiagonals) {
    cv::Mat mask = cv::Mat::zeros(5, 5, CV_8U);
    mask.at<uchar>(1, 1) = 255;
    mask.at<uchar>(2, 2) = 255;
    mask.at<uchar>(3, 3) = 255;

    cv::Mat m4 = mask.clone();
    EXPECT_EQ(extract_components(m4, 0, 4).particles.size(), 3u);
    cv::Mat m8 = mask.clone();
    ComponentResult r8 = extract_components(m8, 0, 8);
    ASSERT_EQ(r8.particles.size(), 1u);
    EXPECT_EQ(r8.particles[0].area, 3);
    EXPECT_NEAR(r8.particles[0].centroid.x, 2.0, 1e-6);
}

TEST(ExtractComponentsTest, Idempotent) {
    cv::Mat mask = cv::Mat::zeros(50, 50, CV_8U);
    cv::RNG rng(7);
    for (int i = 0; i < 400; ++i) mask.at<uchar>(rng.uniform(0, 50), rng.uniform(0, 50)) = 255;

    cv::Mat m1 = mask.clone();
    ComponentResult a = extract_components(m1, 2);
    cv::Mat m2 = mask.clone();
    ComponentResult b = extract_components(m2, 2);

    ASSERT_EQ(a.particles.size(), b.particles.size());
    for (size_t i = 0; i < a.particles.size(); ++i) {
        EXPECT_EQ(a.particles[i].area, b.particles[i].area);
        EXPECT_DOUBLE_EQ(a.particles[i].centroid.x, b.particles[i].centroid.x);
        EXPECT_DOUBLE_EQ(a.particles[i].centroid.y, b.particles[i].centroid.y);
    }
    EXPECT_EQ(cv::countNonZero(a.labels != b.labels), 0);
}

TEST(ExtractComponentsTest, RejectsBadConnectivity) {
    cv::Mat mask = cv::Mat::zeros(5, 5, CV_8U);
    EXPECT_THROW(extract_components(mask, 0, 6), cv::Exception);
}
