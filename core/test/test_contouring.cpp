#include <gtest/gtest.h>

#include <cmath>

#include <opencv2/imgproc.hpp>

#include "hc/core/util/Contouring.hpp"

using namespace hc::core::util;

namespace {

cv::Mat_<int> blank(int rows, int cols)
{
    return cv::Mat_<int>(rows, cols, 0);
}

}  // namespace

TEST(Contouring, SquareGivesItsCorners)
{
    auto img = blank(30, 40);
    img(cv::Rect(5, 8, 12, 10)).setTo(500);  // x 5..16, y 8..17

    ContourExtractor extractor;
    auto result = extractor.run(img);

    ASSERT_TRUE(result.valid());
    EXPECT_EQ(result.numContours, 1u);
    ASSERT_EQ(result.contour.size(), 4u);
    for (const auto& p : result.contour) {
        EXPECT_TRUE(p.x == 5 || p.x == 16) << p;
        EXPECT_TRUE(p.y == 8 || p.y == 17) << p;
    }
}

TEST(Contouring, MaskIsTransposedToVolumeOrientation)
{
    auto img = blank(30, 40);
    img(cv::Rect(5, 8, 12, 10)).setTo(500);

    auto result = ContourExtractor().run(img);
    ASSERT_EQ(result.mask.rows, 40);  // width
    ASSERT_EQ(result.mask.cols, 30);  // height

    EXPECT_EQ(result.mask(5, 8), 1);
    EXPECT_EQ(result.mask(16, 17), 1);
    EXPECT_EQ(result.mask(17, 8), 0);
    EXPECT_EQ(result.mask(8, 5), 0);
    EXPECT_EQ(cv::countNonZero(result.mask), 12 * 10);

    for (const auto& p : result.contour) {
        EXPECT_EQ(result.mask(p.x, p.y), 1) << p;
    }
}

TEST(Contouring, MaskIsBinary)
{
    cv::Mat_<int> img(40, 40);
    cv::randu(img, 0, 1600);
    auto result = ContourExtractor(1000).run(img);
    double lo, hi;
    cv::minMaxLoc(result.mask, &lo, &hi);
    EXPECT_GE(lo, 0.0);
    EXPECT_LE(hi, 1.0);
}

TEST(Contouring, AllZeroSliceIsEmptyNotAnError)
{
    auto img = blank(25, 25);
    ContourExtraction result;
    ASSERT_NO_THROW(result = ContourExtractor().run(img));
    EXPECT_TRUE(result.valid());
    EXPECT_TRUE(result.contour.empty());
    EXPECT_EQ(result.numContours, 0u);
    EXPECT_EQ(cv::countNonZero(result.mask), 0);

    auto contour = extract_contour(img);
    ASSERT_TRUE(contour.has_value());
    EXPECT_TRUE(contour->empty());
}

TEST(Contouring, ConstantSliceIsEmpty)
{
    cv::Mat_<int> img(10, 12, 345);
    auto contour = extract_contour(img);
    ASSERT_TRUE(contour.has_value());
    EXPECT_TRUE(contour->empty());
}

TEST(Contouring, SmallIslandsAreDropped)
{
    auto img = blank(60, 60);
    cv::circle(img, {30, 30}, 15, cv::Scalar(900), cv::FILLED);
    img(cv::Rect(2, 2, 3, 3)).setTo(900);
    img(55, 50) = 900;

    auto result = ContourExtractor().run(img);
    ASSERT_TRUE(result.valid());
    EXPECT_EQ(result.numContours, 1u);
    for (const auto& p : result.contour) {
        EXPECT_GT(p.x, 10);
        EXPECT_GT(p.y, 10);
    }
}

TEST(Contouring, SelectsOuterBoundaryOfRing)
{
    auto img = blank(80, 80);
    cv::circle(img, {40, 40}, 30, cv::Scalar(700), cv::FILLED);
    cv::circle(img, {40, 40}, 15, cv::Scalar(0), cv::FILLED);

    auto result = ContourExtractor().run(img);
    ASSERT_TRUE(result.valid());
    EXPECT_EQ(result.numContours, 2u);
    ASSERT_FALSE(result.contour.empty());
    for (const auto& p : result.contour) {
        const double d = std::hypot(p.x - 40.0, p.y - 40.0);
        EXPECT_GT(d, 27.0) << p;
    }
}

TEST(Contouring, ManyHolesMakeTheSliceInvalid)
{
    auto img = blank(60, 60);
    img(cv::Rect(5, 5, 50, 50)).setTo(1000);
    // 3 x 3 grid of holes: 1 outer + 9 holes = 10 contours
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            img(cv::Rect(12 + 14 * i, 12 + 14 * j, 4, 4)).setTo(0);
        }
    }

    auto result = ContourExtractor().run(img);
    EXPECT_EQ(result.numContours, 10u);
    EXPECT_FALSE(result.valid());
    EXPECT_TRUE(result.contour.empty());
    EXPECT_FALSE(extract_contour(img).has_value());

    // a higher limit accepts the same slice
    auto relaxed = ContourExtractor(11).run(img);
    EXPECT_TRUE(relaxed.valid());
    EXPECT_EQ(relaxed.contour.size(), 4u);
}

TEST(Contouring, OtsuSplitsBimodalIntensities)
{
    auto img = blank(40, 40);
    cv::Mat_<int> noise(40, 40);
    cv::RNG rng(7);
    rng.fill(noise, cv::RNG::UNIFORM, 0, 100);
    img += noise;
    cv::Mat roi = img(cv::Rect(10, 10, 20, 20));
    roi += cv::Scalar(1000);

    auto result = ContourExtractor().run(img);
    ASSERT_TRUE(result.valid());
    EXPECT_EQ(cv::countNonZero(result.mask), 400);
    EXPECT_GT(result.otsuLevel, 20.0);
    EXPECT_LT(result.otsuLevel, 240.0);
}

TEST(Contouring, RepeatedRunsAreIdentical)
{
    cv::Mat_<int> img(50, 50);
    cv::RNG rng(3);
    rng.fill(img, cv::RNG::UNIFORM, 0, 300);
    cv::circle(img, {25, 25}, 18, cv::Scalar(1200), cv::FILLED);

    auto a = ContourExtractor().run(img);
    auto b = ContourExtractor().run(img);
    EXPECT_EQ(a.contour, b.contour);
    EXPECT_EQ(a.numContours, b.numContours);
    EXPECT_EQ(cv::countNonZero(a.mask != b.mask), 0);
}

TEST(Contouring, RejectsEmptyInput)
{
    EXPECT_ANY_THROW(ContourExtractor().run(cv::Mat()));
    EXPECT_ANY_THROW(ContourExtractor(0));
}
