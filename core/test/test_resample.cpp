#include <gtest/gtest.h>

#include <vector>

#include "hc/core/types/SliceTransform.hpp"
#include "hc/core/util/Diffusion.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Slicing.hpp"

#include "SyntheticVolumes.hpp"

using namespace hc;
using namespace hc::core::util;

namespace {

bool sameMat(const cv::Mat& a, const cv::Mat& b)
{
    return a.size() == b.size() && a.type() == b.type() && cv::countNonZero(a != b) == 0;
}

}  // namespace

TEST(Resample, ZeroRotationReturnsOriginalPlane)
{
    auto vol = test::make_volume({7, 5, 4}, [](int x, int y, int z) { return x + 10 * y + 100 * z; },
                                 {0.9375, 0.9375, 1.2});
    SliceTransform t(*vol);

    for (int z = 0; z < 4; z++) {
        t.setSliceIndex(z);
        Slice2D s = resample(*vol, t);
        ASSERT_EQ(s.type(), CV_32S);
        ASSERT_EQ(s.rows, 5);
        ASSERT_EQ(s.cols, 7);
        EXPECT_TRUE(sameMat(s, vol->slice(z))) << "slice " << z;
    }
}

TEST(Resample, QuarterTurnAboutZMovesVoxels)
{
    // marker one voxel right of the center, center is (2, 2, 1)
    auto vol = test::make_volume({5, 5, 3}, [](int x, int y, int z) {
        return x == 3 && y == 2 && z == 1 ? 100 : 0;
    });
    SliceTransform t(*vol);
    t.setThetaZ(90);
    t.setSliceIndex(1);

    cv::Mat_<int> s = resample(*vol, t);
    EXPECT_EQ(s(1, 2), 100);
    EXPECT_EQ(cv::countNonZero(s), 1);
}

TEST(Resample, SamplesOutsideVolumeAreZero)
{
    auto vol = test::make_volume({21, 21, 3}, [](int, int, int) { return 7; });
    SliceTransform t(*vol);
    t.setThetaZ(45);
    t.setSliceIndex(1);

    cv::Mat_<int> s = resample(*vol, t);
    EXPECT_EQ(s(10, 10), 7);
    EXPECT_EQ(s(0, 0), 0);
    EXPECT_EQ(s(20, 20), 0);
    EXPECT_EQ(s(0, 20), 0);
}

TEST(Resample, LinearInterpolationRoundsToNearest)
{
    auto vol = test::make_volume({3, 3, 3}, [](int x, int, int) { return x * 11; });
    // between x = 0 and x = 1 at 30% -> 3.3 -> 3
    EXPECT_NEAR(sample_trilinear(*vol, {0.3, 1, 1}), 3.3, 1e-12);
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {2.4, 1, 1}), 22.0);
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {-0.6, 1, 1}), 0.0);
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {1, 1, 2.6}), 0.0);
    // the outer half-voxel face is still inside on both sides
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {2.5, 1, 1}), 22.0);
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {1, -0.5, 1}), 11.0);
    EXPECT_DOUBLE_EQ(sample_trilinear(*vol, {1, 1, 2.5}), 11.0);
}

TEST(Resample, RejectsStateFromAnotherVolume)
{
    auto deep = test::square_volume(8, 10, 1, 1, 3);
    auto shallow = test::square_volume(8, 4, 1, 1, 3);
    SliceTransform t(*deep);
    t.setSliceIndex(8);

    EXPECT_THROW(resample(*shallow, t), ResampleError);
}

TEST(Resample, SourceVolumeIsNotModified)
{
    auto vol = test::disc_volume(32, 3, 10);
    const std::vector<std::int32_t> before(vol->data(), vol->data() + vol->numVoxels());

    SliceTransform t(*vol);
    t.setAngles(20, -35, 50);
    t.setSliceIndex(1);
    (void)resample(*vol, t, true);

    const std::vector<std::int32_t> after(vol->data(), vol->data() + vol->numVoxels());
    EXPECT_EQ(before, after);
}

TEST(Resample, SmoothingReturnsDoublePlane)
{
    auto vol = test::disc_volume(32, 3, 10);
    SliceTransform t(*vol);
    t.setSliceIndex(1);

    Slice2D s = resample(*vol, t, true);
    EXPECT_EQ(s.type(), CV_64F);
    EXPECT_EQ(s.size(), cv::Size(32, 32));

    Slice2D raw = resample(*vol, t, false);
    EXPECT_EQ(raw.type(), CV_32S);
}

TEST(Diffusion, FlatImageIsUnchanged)
{
    cv::Mat img(16, 16, CV_32S, cv::Scalar(42));
    cv::Mat out = anisotropic_diffusion(img);
    ASSERT_EQ(out.type(), CV_64F);
    double lo, hi;
    cv::minMaxLoc(out, &lo, &hi);
    EXPECT_DOUBLE_EQ(lo, 42.0);
    EXPECT_DOUBLE_EQ(hi, 42.0);
}

TEST(Diffusion, SmoothsNoiseAndKeepsStrongEdge)
{
    // step edge with a single-pixel spike on the low side
    cv::Mat_<double> img(20, 20, 0.0);
    img(cv::Rect(10, 0, 10, 20)).setTo(1000.0);
    img(5, 4) = 60.0;

    DiffusionParams params;
    params.iterations = 10;
    cv::Mat_<double> out = anisotropic_diffusion(img, params);

    EXPECT_LT(out(5, 4), 60.0);
    // the step survives: the two sides stay far apart
    EXPECT_GT(out(10, 15) - out(10, 4), 800.0);
}

TEST(Diffusion, FinerSpacingDiffusesLess)
{
    cv::Mat_<double> img(20, 20, 0.0);
    img(cv::Rect(10, 0, 10, 20)).setTo(1000.0);
    img(5, 4) = 60.0;

    DiffusionParams params;
    params.time_step = 0.0625;
    cv::Mat_<double> unit = anisotropic_diffusion(img, params, {1.0, 1.0});
    cv::Mat_<double> coarse = anisotropic_diffusion(img, params, {2.0, 2.0});

    // the same step in image units is a smaller physical gradient on a
    // coarser grid, so the spike loses less
    EXPECT_LT(unit(5, 4), coarse(5, 4));
    EXPECT_NE(cv::norm(unit, coarse, cv::NORM_INF), 0.0);
}

TEST(Diffusion, ZeroIterationsOnlyConverts)
{
    cv::Mat_<int> img(4, 4, 3);
    img(1, 1) = 9;
    DiffusionParams params;
    params.iterations = 0;
    cv::Mat_<double> out = anisotropic_diffusion(img, params);
    EXPECT_DOUBLE_EQ(out(1, 1), 9.0);
    EXPECT_DOUBLE_EQ(out(0, 0), 3.0);
}
