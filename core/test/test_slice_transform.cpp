#include <gtest/gtest.h>

#include "hc/core/types/SliceTransform.hpp"
#include "hc/core/util/Exceptions.hpp"

#include "SyntheticVolumes.hpp"

using hc::SliceTransform;

namespace {

void expectVecNear(const cv::Vec3d& a, const cv::Vec3d& b, double tol = 1e-9)
{
    for (int i = 0; i < 3; i++) {
        EXPECT_NEAR(a[i], b[i], tol) << "component " << i;
    }
}

}  // namespace

TEST(SliceTransform, StartsAtZeroWithIdentityRotation)
{
    auto vol = hc::test::square_volume(9, 7, 2, 2, 4);
    SliceTransform t(*vol);

    EXPECT_EQ(t.thetaX(), 0);
    EXPECT_EQ(t.thetaY(), 0);
    EXPECT_EQ(t.thetaZ(), 0);
    EXPECT_EQ(t.sliceIndex(), 0);
    EXPECT_EQ(t.numSlices(), 7);
    EXPECT_EQ(t.rotation(), cv::Matx33d::eye());
    EXPECT_EQ(t.offset(), cv::Vec3d(0, 0, 0));
}

TEST(SliceTransform, PivotIsVolumeCenter)
{
    auto vol = hc::test::make_volume({10, 6, 4}, [](int, int, int) { return 0; }, {0.5, 2.0, 1.5});
    SliceTransform t(*vol);
    expectVecNear(t.center(), {2.25, 5.0, 2.25});

    t.setAngles(30, -45, 60);
    expectVecNear(t.apply(t.center()), t.center());
}

TEST(SliceTransform, RotationAboutZ)
{
    auto vol = hc::test::square_volume(5, 5, 0, 0, 1);
    SliceTransform t(*vol);
    t.setThetaZ(90);

    const cv::Vec3d c = t.center();
    expectVecNear(t.apply(c + cv::Vec3d(1, 0, 0)), c + cv::Vec3d(0, 1, 0));
    expectVecNear(t.apply(c + cv::Vec3d(0, 0, 1)), c + cv::Vec3d(0, 0, 1));
}

TEST(SliceTransform, RotationOrderIsZXY)
{
    auto vol = hc::test::square_volume(5, 5, 0, 0, 1);
    SliceTransform t(*vol);
    t.setAngles(90, 90, 0);

    // Ry first: x -> -z, then Rx: -z -> y
    const cv::Vec3d c = t.center();
    expectVecNear(t.apply(c + cv::Vec3d(1, 0, 0)), c + cv::Vec3d(0, 1, 0));
}

TEST(SliceTransform, RejectsAnglesOutsideDomain)
{
    auto vol = hc::test::square_volume(5, 5, 0, 0, 1);
    SliceTransform t(*vol);
    t.setThetaY(20);
    const auto before = t.rotation();

    EXPECT_THROW(t.setThetaX(91), hc::OutOfRange);
    EXPECT_THROW(t.setThetaY(-91), hc::OutOfRange);
    EXPECT_THROW(t.setAngle(SliceTransform::Axis::Z, 180), hc::OutOfRange);
    EXPECT_THROW(t.setAngles(0, 0, 100), hc::OutOfRange);

    EXPECT_EQ(t.thetaX(), 0);
    EXPECT_EQ(t.thetaY(), 20);
    EXPECT_EQ(t.thetaZ(), 0);
    EXPECT_EQ(t.rotation(), before);

    EXPECT_NO_THROW(t.setThetaX(-90));
    EXPECT_NO_THROW(t.setThetaX(90));
}

TEST(SliceTransform, SliceIndexBounds)
{
    auto vol = hc::test::square_volume(5, 4, 0, 0, 1);
    SliceTransform t(*vol);

    t.setSliceIndex(3);
    EXPECT_EQ(t.sliceIndex(), 3);
    EXPECT_THROW(t.setSliceIndex(4), hc::OutOfRange);
    EXPECT_THROW(t.setSliceIndex(-1), hc::OutOfRange);
    EXPECT_EQ(t.sliceIndex(), 3);
}

TEST(SliceTransform, ReturningToZeroRestoresExactTransform)
{
    auto vol = hc::test::square_volume(11, 9, 0, 0, 1);
    SliceTransform fresh(*vol);
    SliceTransform t(*vol);

    for (int a = -90; a <= 90; a += 15) {
        t.setAngles(a, -a, a / 2);
    }
    t.setAngles(0, 0, 0);

    EXPECT_EQ(t.rotation(), fresh.rotation());
    EXPECT_EQ(t.offset(), fresh.offset());
    EXPECT_EQ(t, fresh);
}

TEST(SliceTransform, ResetZeroesEverything)
{
    auto vol = hc::test::square_volume(5, 5, 0, 0, 1);
    SliceTransform t(*vol);
    t.setAngles(10, 20, 30);
    t.setSliceIndex(2);
    EXPECT_EQ(t.describe(), "10_20_30_2");

    t.reset();
    EXPECT_EQ(t.describe(), "0_0_0_0");
    EXPECT_EQ(t.rotation(), cv::Matx33d::eye());
}

TEST(SliceTransform, AngleAccessorMatchesSetter)
{
    auto vol = hc::test::square_volume(5, 5, 0, 0, 1);
    SliceTransform t(*vol);
    t.setAngle(SliceTransform::Axis::Y, -33);
    EXPECT_EQ(t.angle(SliceTransform::Axis::Y), -33);
    EXPECT_EQ(t.thetaY(), -33);
}
