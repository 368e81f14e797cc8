#include "hc/core/types/SliceTransform.hpp"

#include <cmath>

#include "hc/core/types/Volume.hpp"
#include "hc/core/util/Exceptions.hpp"

namespace hc {

static double deg2rad(int degrees)
{
    return degrees * CV_PI / 180.0;
}

static int axisIndex(SliceTransform::Axis axis)
{
    switch (axis) {
        case SliceTransform::Axis::X: return 0;
        case SliceTransform::Axis::Y: return 1;
        case SliceTransform::Axis::Z: return 2;
    }
    return 0;
}

static const char* axisName(SliceTransform::Axis axis)
{
    switch (axis) {
        case SliceTransform::Axis::X: return "x";
        case SliceTransform::Axis::Y: return "y";
        case SliceTransform::Axis::Z: return "z";
    }
    return "?";
}

SliceTransform::SliceTransform(const Volume& volume)
    : depth_(volume.numSlices()), center_(volume.center())
{
    update();
}

int SliceTransform::angle(Axis axis) const
{
    return theta_[axisIndex(axis)];
}

void SliceTransform::setAngle(Axis axis, int degrees)
{
    if (degrees < kMinAngle || degrees > kMaxAngle) {
        throw OutOfRange(std::string("Rotation about ") + axisName(axis) + " of " +
                         std::to_string(degrees) + " degrees outside [" +
                         std::to_string(kMinAngle) + ", " + std::to_string(kMaxAngle) + "]");
    }
    theta_[axisIndex(axis)] = degrees;
    update();
}

void SliceTransform::setAngles(int x, int y, int z)
{
    for (int v : {x, y, z}) {
        if (v < kMinAngle || v > kMaxAngle) {
            throw OutOfRange("Rotation of " + std::to_string(v) + " degrees outside [" +
                             std::to_string(kMinAngle) + ", " + std::to_string(kMaxAngle) + "]");
        }
    }
    theta_ = {x, y, z};
    update();
}

void SliceTransform::setSliceIndex(int index)
{
    if (index < 0 || index >= depth_) {
        throw OutOfRange("Slice index " + std::to_string(index) + " outside [0, " +
                         std::to_string(depth_) + ")");
    }
    slice_ = index;
}

void SliceTransform::reset()
{
    theta_ = {0, 0, 0};
    slice_ = 0;
    update();
}

// R = Rz * Rx * Ry, recomputed from scratch from the integer angles so that
// returning to a previous setting reproduces the previous matrix exactly
void SliceTransform::update()
{
    const double ax = deg2rad(theta_[0]);
    const double ay = deg2rad(theta_[1]);
    const double az = deg2rad(theta_[2]);

    const double cx = std::cos(ax), sx = std::sin(ax);
    const double cy = std::cos(ay), sy = std::sin(ay);
    const double cz = std::cos(az), sz = std::sin(az);

    const cv::Matx33d rx(1, 0, 0,
                         0, cx, -sx,
                         0, sx, cx);
    const cv::Matx33d ry(cy, 0, sy,
                         0, 1, 0,
                         -sy, 0, cy);
    const cv::Matx33d rz(cz, -sz, 0,
                         sz, cz, 0,
                         0, 0, 1);

    _M = rz * rx * ry;
    _T = center_ - _M * center_;
}

std::string SliceTransform::describe() const
{
    return std::to_string(theta_[0]) + "_" + std::to_string(theta_[1]) + "_" +
           std::to_string(theta_[2]) + "_" + std::to_string(slice_);
}

bool SliceTransform::operator==(const SliceTransform& other) const
{
    return theta_ == other.theta_ && slice_ == other.slice_ && depth_ == other.depth_ &&
           center_ == other.center_;
}

}  // namespace hc
