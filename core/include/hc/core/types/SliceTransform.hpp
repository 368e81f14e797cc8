#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace hc {

class Volume;

// Rotation and slice selection for one volume.
//
// The derived rigid transform maps a point p of the resampled (output) grid to
// the input grid as  R * (p - c) + c,  where c is the physical center of the
// volume and R = Rz * Rx * Ry. R is recomputed by every angle mutator, so it
// always matches thetaX/Y/Z.
class SliceTransform
{
public:
    enum class Axis { X, Y, Z };

    static constexpr int kMinAngle = -90;
    static constexpr int kMaxAngle = 90;

    SliceTransform() = delete;
    explicit SliceTransform(const Volume& volume);

    [[nodiscard]] int thetaX() const { return theta_[0]; }
    [[nodiscard]] int thetaY() const { return theta_[1]; }
    [[nodiscard]] int thetaZ() const { return theta_[2]; }
    [[nodiscard]] int angle(Axis axis) const;
    [[nodiscard]] int sliceIndex() const { return slice_; }
    [[nodiscard]] int numSlices() const { return depth_; }
    [[nodiscard]] cv::Vec3d center() const { return center_; }

    // throws OutOfRange outside [kMinAngle, kMaxAngle]; state is unchanged then
    void setAngle(Axis axis, int degrees);
    void setThetaX(int degrees) { setAngle(Axis::X, degrees); }
    void setThetaY(int degrees) { setAngle(Axis::Y, degrees); }
    void setThetaZ(int degrees) { setAngle(Axis::Z, degrees); }
    void setAngles(int x, int y, int z);

    // throws OutOfRange outside [0, numSlices())
    void setSliceIndex(int index);

    void reset();

    [[nodiscard]] const cv::Matx33d& rotation() const { return _M; }
    [[nodiscard]] const cv::Vec3d& offset() const { return _T; }
    [[nodiscard]] cv::Vec3d apply(const cv::Vec3d& point) const { return _M * point + _T; }

    // "<tx>_<ty>_<tz>_<slice>"
    [[nodiscard]] std::string describe() const;

    bool operator==(const SliceTransform& other) const;
    bool operator!=(const SliceTransform& other) const { return !(*this == other); }

protected:
    void update();

    cv::Vec3i theta_{0, 0, 0};
    int slice_{0};
    int depth_{0};
    cv::Vec3d center_;
    cv::Matx33d _M;
    cv::Vec3d _T;
};

}  // namespace hc
