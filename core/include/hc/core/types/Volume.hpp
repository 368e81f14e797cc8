#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace hc {

// Immutable 3D grid of integer intensities, x fastest, then y, then z.
// Physical geometry uses identity direction cosines:
//   physical = origin + spacing * index (per axis)
class Volume
{
public:
    Volume() = delete;

    Volume(const cv::Vec3i& dims,
           std::vector<std::int32_t> voxels,
           const cv::Vec3d& spacing = {1, 1, 1},
           const cv::Vec3d& origin = {0, 0, 0},
           std::string name = "");

    ~Volume() = default;

    static std::shared_ptr<Volume> New(const cv::Vec3i& dims,
                                       std::vector<std::int32_t> voxels,
                                       const cv::Vec3d& spacing = {1, 1, 1},
                                       const cv::Vec3d& origin = {0, 0, 0},
                                       std::string name = "");

    [[nodiscard]] int sliceWidth() const;
    [[nodiscard]] int sliceHeight() const;
    [[nodiscard]] int numSlices() const;
    [[nodiscard]] cv::Vec3i dims() const;
    [[nodiscard]] cv::Vec3d spacing() const;
    [[nodiscard]] cv::Vec3d origin() const;
    [[nodiscard]] const std::string& name() const;

    // rotation pivot: the physical point at continuous index (n - 1) / 2
    [[nodiscard]] cv::Vec3d center() const;

    [[nodiscard]] cv::Vec3d indexToPhysical(const cv::Vec3d& index) const;
    [[nodiscard]] cv::Vec3d physicalToIndex(const cv::Vec3d& point) const;

    // no bounds check
    [[nodiscard]] std::int32_t at(int x, int y, int z) const
    {
        return voxels_[(static_cast<std::size_t>(z) * _height + y) * _width + x];
    }
    [[nodiscard]] const std::int32_t* data() const { return voxels_.data(); }
    [[nodiscard]] std::size_t numVoxels() const { return voxels_.size(); }

    // axis-aligned plane z, rows = height, cols = width
    [[nodiscard]] cv::Mat_<std::int32_t> slice(int z) const;

protected:
    int _width{0};
    int _height{0};
    int _slices{0};

    std::vector<std::int32_t> voxels_;
    cv::Vec3d spacing_;
    cv::Vec3d origin_;
    std::string name_;
};

}  // namespace hc
