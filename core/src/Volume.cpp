#include "hc/core/types/Volume.hpp"

#include "hc/core/util/Exceptions.hpp"

namespace hc {

Volume::Volume(const cv::Vec3i& dims,
               std::vector<std::int32_t> voxels,
               const cv::Vec3d& spacing,
               const cv::Vec3d& origin,
               std::string name)
    : _width(dims[0]),
      _height(dims[1]),
      _slices(dims[2]),
      voxels_(std::move(voxels)),
      spacing_(spacing),
      origin_(origin),
      name_(std::move(name))
{
    if (_width <= 0 || _height <= 0 || _slices <= 0) {
        throw Error("Volume dimensions must be positive");
    }
    const auto expected = static_cast<std::size_t>(_width) * _height * _slices;
    if (voxels_.size() != expected) {
        throw Error("Voxel count " + std::to_string(voxels_.size()) +
                    " does not match dimensions (expected " +
                    std::to_string(expected) + ")");
    }
    for (int i = 0; i < 3; i++) {
        if (!(spacing_[i] > 0)) {
            throw Error("Volume spacing must be positive");
        }
    }
}

std::shared_ptr<Volume> Volume::New(const cv::Vec3i& dims,
                                    std::vector<std::int32_t> voxels,
                                    const cv::Vec3d& spacing,
                                    const cv::Vec3d& origin,
                                    std::string name)
{
    return std::make_shared<Volume>(dims, std::move(voxels), spacing, origin, std::move(name));
}

int Volume::sliceWidth() const { return _width; }
int Volume::sliceHeight() const { return _height; }
int Volume::numSlices() const { return _slices; }
cv::Vec3i Volume::dims() const { return {_width, _height, _slices}; }
cv::Vec3d Volume::spacing() const { return spacing_; }
cv::Vec3d Volume::origin() const { return origin_; }
const std::string& Volume::name() const { return name_; }

cv::Vec3d Volume::center() const
{
    return indexToPhysical({(_width - 1) / 2.0, (_height - 1) / 2.0, (_slices - 1) / 2.0});
}

cv::Vec3d Volume::indexToPhysical(const cv::Vec3d& index) const
{
    return {origin_[0] + spacing_[0] * index[0],
            origin_[1] + spacing_[1] * index[1],
            origin_[2] + spacing_[2] * index[2]};
}

cv::Vec3d Volume::physicalToIndex(const cv::Vec3d& point) const
{
    return {(point[0] - origin_[0]) / spacing_[0],
            (point[1] - origin_[1]) / spacing_[1],
            (point[2] - origin_[2]) / spacing_[2]};
}

cv::Mat_<std::int32_t> Volume::slice(int z) const
{
    if (z < 0 || z >= _slices) {
        throw OutOfRange("Slice " + std::to_string(z) + " outside [0, " +
                         std::to_string(_slices) + ")");
    }
    cv::Mat_<std::int32_t> plane(_height, _width);
    for (int y = 0; y < _height; y++) {
        for (int x = 0; x < _width; x++) {
            plane(y, x) = at(x, y, z);
        }
    }
    return plane;
}

}  // namespace hc
