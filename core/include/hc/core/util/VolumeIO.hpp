#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace hc {
class Volume;
}

namespace hc::core::util {

enum class RawType { UInt8, Int16, UInt16, Int32, Float32 };

// "uint8", "int16", "uint16", "int32", "float32"; throws IOError otherwise
RawType parse_raw_type(const std::string& name);

struct RawLayout {
    cv::Vec3i dims{0, 0, 0};
    RawType type = RawType::Int16;
    cv::Vec3d spacing{1, 1, 1};
};

// True for the medical image formats read by load_image(): .nii, .nii.gz,
// .nrrd, .nhdr, .mha and .mhd
bool is_image_file(const std::filesystem::path& path);

// Reads a 3D image through ITK. Voxels are cast to int32, spacing and origin
// are taken from the file. Only the first 3D volume of a 4D series is read.
std::shared_ptr<Volume> load_image(const std::filesystem::path& path);

// Headerless little-endian voxels, x fastest; file size must match layout
std::shared_ptr<Volume> load_raw(const std::filesystem::path& path, const RawLayout& layout);

// Image files go to load_image(), anything else needs a raw layout
std::shared_ptr<Volume> load_volume(const std::filesystem::path& path,
                                    const std::optional<RawLayout>& raw = std::nullopt);

}  // namespace hc::core::util
