#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

#include "hc/core/util/Contouring.hpp"

namespace hc {
struct VolumeEntry;
}

namespace hc::core::util {

// "rrggbb" hex or a basic color name (red, green, blue, ...), returned as BGR.
// Throws Error for anything else.
cv::Scalar parse_color(const std::string& color);

// <volume name or 1-based index>_<tx>_<ty>_<tz>_<slice>
std::string export_name(const VolumeEntry& entry, std::size_t index, bool useIndex);

// 8-bit BGR rendering of slice (min/max normalized) with contour on top
cv::Mat render_overlay(const cv::Mat& slice, const Contour& contour, const cv::Scalar& color);

// throws IOError when the file cannot be written
void export_png(const std::filesystem::path& path, const cv::Mat& image);
void export_csv(const std::filesystem::path& path, const Contour& contour);

}  // namespace hc::core::util
