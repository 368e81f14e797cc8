#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace hc::core::util {

// Closed curve in volume (x, y) index coordinates. The closing edge from the
// last point back to the first is implicit.
using Contour = std::vector<cv::Point>;

constexpr std::size_t kDefaultInvalidContourCount = 10;

struct ContourExtraction {
    // outermost boundary of the largest foreground component, empty when the
    // slice has no foreground or the slice is invalid
    Contour contour;
    // largest component, 0/1, indexed mask(x, y): rows = slice width
    cv::Mat_<uint8_t> mask;
    // boundaries traced in the mask, holes included
    std::size_t numContours = 0;
    // last background level of the 8-bit Otsu split
    double otsuLevel = 0.0;
    bool invalid = false;

    [[nodiscard]] bool valid() const { return !invalid; }
};

class ContourExtractor
{
public:
    explicit ContourExtractor(std::size_t invalidContourCount = kDefaultInvalidContourCount);

    [[nodiscard]] std::size_t invalidContourCount() const { return invalidCount_; }

    // Normalizes the slice to 8 bits (min/max), binarizes it with Otsu's
    // threshold, keeps the largest 8-connected component and traces its
    // boundaries. A slice with invalidContourCount() or more boundaries is
    // reported invalid.
    [[nodiscard]] ContourExtraction run(const cv::Mat& slice) const;

    // The outer contour, or std::nullopt for an invalid slice
    [[nodiscard]] std::optional<Contour> extract(const cv::Mat& slice) const;

private:
    std::size_t invalidCount_;
};

// 8-bit min/max rescale to [0, 255]; constant input becomes all 0
cv::Mat_<uint8_t> normalize_to_u8(const cv::Mat& slice);

// Foreground (255) is every pixel above the Otsu level; returns that level
double otsu_binarize(const cv::Mat_<uint8_t>& img, cv::Mat_<uint8_t>& binary);

// Keeps the largest 8-connected foreground component (lowest label on ties)
cv::Mat_<uint8_t> keep_largest_component(const cv::Mat_<uint8_t>& binary);

std::optional<Contour> extract_contour(const cv::Mat& slice,
                                       std::size_t invalidContourCount = kDefaultInvalidContourCount);

}  // namespace hc::core::util
