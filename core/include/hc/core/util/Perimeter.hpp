#pragma once

#include <opencv2/core.hpp>

#include "hc/core/util/Contouring.hpp"

namespace hc::core::util {

// Closed-curve length of contour in pixel units, including the edge from the
// last point back to the first. Throws EmptyContour below 2 points.
double measure_perimeter(const Contour& contour);

// As above with x and y differences scaled by the in-plane voxel spacing
double measure_perimeter(const Contour& contour, const cv::Vec2d& spacing);

}  // namespace hc::core::util
