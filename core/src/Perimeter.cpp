#include "hc/core/util/Perimeter.hpp"

#include <cmath>

#include "hc/core/util/Exceptions.hpp"

namespace hc::core::util {

double measure_perimeter(const Contour& contour)
{
    return measure_perimeter(contour, {1.0, 1.0});
}

double measure_perimeter(const Contour& contour, const cv::Vec2d& spacing)
{
    if (contour.size() < 2) {
        throw EmptyContour();
    }

    double length = 0.0;
    cv::Point prev = contour.back();
    for (const auto& p : contour) {
        const double dx = (p.x - prev.x) * spacing[0];
        const double dy = (p.y - prev.y) * spacing[1];
        length += std::sqrt(dx * dx + dy * dy);
        prev = p;
    }
    return length;
}

}  // namespace hc::core::util
