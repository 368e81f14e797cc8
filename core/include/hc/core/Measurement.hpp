#pragma once

#include <optional>

#include "hc/core/util/Contouring.hpp"
#include "hc/core/Settings.hpp"
#include "hc/core/util/Slicing.hpp"

namespace hc {
struct VolumeEntry;
}

namespace hc::core {

struct MeasurementResult {
    util::Slice2D slice;
    util::ContourExtraction extraction;
    // unset for an invalid slice or a contour with fewer than 2 points
    std::optional<double> perimeter;

    [[nodiscard]] bool invalid() const { return extraction.invalid; }
};

// resample -> extract -> measure for the entry's current transform.
// Perimeter is in pixels unless settings.physical_units is set, then in the
// volume's spacing units.
MeasurementResult measure(const VolumeEntry& entry, const Settings& settings);

}  // namespace hc::core
