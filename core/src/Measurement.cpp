#include "hc/core/Measurement.hpp"

#include "hc/core/types/VolumeCollection.hpp"
#include "hc/core/util/Logging.hpp"
#include "hc/core/util/Perimeter.hpp"

namespace hc::core {

MeasurementResult measure(const VolumeEntry& entry, const Settings& settings)
{
    MeasurementResult result;
    result.slice = util::resample(*entry.volume, entry.transform, settings.smooth, settings.diffusion);
    result.extraction = util::ContourExtractor(settings.invalid_contour_count).run(result.slice);

    if (result.extraction.invalid) {
        Logger()->warn("{} at {}: {} contours found, slice is invalid", entry.volume->name(),
                       entry.transform.describe(), result.extraction.numContours);
        return result;
    }

    const auto& contour = result.extraction.contour;
    if (contour.size() < 2) {
        Logger()->warn("{} at {}: no outline found", entry.volume->name(), entry.transform.describe());
        return result;
    }

    if (settings.physical_units) {
        const auto sp = entry.volume->spacing();
        result.perimeter = util::measure_perimeter(contour, {sp[0], sp[1]});
    } else {
        result.perimeter = util::measure_perimeter(contour);
    }
    Logger()->debug("{} at {}: perimeter {:.3f}", entry.volume->name(), entry.transform.describe(),
                    *result.perimeter);
    return result;
}

}  // namespace hc::core
