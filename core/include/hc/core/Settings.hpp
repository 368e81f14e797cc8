#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "hc/core/util/Contouring.hpp"
#include "hc/core/util/Diffusion.hpp"

namespace hc {
class Metadata;
}

namespace hc::core {

// User-facing options, read from a JSON config file and overridden by the
// command line. Unknown keys are ignored; a known key with the wrong type
// raises IOError.
struct Settings {
    bool smooth = false;
    bool debug = false;
    bool export_index = false;
    bool physical_units = false;
    std::string contour_color = "b55162";
    std::string log_level = "info";
    std::filesystem::path export_dir;
    std::size_t invalid_contour_count = util::kDefaultInvalidContourCount;
    util::DiffusionParams diffusion;

    static Settings fromMetadata(const Metadata& meta);
    static Settings load(const std::filesystem::path& path);

    // HC_INVALID_CONTOUR_COUNT overrides invalid_contour_count when it holds
    // a positive integer
    void applyEnvironment();

    void save(const std::filesystem::path& path) const;
};

}  // namespace hc::core
