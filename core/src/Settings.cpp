#include "hc/core/Settings.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "hc/core/types/Metadata.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc::core {

Settings Settings::fromMetadata(const Metadata& meta)
{
    Settings s;
    s.smooth = meta.get<bool>("smooth", s.smooth);
    s.debug = meta.get<bool>("debug", s.debug);
    s.export_index = meta.get<bool>("export_index", s.export_index);
    s.physical_units = meta.get<bool>("physical_units", s.physical_units);
    s.contour_color = meta.get<std::string>("contour_color", s.contour_color);
    s.log_level = meta.get<std::string>("log_level", s.log_level);
    s.export_dir = meta.get<std::string>("export_dir", s.export_dir.string());
    const auto count = meta.get<long long>("invalid_contour_count",
                                            static_cast<long long>(s.invalid_contour_count));
    if (count <= 0) {
        throw IOError("invalid_contour_count must be at least 1, got " + std::to_string(count));
    }
    s.invalid_contour_count = static_cast<std::size_t>(count);

    if (meta.hasKey("diffusion")) {
        auto d = meta.get<nlohmann::json>("diffusion");
        if (!d.is_object()) {
            throw IOError("'diffusion' must be an object");
        }
        try {
            s.diffusion.iterations = d.value("iterations", s.diffusion.iterations);
            s.diffusion.time_step = d.value("time_step", s.diffusion.time_step);
            s.diffusion.conductance = d.value("conductance", s.diffusion.conductance);
        } catch (const nlohmann::json::exception& e) {
            throw IOError(std::string("Bad 'diffusion' settings: ") + e.what());
        }
    }
    return s;
}

Settings Settings::load(const std::filesystem::path& path)
{
    auto s = fromMetadata(Metadata(path));
    Logger()->debug("Loaded settings from {}", path.string());
    return s;
}

void Settings::applyEnvironment()
{
    if (const char* env = std::getenv("HC_INVALID_CONTOUR_COUNT")) {
        char* endptr = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(env, &endptr, 10);
        if (endptr != env && *endptr == '\0' && errno == 0 && parsed > 0) {
            invalid_contour_count = static_cast<std::size_t>(parsed);
        } else {
            Logger()->warn("Ignoring HC_INVALID_CONTOUR_COUNT='{}'", env);
        }
    }
}

void Settings::save(const std::filesystem::path& path) const
{
    Metadata meta;
    meta.set("smooth", smooth);
    meta.set("debug", debug);
    meta.set("export_index", export_index);
    meta.set("physical_units", physical_units);
    meta.set("contour_color", contour_color);
    meta.set("log_level", log_level);
    meta.set("export_dir", export_dir.string());
    meta.set("invalid_contour_count", invalid_contour_count);
    meta.set("diffusion", nlohmann::json{{"iterations", diffusion.iterations},
                                         {"time_step", diffusion.time_step},
                                         {"conductance", diffusion.conductance}});
    meta.save(path);
}

}  // namespace hc::core
