#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "hc/core/Measurement.hpp"
#include "hc/core/types/VolumeCollection.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Export.hpp"
#include "hc/core/util/Logging.hpp"
#include "hc/core/Settings.hpp"
#include "hc/core/util/VolumeIO.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

using hc::Logger;

/**
 * @brief Parse "a,b,c" into three numbers
 */
template <typename T>
static std::optional<cv::Vec<T, 3>> parseTriple(const std::string& text)
{
    std::stringstream ss(text);
    cv::Vec<T, 3> v;
    char sep = 0;
    if (!(ss >> v[0] >> sep) || sep != ',' || !(ss >> v[1] >> sep) || sep != ',' || !(ss >> v[2])) {
        return std::nullopt;
    }
    char extra = 0;
    if (ss >> extra) {
        return std::nullopt;
    }
    return v;
}

static void printRow(const hc::VolumeEntry& entry, const hc::core::MeasurementResult& result)
{
    const auto& t = entry.transform;
    std::cout << entry.volume->name() << "," << t.thetaX() << "," << t.thetaY() << "," << t.thetaZ() << ","
              << t.sliceIndex() << ",";
    if (result.perimeter) {
        std::cout << std::fixed << std::setprecision(4) << *result.perimeter << ",ok";
    } else if (result.invalid()) {
        std::cout << ",invalid";
    } else {
        std::cout << ",empty";
    }
    std::cout << "\n";
}

static void exportResult(const hc::VolumeEntry& entry,
                         std::size_t index,
                         const hc::core::MeasurementResult& result,
                         const hc::core::Settings& settings,
                         const cv::Scalar& color)
{
    namespace util = hc::core::util;

    const auto base = settings.export_dir / util::export_name(entry, index, settings.export_index);
    const auto& contour = result.extraction.contour;
    util::export_png(base.string() + ".png", util::render_overlay(result.slice, contour, color));
    if (!contour.empty()) {
        util::export_csv(base.string() + ".csv", contour);
    }
}

int main(int argc, char* argv[])
{
    po::options_description desc("hc_measure: measure the head circumference in an oblique MRI slice.\n\n"
                                 "Prints one CSV row per measured slice:\n"
                                 "  volume,theta_x,theta_y,theta_z,slice,perimeter,status\n\n"
                                 "Options");
    desc.add_options()
        ("help,h", "Print usage message")
        ("input,i", po::value<std::vector<std::string>>()->required(), "Volume file(s): .nii, .nii.gz, .nrrd, .mha, or raw with --raw-dims")
        ("raw-dims", po::value<std::string>(), "Raw volume dimensions nx,ny,nz")
        ("raw-type", po::value<std::string>()->default_value("int16"), "Raw voxel type (uint8, int16, uint16, int32, float32)")
        ("raw-spacing", po::value<std::string>(), "Raw voxel spacing sx,sy,sz")
        ("config,c", po::value<std::string>(), "JSON settings file")
        ("save-config", po::value<std::string>(), "Write the effective settings to this JSON file")
        ("theta-x", po::value<int>()->default_value(0), "Rotation about x in degrees [-90, 90]")
        ("theta-y", po::value<int>()->default_value(0), "Rotation about y in degrees [-90, 90]")
        ("theta-z", po::value<int>()->default_value(0), "Rotation about z in degrees [-90, 90]")
        ("slice,z", po::value<int>()->default_value(0), "Slice index in the rotated volume")
        ("volume", po::value<std::size_t>()->default_value(0), "Index of the first volume to measure")
        ("smooth,s", po::bool_switch(), "Smooth the slice before contouring")
        ("physical", po::bool_switch(), "Report the perimeter in physical units")
        ("all-slices", po::bool_switch(), "Measure every slice of every volume")
        ("export-dir", po::value<std::string>(), "Write <name>.png and <name>.csv for each measurement")
        ("export-index,e", po::bool_switch(), "Name exported files by volume index instead of file name")
        ("color", po::value<std::string>(), "Contour color, rrggbb or a name")
        ("debug,d", po::bool_switch(), "Print debug information");

    po::positional_options_description p;
    p.add("input", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    hc::core::Settings settings;
    std::optional<hc::core::util::RawLayout> raw;
    cv::Scalar color;
    try {
        if (vm.count("config")) {
            settings = hc::core::Settings::load(vm["config"].as<std::string>());
        }
        settings.applyEnvironment();

        if (vm["smooth"].as<bool>()) settings.smooth = true;
        if (vm["physical"].as<bool>()) settings.physical_units = true;
        if (vm["export-index"].as<bool>()) settings.export_index = true;
        if (vm["debug"].as<bool>()) settings.debug = true;
        if (vm.count("export-dir")) settings.export_dir = vm["export-dir"].as<std::string>();
        if (vm.count("color")) settings.contour_color = vm["color"].as<std::string>();

        hc::SetLogLevel(settings.debug ? "debug" : settings.log_level);
        color = hc::core::util::parse_color(settings.contour_color);

        if (vm.count("save-config")) {
            settings.save(vm["save-config"].as<std::string>());
        }

        if (vm.count("raw-dims")) {
            auto dims = parseTriple<int>(vm["raw-dims"].as<std::string>());
            if (!dims) {
                throw hc::Error("--raw-dims expects nx,ny,nz");
            }
            hc::core::util::RawLayout layout;
            layout.dims = *dims;
            layout.type = hc::core::util::parse_raw_type(vm["raw-type"].as<std::string>());
            if (vm.count("raw-spacing")) {
                auto spacing = parseTriple<double>(vm["raw-spacing"].as<std::string>());
                if (!spacing) {
                    throw hc::Error("--raw-spacing expects sx,sy,sz");
                }
                layout.spacing = *spacing;
            }
            raw = layout;
        }

        if (!settings.export_dir.empty() && !fs::exists(settings.export_dir)) {
            Logger()->info("Creating export directory {}", settings.export_dir.string());
            fs::create_directories(settings.export_dir);
        }
    } catch (const std::exception& e) {
        Logger()->error("{}", e.what());
        return 1;
    }

    hc::VolumeCollection volumes;
    try {
        for (const auto& file : vm["input"].as<std::vector<std::string>>()) {
            volumes.append(hc::VolumeEntry(hc::core::util::load_volume(file, raw)));
        }
        volumes.setCursor(vm["volume"].as<std::size_t>());
    } catch (const std::exception& e) {
        Logger()->error("Error loading volumes: {}", e.what());
        return 1;
    }

    const bool allSlices = vm["all-slices"].as<bool>();
    std::cout << "volume,theta_x,theta_y,theta_z,slice,perimeter,status\n";

    int failures = 0;
    for (std::size_t n = 0; n < volumes.size(); n++, volumes.advance()) {
        auto& entry = volumes.current();
        try {
            entry.transform.setAngles(vm["theta-x"].as<int>(), vm["theta-y"].as<int>(), vm["theta-z"].as<int>());

            if (allSlices) {
                for (int z = 0; z < entry.transform.numSlices(); z++) {
                    entry.transform.setSliceIndex(z);
                    printRow(entry, hc::core::measure(entry, settings));
                }
                continue;
            }

            entry.transform.setSliceIndex(vm["slice"].as<int>());
            auto result = hc::core::measure(entry, settings);
            printRow(entry, result);
            if (!settings.export_dir.empty()) {
                exportResult(entry, volumes.cursor(), result, settings, color);
            }
        } catch (const std::exception& e) {
            Logger()->error("{}: {}", entry.volume->name(), e.what());
            failures++;
        }
    }

    return failures == 0 ? 0 : 1;
}
