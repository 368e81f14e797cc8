#include "hc/core/util/Export.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "hc/core/types/VolumeCollection.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc::core::util {

cv::Scalar parse_color(const std::string& color)
{
    static const std::map<std::string, cv::Scalar> named = {
        {"red", {0, 0, 255}},     {"green", {0, 255, 0}},   {"blue", {255, 0, 0}},
        {"yellow", {0, 255, 255}}, {"cyan", {255, 255, 0}}, {"magenta", {255, 0, 255}},
        {"white", {255, 255, 255}}, {"black", {0, 0, 0}},   {"orange", {0, 165, 255}},
    };

    std::string c = color;
    if (!c.empty() && c[0] == '#') {
        c.erase(0, 1);
    }
    std::transform(c.begin(), c.end(), c.begin(), [](unsigned char ch) { return std::tolower(ch); });

    auto it = named.find(c);
    if (it != named.end()) {
        return it->second;
    }

    if (c.size() == 6 && std::all_of(c.begin(), c.end(), [](unsigned char ch) { return std::isxdigit(ch); })) {
        const auto v = std::stoul(c, nullptr, 16);
        return {static_cast<double>(v & 0xff), static_cast<double>((v >> 8) & 0xff),
                static_cast<double>((v >> 16) & 0xff)};
    }
    throw Error("Unknown color '" + color + "' (use rrggbb or a color name)");
}

std::string export_name(const VolumeEntry& entry, std::size_t index, bool useIndex)
{
    const std::string base = useIndex || entry.volume->name().empty()
                                 ? std::to_string(index + 1)
                                 : entry.volume->name();
    return base + "_" + entry.transform.describe();
}

cv::Mat render_overlay(const cv::Mat& slice, const Contour& contour, const cv::Scalar& color)
{
    cv::Mat gray;
    cv::normalize(slice, gray, 0, 255, cv::NORM_MINMAX, CV_8U);

    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    if (contour.size() >= 2) {
        const std::vector<std::vector<cv::Point>> polys = {contour};
        cv::polylines(bgr, polys, true, color, 1, cv::LINE_8);
    } else if (contour.size() == 1) {
        bgr.at<cv::Vec3b>(contour[0]) = cv::Vec3b(static_cast<uchar>(color[0]), static_cast<uchar>(color[1]),
                                                  static_cast<uchar>(color[2]));
    }
    return bgr;
}

void export_png(const std::filesystem::path& path, const cv::Mat& image)
{
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + path.string());
    }
    Logger()->info("Wrote {}", path.string());
}

void export_csv(const std::filesystem::path& path, const Contour& contour)
{
    std::ofstream o(path);
    if (!o) {
        throw IOError("Cannot write " + path.string());
    }
    o << "x,y\n";
    for (const auto& p : contour) {
        o << p.x << "," << p.y << "\n";
    }
    if (!o) {
        throw IOError("Failed writing " + path.string());
    }
    Logger()->info("Wrote {}", path.string());
}

}  // namespace hc::core::util
