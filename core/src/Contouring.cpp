#include "hc/core/util/Contouring.hpp"

#include <opencv2/imgproc.hpp>

#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc::core::util {

cv::Mat_<uint8_t> normalize_to_u8(const cv::Mat& slice)
{
    if (slice.empty() || slice.channels() != 1) {
        throw Error("Contour extraction needs a non-empty single channel slice");
    }
    cv::Mat_<uint8_t> out;
    cv::normalize(slice, out, 0, 255, cv::NORM_MINMAX, CV_8U);
    return out;
}

double otsu_binarize(const cv::Mat_<uint8_t>& img, cv::Mat_<uint8_t>& binary)
{
    // OpenCV's level is the last background bin, foreground is strictly above it
    return cv::threshold(img, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
}

cv::Mat_<uint8_t> keep_largest_component(const cv::Mat_<uint8_t>& binary)
{
    cv::Mat_<uint8_t> out = cv::Mat_<uint8_t>::zeros(binary.size());
    if (cv::countNonZero(binary) == 0) {
        return out;
    }

    cv::Mat labels, stats, centroids;
    const int n = cv::connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);

    int best = 0;
    int bestArea = 0;
    for (int label = 1; label < n; label++) {
        const int area = stats.at<int>(label, cv::CC_STAT_AREA);
        if (area > bestArea) {
            bestArea = area;
            best = label;
        }
    }

    out.setTo(255, labels == best);
    return out;
}

ContourExtractor::ContourExtractor(std::size_t invalidContourCount) : invalidCount_(invalidContourCount)
{
    if (invalidCount_ == 0) {
        throw Error("Invalid contour count must be at least 1");
    }
}

ContourExtraction ContourExtractor::run(const cv::Mat& slice) const
{
    ContourExtraction result;

    cv::Mat_<uint8_t> img = normalize_to_u8(slice);
    cv::Mat_<uint8_t> binary;
    result.otsuLevel = otsu_binarize(img, binary);
    cv::Mat_<uint8_t> largest = keep_largest_component(binary);

    std::vector<std::vector<cv::Point>> contours;
    std::vector<cv::Vec4i> hierarchy;
    cv::findContours(largest.clone(), contours, hierarchy, cv::RETR_TREE, cv::CHAIN_APPROX_SIMPLE);
    result.numContours = contours.size();

    // image arrays are (row, col) = (y, x), the volume grid is (x, y)
    cv::Mat_<uint8_t> mask01 = largest / 255;
    cv::transpose(mask01, result.mask);

    if (result.numContours >= invalidCount_) {
        result.invalid = true;
        Logger()->debug("Slice invalid: {} contours (limit {})", result.numContours, invalidCount_);
        return result;
    }

    for (std::size_t i = 0; i < contours.size(); i++) {
        if (hierarchy[i][3] < 0) {
            result.contour = std::move(contours[i]);
            break;
        }
    }

    Logger()->debug("Otsu level {}, {} contours, outer contour has {} points",
                    result.otsuLevel, result.numContours, result.contour.size());
    return result;
}

std::optional<Contour> ContourExtractor::extract(const cv::Mat& slice) const
{
    auto result = run(slice);
    if (result.invalid) {
        return std::nullopt;
    }
    return std::move(result.contour);
}

std::optional<Contour> extract_contour(const cv::Mat& slice, std::size_t invalidContourCount)
{
    return ContourExtractor(invalidContourCount).extract(slice);
}

}  // namespace hc::core::util
