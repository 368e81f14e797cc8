#pragma once

#include <opencv2/core.hpp>

namespace hc::core::util {

struct DiffusionParams {
    int iterations = 5;
    double time_step = 0.125;
    double conductance = 3.0;
};

/**
 * @brief Edge-preserving smoothing by gradient anisotropic diffusion.
 *
 * Runs itk::GradientAnisotropicDiffusionImageFilter on a double image.
 * Derivatives are scaled by the pixel spacing, so spacing must be the
 * in-plane voxel size of the slice.
 *
 * @param src Single channel image of any depth
 * @param spacing Pixel size along x (cols) and y (rows)
 * @return CV_64F image of the same size
 */
cv::Mat anisotropic_diffusion(const cv::Mat& src,
                              const DiffusionParams& params = {},
                              const cv::Vec2d& spacing = {1.0, 1.0});

}  // namespace hc::core::util
