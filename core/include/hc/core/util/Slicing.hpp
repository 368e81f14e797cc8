#pragma once

#include <opencv2/core.hpp>

#include "hc/core/util/Diffusion.hpp"

namespace hc {
class Volume;
class SliceTransform;
}

namespace hc::core::util {

// 2D intensity plane, rows = volume height (y), cols = volume width (x).
// CV_32S when raw, CV_64F when smoothed.
using Slice2D = cv::Mat;

// Resamples plane state.sliceIndex() of the volume rotated by state.
//
// The output grid equals the input grid. Output voxel p samples the input at
// state.apply(p) with trilinear interpolation, rounded to the nearest integer;
// samples beyond half a voxel outside the input are 0.
//
// Throws ResampleError if the slice index is outside the volume depth, if
// state was built for a volume of different depth or if the transform is not
// finite.
Slice2D resample(const Volume& volume, const SliceTransform& state);

// As above, followed by anisotropic_diffusion() with the volume's in-plane
// spacing when smooth is set
Slice2D resample(const Volume& volume,
                 const SliceTransform& state,
                 bool smooth,
                 const DiffusionParams& params = {});

// Trilinear sample at a continuous index, 0 outside [-0.5, n - 0.5]
double sample_trilinear(const Volume& volume, const cv::Vec3d& index);

}  // namespace hc::core::util
