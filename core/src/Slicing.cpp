#include "hc/core/util/Slicing.hpp"

#include <algorithm>
#include <cmath>

#include "hc/core/types/SliceTransform.hpp"
#include "hc/core/types/Volume.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc::core::util {

namespace {

bool transformIsFinite(const SliceTransform& state)
{
    const auto& M = state.rotation();
    const auto& T = state.offset();
    for (int i = 0; i < 9; i++) {
        if (!std::isfinite(M.val[i])) {
            return false;
        }
    }
    return std::isfinite(T[0]) && std::isfinite(T[1]) && std::isfinite(T[2]);
}

}  // namespace

double sample_trilinear(const Volume& volume, const cv::Vec3d& index)
{
    const cv::Vec3i n = volume.dims();

    int i0[3], i1[3];
    double f[3];
    for (int a = 0; a < 3; a++) {
        if (!(index[a] >= -0.5 && index[a] <= n[a] - 0.5)) {
            return 0.0;
        }
        const double c = std::clamp(index[a], 0.0, static_cast<double>(n[a] - 1));
        i0[a] = static_cast<int>(std::floor(c));
        i1[a] = std::min(i0[a] + 1, n[a] - 1);
        f[a] = c - i0[a];
    }

    const double c000 = volume.at(i0[0], i0[1], i0[2]);
    const double c100 = volume.at(i1[0], i0[1], i0[2]);
    const double c010 = volume.at(i0[0], i1[1], i0[2]);
    const double c110 = volume.at(i1[0], i1[1], i0[2]);
    const double c001 = volume.at(i0[0], i0[1], i1[2]);
    const double c101 = volume.at(i1[0], i0[1], i1[2]);
    const double c011 = volume.at(i0[0], i1[1], i1[2]);
    const double c111 = volume.at(i1[0], i1[1], i1[2]);

    const double c00 = c000 * (1 - f[0]) + c100 * f[0];
    const double c10 = c010 * (1 - f[0]) + c110 * f[0];
    const double c01 = c001 * (1 - f[0]) + c101 * f[0];
    const double c11 = c011 * (1 - f[0]) + c111 * f[0];

    const double c0 = c00 * (1 - f[1]) + c10 * f[1];
    const double c1 = c01 * (1 - f[1]) + c11 * f[1];

    return c0 * (1 - f[2]) + c1 * f[2];
}

Slice2D resample(const Volume& volume, const SliceTransform& state)
{
    const int w = volume.sliceWidth();
    const int h = volume.sliceHeight();
    const int z = state.sliceIndex();

    if (state.numSlices() != volume.numSlices()) {
        throw ResampleError("Slice transform built for a volume with " +
                            std::to_string(state.numSlices()) + " slices, volume has " +
                            std::to_string(volume.numSlices()));
    }
    if (z < 0 || z >= volume.numSlices()) {
        throw ResampleError("Slice index " + std::to_string(z) + " outside resampled depth " +
                            std::to_string(volume.numSlices()));
    }
    if (!transformIsFinite(state)) {
        throw ResampleError("Slice transform is not finite");
    }

    cv::Mat_<std::int32_t> out(h, w);

#pragma omp parallel for
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            const cv::Vec3d p = volume.indexToPhysical({static_cast<double>(x), static_cast<double>(y), static_cast<double>(z)});
            const cv::Vec3d src = volume.physicalToIndex(state.apply(p));
            out(y, x) = static_cast<std::int32_t>(std::lround(sample_trilinear(volume, src)));
        }
    }

    Logger()->debug("Resampled {} at {} ({}x{})", volume.name(), state.describe(), w, h);
    return out;
}

Slice2D resample(const Volume& volume,
                 const SliceTransform& state,
                 bool smooth,
                 const DiffusionParams& params)
{
    Slice2D plane = resample(volume, state);
    if (!smooth) {
        return plane;
    }
    const cv::Vec3d sp = volume.spacing();
    return anisotropic_diffusion(plane, params, {sp[0], sp[1]});
}

}  // namespace hc::core::util
