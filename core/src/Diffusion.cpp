#include "hc/core/util/Diffusion.hpp"

#include <algorithm>
#include <string>

#include <itkGradientAnisotropicDiffusionImageFilter.h>
#include <itkImage.h>

#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace hc::core::util {

using PlaneImage = itk::Image<double, 2>;

static PlaneImage::Pointer to_itk(const cv::Mat_<double>& img, const cv::Vec2d& spacing)
{
    PlaneImage::SizeType size;
    size[0] = static_cast<itk::SizeValueType>(img.cols);
    size[1] = static_cast<itk::SizeValueType>(img.rows);
    PlaneImage::IndexType start;
    start.Fill(0);

    PlaneImage::RegionType region;
    region.SetIndex(start);
    region.SetSize(size);

    PlaneImage::SpacingType sp;
    sp[0] = spacing[0];
    sp[1] = spacing[1];

    auto image = PlaneImage::New();
    image->SetRegions(region);
    image->SetSpacing(sp);
    image->Allocate();

    double* buf = image->GetBufferPointer();
    for (int y = 0; y < img.rows; y++) {
        std::copy(img[y], img[y] + img.cols, buf + static_cast<std::size_t>(y) * img.cols);
    }
    return image;
}

cv::Mat anisotropic_diffusion(const cv::Mat& src, const DiffusionParams& params, const cv::Vec2d& spacing)
{
    if (src.empty() || src.channels() != 1) {
        throw Error("Diffusion needs a non-empty single channel image");
    }

    cv::Mat_<double> img;
    src.convertTo(img, CV_64F);

    double lo, hi;
    cv::minMaxLoc(img, &lo, &hi);
    if (params.iterations <= 0 || lo == hi) {
        // nothing to diffuse
        return img;
    }

    using FilterType = itk::GradientAnisotropicDiffusionImageFilter<PlaneImage, PlaneImage>;
    auto filter = FilterType::New();
    filter->SetInput(to_itk(img, spacing));
    filter->SetNumberOfIterations(static_cast<unsigned int>(params.iterations));
    filter->SetTimeStep(params.time_step);
    filter->SetConductanceParameter(params.conductance);

    try {
        filter->Update();
    } catch (const itk::ExceptionObject& e) {
        throw Error(std::string("Anisotropic diffusion failed: ") + e.GetDescription());
    }

    const double* out = filter->GetOutput()->GetBufferPointer();
    cv::Mat_<double> result(img.size());
    for (int y = 0; y < img.rows; y++) {
        std::copy(out + static_cast<std::size_t>(y) * img.cols, out + static_cast<std::size_t>(y + 1) * img.cols,
                  result[y]);
    }

    Logger()->debug("Anisotropic diffusion: {} iterations, dt={}, conductance={}, spacing {}/{}",
                    params.iterations, params.time_step, params.conductance, spacing[0], spacing[1]);
    return result;
}

}  // namespace hc::core::util
