#include "hc/core/util/VolumeIO.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

#include <itkImage.h>
#include <itkImageFileReader.h>
#include <itkRawImageIO.h>

#include "hc/core/types/Volume.hpp"
#include "hc/core/util/Exceptions.hpp"
#include "hc/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace hc::core::util {

namespace {

using VolumeImage = itk::Image<std::int32_t, 3>;
using ReaderType = itk::ImageFileReader<VolumeImage>;

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// file name up to the first '.', so "subject01.nii.gz" is "subject01"
std::string volume_name(const fs::path& path)
{
    std::string name = path.filename().string();
    return name.substr(0, name.find('.'));
}

VolumeImage::Pointer read_image(ReaderType::Pointer reader, const fs::path& path)
{
    reader->SetFileName(path.string());
    try {
        reader->Update();
    } catch (const itk::ExceptionObject& e) {
        throw IOError("Cannot read " + path.string() + ": " + e.GetDescription());
    }
    return reader->GetOutput();
}

std::shared_ptr<Volume> to_volume(const VolumeImage* image, const std::string& name)
{
    const auto region = image->GetLargestPossibleRegion();
    const auto size = region.GetSize();
    const cv::Vec3i dims(static_cast<int>(size[0]), static_cast<int>(size[1]), static_cast<int>(size[2]));

    const std::size_t count = region.GetNumberOfPixels();
    const std::int32_t* buf = image->GetBufferPointer();
    std::vector<std::int32_t> voxels(buf, buf + count);

    const auto sp = image->GetSpacing();
    const auto org = image->GetOrigin();
    if (!image->GetDirection().GetVnlMatrix().is_identity(1e-6)) {
        Logger()->debug("{}: direction cosines are not identity, using the index grid as is", name);
    }

    return Volume::New(dims, std::move(voxels), {sp[0], sp[1], sp[2]}, {org[0], org[1], org[2]}, name);
}

template <typename PixelT>
std::shared_ptr<Volume> read_raw(const fs::path& path, const RawLayout& layout)
{
    const auto& dims = layout.dims;
    const auto expected = static_cast<std::uintmax_t>(dims[0]) * dims[1] * dims[2] * sizeof(PixelT);
    std::error_code ec;
    const auto actual = fs::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot open file: " + path.string());
    }
    if (actual != expected) {
        throw IOError("File size mismatch for " + path.string() + ": " + std::to_string(actual) +
                      " bytes, layout needs " + std::to_string(expected));
    }

    using RawIO = itk::RawImageIO<PixelT, 3>;
    auto io = RawIO::New();
    io->SetFileDimensionality(3);
    for (unsigned int i = 0; i < 3; i++) {
        io->SetDimensions(i, static_cast<unsigned int>(dims[i]));
        io->SetSpacing(i, layout.spacing[i]);
        io->SetOrigin(i, 0.0);
    }
    io->SetHeaderSize(0);
    io->SetByteOrderToLittleEndian();

    auto reader = ReaderType::New();
    reader->SetImageIO(io);
    auto image = read_image(reader, path);
    return to_volume(image.GetPointer(), path.stem().string());
}

}  // namespace

RawType parse_raw_type(const std::string& name)
{
    if (name == "uint8") return RawType::UInt8;
    if (name == "int16") return RawType::Int16;
    if (name == "uint16") return RawType::UInt16;
    if (name == "int32") return RawType::Int32;
    if (name == "float32") return RawType::Float32;
    throw IOError("Unknown raw voxel type: " + name);
}

bool is_image_file(const fs::path& path)
{
    const auto name = lower(path.filename().string());
    for (const char* ext : {".nii", ".nii.gz", ".nrrd", ".nhdr", ".mha", ".mhd"}) {
        if (ends_with(name, ext)) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<Volume> load_image(const fs::path& path)
{
    if (!fs::exists(path)) {
        throw IOError("Cannot open file: " + path.string());
    }
    auto image = read_image(ReaderType::New(), path);
    auto volume = to_volume(image.GetPointer(), volume_name(path));

    const auto sp = volume->spacing();
    Logger()->info("Loaded {} ({}x{}x{}, spacing {:.3f}/{:.3f}/{:.3f})", path.string(), volume->sliceWidth(),
                   volume->sliceHeight(), volume->numSlices(), sp[0], sp[1], sp[2]);
    return volume;
}

std::shared_ptr<Volume> load_raw(const fs::path& path, const RawLayout& layout)
{
    const auto& dims = layout.dims;
    if (dims[0] <= 0 || dims[1] <= 0 || dims[2] <= 0) {
        throw IOError("Raw volume dimensions must be positive");
    }

    std::shared_ptr<Volume> volume;
    switch (layout.type) {
        case RawType::UInt8: volume = read_raw<std::uint8_t>(path, layout); break;
        case RawType::Int16: volume = read_raw<std::int16_t>(path, layout); break;
        case RawType::UInt16: volume = read_raw<std::uint16_t>(path, layout); break;
        case RawType::Int32: volume = read_raw<std::int32_t>(path, layout); break;
        case RawType::Float32: volume = read_raw<float>(path, layout); break;
    }

    Logger()->info("Loaded raw {} ({}x{}x{})", path.string(), dims[0], dims[1], dims[2]);
    return volume;
}

std::shared_ptr<Volume> load_volume(const fs::path& path, const std::optional<RawLayout>& raw)
{
    if (is_image_file(path)) {
        return load_image(path);
    }
    if (!raw) {
        throw IOError("Unknown volume format for " + path.string() + " (raw volumes need dimensions)");
    }
    return load_raw(path, *raw);
}

}  // namespace hc::core::util
