#include "hc/core/types/Metadata.hpp"

#include <fstream>
#include <iomanip>

namespace hc {

Metadata::Metadata(std::filesystem::path fileLocation) : path_{std::move(fileLocation)}
{
    std::ifstream jsonFile(path_);
    if (!jsonFile) {
        throw IOError("Cannot open " + path_.string());
    }
    try {
        jsonFile >> json_;
    } catch (const nlohmann::json::exception& e) {
        throw IOError("Cannot parse " + path_.string() + ": " + e.what());
    }
    if (!json_.is_object()) {
        throw IOError(path_.string() + " does not hold a JSON object");
    }
}

void Metadata::save(const std::filesystem::path& path) const
{
    std::ofstream jsonFile(path, std::ofstream::out);
    if (!jsonFile) {
        throw IOError("Cannot write " + path.string());
    }
    jsonFile << std::setw(4) << json_ << std::endl;
}

}  // namespace hc
