#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "hc/core/util/Exceptions.hpp"

namespace hc {

// JSON document bound to a file path
class Metadata
{
public:
    Metadata() = default;
    explicit Metadata(std::filesystem::path fileLocation);

    void save(const std::filesystem::path& path) const;

    [[nodiscard]] bool hasKey(const std::string& key) const { return json_.count(key) > 0; }

    // throws IOError when the key is missing or holds another type
    template <typename T>
    T get(const std::string& key) const
    {
        if (!hasKey(key)) {
            throw IOError("Missing key '" + key + "' in " + path_.string());
        }
        try {
            return json_.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw IOError("Bad value for '" + key + "' in " + path_.string() + ": " + e.what());
        }
    }

    template <typename T>
    T get(const std::string& key, const T& fallback) const
    {
        return hasKey(key) ? get<T>(key) : fallback;
    }

    template <typename T>
    void set(const std::string& key, T value)
    {
        json_[key] = value;
    }

protected:
    nlohmann::json json_ = nlohmann::json::object();
    std::filesystem::path path_;
};

}  // namespace hc
