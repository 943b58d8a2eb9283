#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace fv::io
{

/**
 * @brief Small key/value metadata stored next to a dataset as JSON
 *
 * The file holds one JSON object. Values are arbitrary JSON.
 */
class Sidecar
{
public:
    explicit Sidecar(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] bool exists() const;
    [[nodiscard]] std::vector<std::string> listKeys() const;

    /**
     * Read the given keys; all keys when `keys` is empty.
     * Missing keys are left out of the result and logged.
     */
    [[nodiscard]] nlohmann::json read(const std::vector<std::string>& keys = {}) const;

    /**
     * Merge `values` (a JSON object) into the file.
     *
     * @param cleanRewrite replace the file atomically with the merged object;
     *        otherwise the merged object is written over the existing file
     * @throws InputError if `values` is not an object
     * @throws WriteError if the file cannot be written
     */
    void write(const nlohmann::json& values, bool cleanRewrite = true) const;

private:
    [[nodiscard]] nlohmann::json load() const;

    std::filesystem::path path_;
};

}  // namespace fv::io
