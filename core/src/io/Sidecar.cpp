#include "fv/core/io/Sidecar.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/LoadJson.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

Sidecar::Sidecar(fs::path path) : path_(std::move(path)) {}

bool Sidecar::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

nlohmann::json Sidecar::load() const
{
    if (!exists()) {
        return nlohmann::json::object();
    }
    auto j = json::load_json_file(path_);
    if (!j.is_object()) {
        throw FormatError("sidecar " + path_.string() + " does not hold a JSON object");
    }
    return j;
}

std::vector<std::string> Sidecar::listKeys() const
{
    std::vector<std::string> keys;
    for (const auto& item : load().items()) {
        keys.push_back(item.key());
    }
    return keys;
}

nlohmann::json Sidecar::read(const std::vector<std::string>& keys) const
{
    auto all = load();
    if (keys.empty()) {
        return all;
    }
    nlohmann::json out = nlohmann::json::object();
    for (const auto& key : keys) {
        auto it = all.find(key);
        if (it == all.end()) {
            Logger()->warn("Key '{}' not found in {}", key, path_.string());
            continue;
        }
        out[key] = *it;
    }
    return out;
}

void Sidecar::write(const nlohmann::json& values, bool cleanRewrite) const
{
    if (!values.is_object()) {
        throw InputError("sidecar values must be a JSON object");
    }
    auto merged = load();
    merged.update(values);

    if (cleanRewrite) {
        json::save_json_file(path_, merged);
        return;
    }
    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
        throw WriteError("could not write json file '" + path_.string() + "'");
    }
    file << merged.dump(4) << std::endl;
    if (!file) {
        throw WriteError("could not write json file '" + path_.string() + "'");
    }
}

}  // namespace fv::io
