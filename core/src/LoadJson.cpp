#include "fv/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

#include "fv/core/types/Exceptions.hpp"

namespace fv::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw NotFoundError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw InputError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void save_json_file(const std::filesystem::path& path, const nlohmann::json& json)
{
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp);
        if (!file) {
            throw WriteError("could not write json file '" + tmp.string() + "'");
        }
        file << json.dump(4) << std::endl;
        if (!file) {
            throw WriteError("could not write json file '" + tmp.string() + "'");
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw WriteError("could not replace json file '" + path.string() + "'");
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw InputError(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_boolean()) return it->get<bool>();
    return def;
}

std::vector<double> require_numbers(
    const nlohmann::json& json,
    const char* field,
    std::size_t count,
    const std::string& context)
{
    require_fields(json, {field}, context);
    const auto& arr = json[field];
    if (!arr.is_array() || (count > 0 && arr.size() != count)) {
        throw InputError(context + " field '" + field + "' must be an array of " +
                         (count > 0 ? std::to_string(count) + " " : std::string()) + "numbers");
    }
    std::vector<double> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_number()) {
            throw InputError(context + " field '" + field + "' holds a non-numeric entry");
        }
        out.push_back(v.get<double>());
    }
    return out;
}

} // namespace fv::json
