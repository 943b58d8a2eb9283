// LoadJson.hpp - JSON loading and validation utilities
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>
#include <vector>

namespace fv::json {

nlohmann::json load_json_file(const std::filesystem::path& path);

// Write with 4-space indentation through a temporary file and a rename
void save_json_file(const std::filesystem::path& path, const nlohmann::json& json);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws fv::InputError naming the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Returns a bool if present and boolean, else def.
bool bool_or(const nlohmann::json* m, const char* key, bool def);

// Array of exactly `count` numbers (any count when count is 0)
std::vector<double> require_numbers(
    const nlohmann::json& json,
    const char* field,
    std::size_t count,
    const std::string& context);

} // namespace fv::json
