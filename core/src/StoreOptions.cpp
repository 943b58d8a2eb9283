#include "fv/core/types/StoreOptions.hpp"

#include <nlohmann/json.hpp>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/LoadJson.hpp"

namespace fv
{

void StoreOptions::validate() const
{
    if (backendMode && static_cast<std::uint64_t>(*backendMode) > 3) {
        throw InputError("backend mode must be 0, 1, 2 or 3");
    }
    if (!(chunkBudgetMiB > 0)) {
        throw InputError("chunk budget must be positive, got " + std::to_string(chunkBudgetMiB));
    }
    if (!(maxLoadMiB > 0)) {
        throw InputError("maximum load size must be positive, got " + std::to_string(maxLoadMiB));
    }
}

FrameTransformPtr parseTransform(const nlohmann::json& j)
{
    if (j.is_null()) {
        return nullptr;
    }
    if (!j.is_object()) {
        throw InputError("transform must be a JSON object");
    }
    json::require_fields(j, {"type"}, "transform");
    const auto type = json::string_or(&j, "type", "");
    if (type == "affine") {
        auto m = json::require_numbers(j, "matrix", 6, "affine transform");
        return std::make_shared<AffineTransform>(cv::Matx23d(m[0], m[1], m[2], m[3], m[4], m[5]));
    }
    if (type == "undistort") {
        auto k = json::require_numbers(j, "camera_matrix", 9, "undistort transform");
        auto d = json::require_numbers(j, "dist_coeffs", 0, "undistort transform");
        return std::make_shared<UndistortTransform>(
            cv::Matx33d(k[0], k[1], k[2], k[3], k[4], k[5], k[6], k[7], k[8]), d);
    }
    throw InputError("unknown transform type '" + type + "'");
}

StoreOptions parseStoreOptions(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw InputError("store options must be a JSON object");
    }
    StoreOptions opts;
    if (j.contains("backend_mode") && !j["backend_mode"].is_null()) {
        if (!j["backend_mode"].is_number_integer()) {
            throw InputError("backend_mode must be an integer");
        }
        opts.backendMode = backendModeFromInt(j["backend_mode"].get<long long>());
    }
    opts.ignoreCachedContainer = json::bool_or(&j, "ignore_cached_container", opts.ignoreCachedContainer);
    opts.chunkBudgetMiB = json::number_or(&j, "chunk_budget_mib", opts.chunkBudgetMiB);
    opts.maxLoadMiB = json::number_or(&j, "max_load_mib", opts.maxLoadMiB);
    if (j.contains("transform")) {
        opts.transform = parseTransform(j["transform"]);
    }
    opts.validate();
    return opts;
}

nlohmann::json toJson(const StoreOptions& opts)
{
    nlohmann::json j;
    if (opts.backendMode) {
        j["backend_mode"] = static_cast<int>(*opts.backendMode);
    } else {
        j["backend_mode"] = nullptr;
    }
    j["ignore_cached_container"] = opts.ignoreCachedContainer;
    j["chunk_budget_mib"] = opts.chunkBudgetMiB;
    j["max_load_mib"] = opts.maxLoadMiB;

    // Function transforms have no serialized form
    if (auto* a = dynamic_cast<const AffineTransform*>(opts.transform.get())) {
        const auto& m = a->matrix();
        j["transform"] = {{"type", "affine"},
                          {"matrix", {m(0, 0), m(0, 1), m(0, 2), m(1, 0), m(1, 1), m(1, 2)}}};
    } else if (auto* u = dynamic_cast<const UndistortTransform*>(opts.transform.get())) {
        const auto& k = u->cameraMatrix();
        j["transform"] = {{"type", "undistort"},
                          {"camera_matrix",
                           {k(0, 0), k(0, 1), k(0, 2), k(1, 0), k(1, 1), k(1, 2), k(2, 0), k(2, 1),
                            k(2, 2)}},
                          {"dist_coeffs", u->distCoeffs()}};
    }
    return j;
}

StoreOptions loadStoreOptions(const std::filesystem::path& path)
{
    return parseStoreOptions(json::load_json_file(path));
}

}  // namespace fv
