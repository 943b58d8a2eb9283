#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "fv/core/io/Converter.hpp"
#include "fv/core/io/FrameSource.hpp"
#include "fv/core/types/BackendMode.hpp"
#include "fv/core/util/Transform.hpp"

namespace fv
{

constexpr double kDefaultMaxLoadMiB = 4096.0;

/** Construction options of a Store */
struct StoreOptions {
    // Requested backend; chosen from the files found when unset
    std::optional<BackendMode> backendMode;
    // Prefer a video or TIFF source over an existing container
    bool ignoreCachedContainer = false;
    double chunkBudgetMiB = io::kDefaultChunkBudgetMiB;
    // Largest source loaded completely into memory
    double maxLoadMiB = kDefaultMaxLoadMiB;
    FrameTransformPtr transform;

    io::SequentialSourceFactory videoFactory;
    io::TiledSourceFactory tiledFactory;

    // Throws InputError on an invalid combination
    void validate() const;
};

/**
 * Options from JSON. Recognized keys: backend_mode, ignore_cached_container,
 * chunk_budget_mib, max_load_mib and transform. The result is validated.
 */
StoreOptions parseStoreOptions(const nlohmann::json& j);
nlohmann::json toJson(const StoreOptions& opts);
StoreOptions loadStoreOptions(const std::filesystem::path& path);

/**
 * Transform from JSON:
 *   {"type": "affine", "matrix": [a, b, tx, c, d, ty]}
 *   {"type": "undistort", "camera_matrix": [9 numbers], "dist_coeffs": [...]}
 */
FrameTransformPtr parseTransform(const nlohmann::json& j);

}  // namespace fv
