#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include "fv/core/io/FrameSource.hpp"
#include "fv/core/types/BackendMode.hpp"
#include "fv/core/types/FrameBlock.hpp"
#include "fv/core/util/Transform.hpp"

namespace fv::io
{

constexpr double kDefaultChunkBudgetMiB = 1024.0;

struct ConvertOptions {
    // Output container; defaults to <source basename>.dat for file sources
    std::filesystem::path destination;
    FrameTransformPtr transform;
    // Strictly increasing source frame indices; all frames when unset
    std::optional<std::vector<std::size_t>> frames;
    // InMemory or MappedContainer, recorded in the header; inferred when unset
    std::optional<BackendMode> mode;
    double chunkBudgetMiB = kDefaultChunkBudgetMiB;
    // Rewrite even when the destination is already up to date
    bool forceNew = false;
    // Look for numbered companion files of a .tif source
    bool multiPart = true;

    // Decoder factories; the OpenCV and libtiff readers when empty
    SequentialSourceFactory videoFactory;
    TiledSourceFactory tiledFactory;
};

/**
 * @brief Stream a source file into a container, chunk by chunk
 *
 * The source may be a container, a (possibly split) TIFF stack, a video, or a
 * basename resolved with resolveFiles(). At most roughly `chunkBudgetMiB` of
 * input and of output is held in memory at once. Converting a container onto
 * itself renames it to a temporary file first and removes that file only when
 * the rewrite succeeded.
 *
 * @return the destination path, or an empty path when the conversion was
 *         skipped because no requested frame exists (a warning is logged)
 * @throws InputError   bad options or unsupported output element type
 * @throws FormatError  the destination exists and is not a container
 * @throws WriteError   short write; the destination is removed
 */
std::filesystem::path convertToContainer(const std::filesystem::path& source,
                                         const ConvertOptions& options = {});

/** Same as above for frames already in memory; `destination` is required. */
std::filesystem::path convertToContainer(const FrameBlock& data,
                                         const std::filesystem::path& destination,
                                         const ConvertOptions& options = {});

// Name of the first free "<stem>_temp-<k>.dat" next to `path`
std::filesystem::path temporaryContainerPath(const std::filesystem::path& path);

}  // namespace fv::io
