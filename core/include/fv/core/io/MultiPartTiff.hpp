#pragma once

#include <cstddef>
#include <filesystem>
#include <utility>
#include <vector>

namespace fv::io
{

// One naming convention for split TIFF sequences, e.g. "name@0001.tif"
struct PartScheme {
    char separator;
    int digits;
};

// '@' + 4 digits (PCO cameras), then '-' + 2 digits (Photron cameras)
inline constexpr PartScheme kPartSchemes[] = {{'@', 4}, {'-', 2}};

/**
 * @brief Files making up one logical TIFF stack
 *
 * Files are sorted by their numeric suffix; a file without suffix comes first.
 * Frame indices run across files in that order.
 */
struct MultiPartSequence {
    std::vector<std::filesystem::path> files;
    PartScheme scheme = kPartSchemes[0];

    // Pages per file, filled in by the reader that opens the files
    std::vector<std::size_t> framesPerFile;

    [[nodiscard]] std::size_t totalFrames() const;

    /** Map an absolute frame index to (file index, frame within file). */
    [[nodiscard]] std::pair<std::size_t, std::size_t> locate(std::size_t frame) const;
};

/**
 * Detect the parts of a split TIFF sequence.
 *
 * Both schemes are tried; the one that matches more files wins and a tie goes
 * to the first. A warning is logged when the losing scheme matched more than
 * one file. When `tif` itself does not exist its suffixed parts are still
 * searched; the result is empty if nothing exists.
 */
MultiPartSequence detectMultiPart(const std::filesystem::path& tif);

// Files matching one scheme, sorted; exposed for diagnostics and tests
std::vector<std::filesystem::path> matchPartScheme(const std::filesystem::path& tif,
                                                   const PartScheme& scheme);

}  // namespace fv::io
