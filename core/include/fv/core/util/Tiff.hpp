#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "fv/core/types/FrameBlock.hpp"

// Options for writing TIFF stacks
struct TiffWriteOptions {
    enum class Compression { NONE, LZW, DEFLATE };
    enum class Predictor  { NONE, HORIZONTAL, FLOATINGPOINT };

    bool forceBigTiff = false;
    int  tileSize = 256;                  // square tiles, multiple of 16
    Compression compression = Compression::LZW;
    Predictor  predictor   = Predictor::FLOATINGPOINT; // for float data
};

namespace fv
{

// True when `totalBytes` of pixel data need 64-bit (BigTIFF) offsets
bool needsBigTiff(std::uint64_t totalBytes, const TiffWriteOptions& opts = {});

/**
 * @brief Appends pages to a tiled TIFF one at a time
 *
 * Classic or BigTIFF is chosen when the file is opened, so callers that
 * stream frames must know the total size up front. Pages may differ in
 * size but each must have a supported depth.
 */
class TiffStackWriter
{
public:
    TiffStackWriter(const std::filesystem::path& outPath, const TiffWriteOptions& opts, bool bigTiff);
    ~TiffStackWriter();

    TiffStackWriter(const TiffStackWriter&) = delete;
    TiffStackWriter& operator=(const TiffStackWriter&) = delete;

    void append(const cv::Mat& page);
    // Flush and release the file; further appends throw
    void close();

    [[nodiscard]] std::size_t pages() const { return pages_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::size_t pages_ = 0;
};

// Write every frame of a block as one page of a tiled TIFF; slices become samples per pixel
void writeTiffStack(const std::filesystem::path& outPath,
                    const FrameBlock& block,
                    const TiffWriteOptions& opts = {});

// Write frames given as cv::Mat (8U, 16U, 32F or 64F; any channel count) as pages
void writeTiffStack(const std::filesystem::path& outPath,
                    const std::vector<cv::Mat>& frames,
                    const TiffWriteOptions& opts = {});

}  // namespace fv
