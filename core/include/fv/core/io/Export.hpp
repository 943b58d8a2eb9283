#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "fv/core/util/Tiff.hpp"
#include "fv/core/util/Transform.hpp"

namespace fv::io
{

enum class ExportProfile {
    Mpeg4,           // mp4v in .mp4
    Archival,        // lossless HuffYUV in .avi
    MotionJpegAvi,   // MJPG in .avi
    MotionJpeg2000,  // MJ2C in .mj2
    Tiff,            // LZW compressed multi-page .tif
    TiffUncompressed
};

// "MPEG-4", "Archival", "Motion JPEG AVI", "Motion JPEG 2000", "TIF", "TIF NOCOMP"
std::string exportProfileToString(ExportProfile profile);
// Inverse of exportProfileToString; throws InputError on an unknown name
ExportProfile exportProfileFromString(const std::string& name);

std::string exportExtension(ExportProfile profile);
bool isVideoProfile(ExportProfile profile);

// Everything a writer needs before the first frame arrives
struct FrameWriterSpec {
    std::filesystem::path path;
    ExportProfile profile = ExportProfile::Mpeg4;
    double frameRate = 10;
    cv::Size frameSize;
    int channels = 1;
    // Pixel bytes of the whole export, for the classic/BigTIFF choice
    std::uint64_t totalBytes = 0;
    TiffWriteOptions tiff;
};

/** Sink for exported frames, written in order */
class FrameWriter
{
public:
    virtual ~FrameWriter() = default;

    virtual void write(const cv::Mat& frame) = 0;
    virtual void close() = 0;
};

using FrameWriterFactory =
    std::function<std::unique_ptr<FrameWriter>(const FrameWriterSpec&)>;

/**
 * cv::VideoWriter for the video profiles, libtiff for the TIFF ones.
 *
 * @throws InputError if a video profile gets other than 1 or 3 channels
 * @throws WriteError if the encoder or file cannot be opened
 */
std::unique_ptr<FrameWriter> openFrameWriter(const FrameWriterSpec& spec);

struct ExportOptions {
    ExportProfile profile = ExportProfile::Mpeg4;
    double frameRate = 10;
    // Frame indices to export in this order; all frames when unset
    std::optional<std::vector<std::size_t>> frames;
    // Applied after the store's own transform
    FrameTransformPtr transform;
    // Output basename; the store's basename when empty
    std::filesystem::path filename;
    std::string suffix = "_exportAs";
    bool overwrite = true;
    TiffWriteOptions tiff;
    // openFrameWriter when empty
    FrameWriterFactory writerFactory;
};

/**
 * <parent>/<stem><suffix><extension> for `basename`.
 *
 * @throws InputError if both the stem and the suffix are empty
 */
std::filesystem::path exportPath(const std::filesystem::path& basename,
                                 const ExportOptions& options);

// Scale a frame to 8 bits: 16-bit by 1/257, floating point from [0, 1]
cv::Mat toVideoDepth(const cv::Mat& frame);

}  // namespace fv::io
