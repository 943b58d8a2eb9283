#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "fv/core/types/Dtype.hpp"
#include "fv/core/types/FrameBlock.hpp"

namespace fv::io
{

// Half-open index range
struct Range {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t size() const { return end > begin ? end - begin : 0; }
};

/** Decoder that can only move forward from a seek position */
class SequentialSource
{
public:
    virtual ~SequentialSource() = default;

    // Position the cursor so the next decode returns the frame at `seconds`
    virtual void seek(double seconds) = 0;
    // Next frame, or an empty Mat past the end
    virtual cv::Mat decodeNext() = 0;
    [[nodiscard]] virtual double frameRate() const = 0;
    [[nodiscard]] virtual double duration() const = 0;
};

using SequentialSourceFactory =
    std::function<std::unique_ptr<SequentialSource>(const std::filesystem::path&)>;

/** cv::VideoCapture behind the SequentialSource interface */
class VideoCaptureSource final : public SequentialSource
{
public:
    explicit VideoCaptureSource(const std::filesystem::path& path);
    ~VideoCaptureSource() override;

    void seek(double seconds) override;
    cv::Mat decodeNext() override;
    [[nodiscard]] double frameRate() const override { return fps_; }
    [[nodiscard]] double duration() const override { return duration_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    double fps_ = 0;
    double duration_ = 0;
};

std::unique_ptr<SequentialSource> openVideoCapture(const std::filesystem::path& path);

/**
 * Region read from a tiled source. Axis order is (row, col, frame, slice)
 * with the slice axis varying fastest.
 */
struct TiledBuffer {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::size_t frames = 0;
    std::size_t slices = 0;
    ElementType type = ElementType::Unknown;
    std::vector<std::uint8_t> bytes;
};

// Reorder a tiled read into the canonical (frame, row, col, slice) layout
FrameBlock permuteTiledToCanonical(const TiledBuffer& buf);

/** Random-access image stack */
class TiledSource
{
public:
    virtual ~TiledSource() = default;

    // Canonical (rows, cols, slices, frames) extent
    [[nodiscard]] virtual Shape shape() const = 0;
    [[nodiscard]] virtual ElementType elementType() const = 0;
    virtual TiledBuffer read(Range rows, Range cols, Range frames) = 0;
};

using TiledSourceFactory =
    std::function<std::unique_ptr<TiledSource>(const std::filesystem::path&)>;

/** Multi-page TIFF, possibly split across numbered part files, read with libtiff */
class TiffStackSource final : public TiledSource
{
public:
    /** @param multiPart look for numbered companion files of `path` */
    explicit TiffStackSource(const std::filesystem::path& path, bool multiPart = true);
    ~TiffStackSource() override;

    TiffStackSource(const TiffStackSource&) = delete;
    TiffStackSource& operator=(const TiffStackSource&) = delete;

    [[nodiscard]] Shape shape() const override { return shape_; }
    [[nodiscard]] ElementType elementType() const override { return type_; }
    TiledBuffer read(Range rows, Range cols, Range frames) override;

    [[nodiscard]] const std::vector<std::filesystem::path>& files() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    Shape shape_;
    ElementType type_ = ElementType::Unknown;
};

std::unique_ptr<TiledSource> openTiffStack(const std::filesystem::path& path);

}  // namespace fv::io
