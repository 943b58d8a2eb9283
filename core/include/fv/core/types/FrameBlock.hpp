#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <vector>

#include <opencv2/core.hpp>

#include "fv/core/types/Dtype.hpp"

namespace fv
{

/** Extent of a 4-D pixel array */
struct Shape {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::size_t slices = 0;
    std::size_t frames = 0;

    [[nodiscard]] std::size_t frameElements() const { return rows * cols * slices; }
    [[nodiscard]] std::size_t elements() const { return frameElements() * frames; }
    [[nodiscard]] bool empty() const { return elements() == 0; }

    bool operator==(const Shape& o) const
    {
        return rows == o.rows && cols == o.cols && slices == o.slices &&
               frames == o.frames;
    }
    bool operator!=(const Shape& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const Shape& s);

/**
 * @brief Owned 4-D pixel buffer indexed (row, col, slice, frame)
 *
 * Storage order matches the container data region: frames outermost, each
 * frame row-major with the slices of a pixel stored next to each other. A
 * single frame therefore has the memory layout of a rows x cols cv::Mat with
 * `slices` channels, and frame() hands out exactly such a header.
 *
 * Copying a FrameBlock copies its elements.
 */
class FrameBlock
{
public:
    FrameBlock() = default;
    FrameBlock(const Shape& shape, ElementType type);

    /** Stack equally sized frames along the frame axis. */
    static FrameBlock fromFrames(const std::vector<cv::Mat>& frames);

    /** Wrap a single frame (rows x cols, channels become slices). */
    static FrameBlock fromMat(const cv::Mat& frame);

    [[nodiscard]] const Shape& shape() const { return shape_; }
    [[nodiscard]] ElementType elementType() const { return type_; }
    [[nodiscard]] bool empty() const { return shape_.empty(); }

    [[nodiscard]] std::size_t elementBytes() const { return elementSize(type_); }
    [[nodiscard]] std::size_t pixelBytes() const { return shape_.slices * elementBytes(); }
    [[nodiscard]] std::size_t frameBytes() const { return shape_.frameElements() * elementBytes(); }
    [[nodiscard]] std::size_t sizeBytes() const { return data_.size(); }

    [[nodiscard]] std::uint8_t* data() { return data_.data(); }
    [[nodiscard]] const std::uint8_t* data() const { return data_.data(); }
    [[nodiscard]] std::uint8_t* frameData(std::size_t f) { return data_.data() + f * frameBytes(); }
    [[nodiscard]] const std::uint8_t* frameData(std::size_t f) const
    {
        return data_.data() + f * frameBytes();
    }

    /** OpenCV type of one frame (depth plus slices as channels). */
    [[nodiscard]] int cvType() const;

    /** Header over frame f that aliases this block; valid while the block lives. */
    cv::Mat frame(std::size_t f);
    [[nodiscard]] cv::Mat frame(std::size_t f) const;

    /** Copy a frame in; size, channels and depth must match. */
    void setFrame(std::size_t f, const cv::Mat& m);

    template <typename T>
    T& at(std::size_t r, std::size_t c, std::size_t s, std::size_t f)
    {
        return *reinterpret_cast<T*>(data_.data() + offset(r, c, s, f));
    }

    template <typename T>
    const T& at(std::size_t r, std::size_t c, std::size_t s, std::size_t f) const
    {
        return *reinterpret_cast<const T*>(data_.data() + offset(r, c, s, f));
    }

    /** Element as double, whatever the element type. */
    [[nodiscard]] double value(std::size_t r, std::size_t c, std::size_t s, std::size_t f) const;

    /** Byte offset of an element; throws std::out_of_range. */
    [[nodiscard]] std::size_t offset(std::size_t r, std::size_t c, std::size_t s, std::size_t f) const;

    /** Fill every element with v, saturated to the element type. */
    void fill(double v);

    /** Element-wise conversion with saturation. */
    [[nodiscard]] FrameBlock convertTo(ElementType type) const;

    bool operator==(const FrameBlock& o) const
    {
        return shape_ == o.shape_ && type_ == o.type_ && data_ == o.data_;
    }

private:
    Shape shape_;
    ElementType type_ = ElementType::Unknown;
    std::vector<std::uint8_t> data_;
};

}  // namespace fv
