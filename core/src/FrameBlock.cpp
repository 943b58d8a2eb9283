#include "fv/core/types/FrameBlock.hpp"

#include <opencv2/core.hpp>

#include "fv/core/types/Exceptions.hpp"

namespace fv
{

namespace
{

// Single-channel rows x (cols * slices) header over one frame
cv::Mat planeView(std::uint8_t* frame, const Shape& s, int depth)
{
    return cv::Mat(static_cast<int>(s.rows), static_cast<int>(s.cols * s.slices), depth, frame);
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const Shape& s)
{
    return os << s.rows << "x" << s.cols << "x" << s.slices << "x" << s.frames;
}

FrameBlock::FrameBlock(const Shape& shape, ElementType type) : shape_(shape), type_(type)
{
    if (type == ElementType::Unknown) {
        throw InputError("cannot allocate a frame block of unknown element type");
    }
    data_.assign(shape.elements() * elementSize(type), 0);
}

FrameBlock FrameBlock::fromFrames(const std::vector<cv::Mat>& frames)
{
    if (frames.empty()) {
        return {};
    }
    const cv::Mat& first = frames.front();
    auto type = elementTypeFromCvDepth(first.depth());
    if (type == ElementType::Unknown) {
        throw InputError("unsupported OpenCV depth " + std::to_string(first.depth()));
    }
    Shape shape{static_cast<std::size_t>(first.rows), static_cast<std::size_t>(first.cols),
                static_cast<std::size_t>(first.channels()), frames.size()};
    FrameBlock block(shape, type);
    for (std::size_t f = 0; f < frames.size(); ++f) {
        block.setFrame(f, frames[f]);
    }
    return block;
}

FrameBlock FrameBlock::fromMat(const cv::Mat& frame)
{
    return fromFrames({frame});
}

int FrameBlock::cvType() const
{
    if (shape_.slices > CV_CN_MAX) {
        throw InputError("a frame with " + std::to_string(shape_.slices) +
                         " slices exceeds the OpenCV channel limit");
    }
    return CV_MAKETYPE(elementTypeToCvDepth(type_), static_cast<int>(shape_.slices));
}

cv::Mat FrameBlock::frame(std::size_t f)
{
    if (f >= shape_.frames) {
        throw std::out_of_range("frame index out of range");
    }
    return {static_cast<int>(shape_.rows), static_cast<int>(shape_.cols), cvType(), frameData(f)};
}

cv::Mat FrameBlock::frame(std::size_t f) const
{
    if (f >= shape_.frames) {
        throw std::out_of_range("frame index out of range");
    }
    // Callers get a read-only view by convention; cv::Mat has no const header type
    return {static_cast<int>(shape_.rows), static_cast<int>(shape_.cols), cvType(),
            const_cast<std::uint8_t*>(frameData(f))};
}

void FrameBlock::setFrame(std::size_t f, const cv::Mat& m)
{
    if (f >= shape_.frames) {
        throw std::out_of_range("frame index out of range");
    }
    if (static_cast<std::size_t>(m.rows) != shape_.rows ||
        static_cast<std::size_t>(m.cols) != shape_.cols ||
        static_cast<std::size_t>(m.channels()) != shape_.slices ||
        elementTypeFromCvDepth(m.depth()) != type_) {
        throw InputError("frame does not match the block shape or element type");
    }
    const std::size_t rowBytes = shape_.cols * pixelBytes();
    std::uint8_t* dst = frameData(f);
    if (m.isContinuous()) {
        std::memcpy(dst, m.data, frameBytes());
        return;
    }
    for (int r = 0; r < m.rows; ++r) {
        std::memcpy(dst + r * rowBytes, m.ptr(r), rowBytes);
    }
}

std::size_t FrameBlock::offset(std::size_t r, std::size_t c, std::size_t s, std::size_t f) const
{
    if (r >= shape_.rows || c >= shape_.cols || s >= shape_.slices || f >= shape_.frames) {
        throw std::out_of_range("element index out of range");
    }
    return (((f * shape_.rows + r) * shape_.cols + c) * shape_.slices + s) * elementBytes();
}

double FrameBlock::value(std::size_t r, std::size_t c, std::size_t s, std::size_t f) const
{
    switch (type_) {
        case ElementType::UInt8:
            return at<std::uint8_t>(r, c, s, f);
        case ElementType::UInt16:
            return at<std::uint16_t>(r, c, s, f);
        case ElementType::Float32:
            return at<float>(r, c, s, f);
        case ElementType::Float64:
            return at<double>(r, c, s, f);
        default:
            throw InputError("frame block has no element type");
    }
}

void FrameBlock::fill(double v)
{
    if (data_.empty()) {
        return;
    }
    for (std::size_t f = 0; f < shape_.frames; ++f) {
        planeView(frameData(f), shape_, elementTypeToCvDepth(type_)).setTo(cv::Scalar::all(v));
    }
}

FrameBlock FrameBlock::convertTo(ElementType type) const
{
    if (type == type_) {
        return *this;
    }
    FrameBlock out(shape_, type);
    if (data_.empty()) {
        return out;
    }
    const int srcDepth = elementTypeToCvDepth(type_);
    const int dstDepth = elementTypeToCvDepth(type);
    for (std::size_t f = 0; f < shape_.frames; ++f) {
        cv::Mat dst = planeView(out.frameData(f), shape_, dstDepth);
        planeView(const_cast<std::uint8_t*>(frameData(f)), shape_, srcDepth).convertTo(dst, dstDepth);
    }
    return out;
}

}  // namespace fv
