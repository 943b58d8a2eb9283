#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "fv/core/types/FrameBlock.hpp"

namespace fv
{

/**
 * @brief Per-frame image transformation applied at read time
 *
 * A transform receives one frame (rows x cols, slices as channels) and returns
 * the transformed frame, which may differ in size, channel count or depth.
 * Transforms are never written to a container.
 */
class FrameTransform
{
public:
    virtual ~FrameTransform() = default;

    [[nodiscard]] virtual cv::Mat apply(const cv::Mat& frame) const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

using FrameTransformPtr = std::shared_ptr<const FrameTransform>;

// Arbitrary user function
class FunctionTransform final : public FrameTransform
{
public:
    using Function = std::function<cv::Mat(const cv::Mat&)>;

    explicit FunctionTransform(Function fn, std::string name = "function");

    [[nodiscard]] cv::Mat apply(const cv::Mat& frame) const override;
    [[nodiscard]] std::string describe() const override { return name_; }

private:
    Function fn_;
    std::string name_;
};

/**
 * Affine warp given as a 2x3 matrix mapping input (x, y) to output (x, y).
 * The output canvas is the bounding box of the warped frame, so a rotation
 * grows the frame rather than clipping it.
 */
class AffineTransform final : public FrameTransform
{
public:
    explicit AffineTransform(const cv::Matx23d& matrix);

    [[nodiscard]] cv::Mat apply(const cv::Mat& frame) const override;
    [[nodiscard]] std::string describe() const override;
    [[nodiscard]] const cv::Matx23d& matrix() const { return matrix_; }

private:
    cv::Matx23d matrix_;
};

// Lens distortion correction with a pinhole camera model (cv::undistort)
class UndistortTransform final : public FrameTransform
{
public:
    UndistortTransform(const cv::Matx33d& cameraMatrix, std::vector<double> distCoeffs);

    [[nodiscard]] cv::Mat apply(const cv::Mat& frame) const override;
    [[nodiscard]] std::string describe() const override;
    [[nodiscard]] const cv::Matx33d& cameraMatrix() const { return cameraMatrix_; }
    [[nodiscard]] const std::vector<double>& distCoeffs() const { return distCoeffs_; }

private:
    cv::Matx33d cameraMatrix_;
    std::vector<double> distCoeffs_;
};

/**
 * Apply a transform to every frame of a block.
 *
 * The first transformed frame fixes the output shape and element type; the
 * remaining frames are transformed into the preallocated result.
 *
 * @throws InputError if a result has an unsupported depth or a shape that
 *         differs from the first frame
 */
FrameBlock applyTransform(const FrameBlock& block, const FrameTransform& transform);

// Transform a single frame and check the result has a supported depth
cv::Mat applyToFrame(const cv::Mat& frame, const FrameTransform& transform);

// Sub-rectangle of each frame plus a slice range (used by Store::crop)
FrameTransformPtr makeCropTransform(const cv::Rect& roi, int sliceBegin, int sliceCount);

// cv::resize by `scale`, slice axis replicated `depth` times (used by Store::resize)
FrameTransformPtr makeResizeTransform(double scale, int depth);

}  // namespace fv
