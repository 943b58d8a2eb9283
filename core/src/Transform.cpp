#include "fv/core/util/Transform.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

#include "fv/core/types/Exceptions.hpp"

namespace fv
{

namespace
{

// OpenCV warps handle at most 4 channels; wider frames are processed per channel
template <typename Op>
cv::Mat perChannel(const cv::Mat& frame, Op op)
{
    if (frame.channels() <= 4) {
        return op(frame);
    }
    std::vector<cv::Mat> channels;
    cv::split(frame, channels);
    for (auto& c : channels) {
        c = op(c);
    }
    cv::Mat out;
    cv::merge(channels, out);
    return out;
}

}  // namespace

FunctionTransform::FunctionTransform(Function fn, std::string name)
    : fn_(std::move(fn)), name_(std::move(name))
{
    if (!fn_) {
        throw InputError("function transform needs a callable");
    }
}

cv::Mat FunctionTransform::apply(const cv::Mat& frame) const
{
    return fn_(frame);
}

AffineTransform::AffineTransform(const cv::Matx23d& matrix) : matrix_(matrix)
{
    const double det = matrix(0, 0) * matrix(1, 1) - matrix(0, 1) * matrix(1, 0);
    if (std::abs(det) < 1e-12) {
        throw InputError("affine transform matrix is singular");
    }
}

cv::Mat AffineTransform::apply(const cv::Mat& frame) const
{
    const double w = frame.cols;
    const double h = frame.rows;
    double minX = 0, minY = 0, maxX = 0, maxY = 0;
    bool first = true;
    const cv::Point2d corners[] = {{0, 0}, {w, 0}, {0, h}, {w, h}};
    for (const auto& p : corners) {
        const double tx = matrix_(0, 0) * p.x + matrix_(0, 1) * p.y + matrix_(0, 2);
        const double ty = matrix_(1, 0) * p.x + matrix_(1, 1) * p.y + matrix_(1, 2);
        if (first) {
            minX = maxX = tx;
            minY = maxY = ty;
            first = false;
        }
        minX = std::min(minX, tx);
        maxX = std::max(maxX, tx);
        minY = std::min(minY, ty);
        maxY = std::max(maxY, ty);
    }

    // Shift the warp so the bounding box starts at the origin
    cv::Matx23d m = matrix_;
    m(0, 2) -= minX;
    m(1, 2) -= minY;
    const cv::Size size(std::max(1, static_cast<int>(std::lround(maxX - minX))),
                        std::max(1, static_cast<int>(std::lround(maxY - minY))));

    return perChannel(frame, [&](const cv::Mat& src) {
        cv::Mat dst;
        cv::warpAffine(src, dst, cv::Mat(m), size, cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                       cv::Scalar::all(0));
        return dst;
    });
}

std::string AffineTransform::describe() const
{
    std::ostringstream oss;
    oss << "affine [" << matrix_(0, 0) << " " << matrix_(0, 1) << " " << matrix_(0, 2) << "; "
        << matrix_(1, 0) << " " << matrix_(1, 1) << " " << matrix_(1, 2) << "]";
    return oss.str();
}

UndistortTransform::UndistortTransform(const cv::Matx33d& cameraMatrix,
                                       std::vector<double> distCoeffs)
    : cameraMatrix_(cameraMatrix), distCoeffs_(std::move(distCoeffs))
{
    static const std::vector<std::size_t> validCounts{4, 5, 8, 12, 14};
    if (std::find(validCounts.begin(), validCounts.end(), distCoeffs_.size()) == validCounts.end()) {
        throw InputError("distortion model needs 4, 5, 8, 12 or 14 coefficients, got " +
                         std::to_string(distCoeffs_.size()));
    }
    if (cameraMatrix_(0, 0) <= 0 || cameraMatrix_(1, 1) <= 0) {
        throw InputError("camera matrix needs positive focal lengths");
    }
}

cv::Mat UndistortTransform::apply(const cv::Mat& frame) const
{
    return perChannel(frame, [&](const cv::Mat& src) {
        cv::Mat dst;
        cv::undistort(src, dst, cv::Mat(cameraMatrix_), distCoeffs_);
        return dst;
    });
}

std::string UndistortTransform::describe() const
{
    std::ostringstream oss;
    oss << "undistort fx=" << cameraMatrix_(0, 0) << " fy=" << cameraMatrix_(1, 1)
        << " cx=" << cameraMatrix_(0, 2) << " cy=" << cameraMatrix_(1, 2) << " ("
        << distCoeffs_.size() << " coefficients)";
    return oss.str();
}

cv::Mat applyToFrame(const cv::Mat& frame, const FrameTransform& transform)
{
    cv::Mat out = transform.apply(frame);
    if (out.empty()) {
        throw InputError("transform '" + transform.describe() + "' returned an empty frame");
    }
    if (elementTypeFromCvDepth(out.depth()) == ElementType::Unknown) {
        throw InputError("transform '" + transform.describe() +
                         "' produced an unsupported element type (OpenCV depth " +
                         std::to_string(out.depth()) + ")");
    }
    return out;
}

FrameBlock applyTransform(const FrameBlock& block, const FrameTransform& transform)
{
    const auto frames = block.shape().frames;
    if (frames == 0) {
        return block;
    }

    cv::Mat first = applyToFrame(block.frame(0), transform);
    Shape shape{static_cast<std::size_t>(first.rows), static_cast<std::size_t>(first.cols),
                static_cast<std::size_t>(first.channels()), frames};
    FrameBlock out(shape, elementTypeFromCvDepth(first.depth()));
    out.setFrame(0, first);

    for (std::size_t f = 1; f < frames; ++f) {
        cv::Mat m = applyToFrame(block.frame(f), transform);
        if (m.size() != first.size() || m.type() != first.type()) {
            throw InputError("transform '" + transform.describe() + "' changed the frame shape at frame " +
                             std::to_string(f));
        }
        out.setFrame(f, m);
    }
    return out;
}

FrameTransformPtr makeCropTransform(const cv::Rect& roi, int sliceBegin, int sliceCount)
{
    std::ostringstream name;
    name << "crop " << roi << " slices " << sliceBegin << "+" << sliceCount;
    return std::make_shared<FunctionTransform>(
        [roi, sliceBegin, sliceCount](const cv::Mat& frame) {
            cv::Mat cropped = frame(roi);
            if (sliceBegin == 0 && sliceCount == frame.channels()) {
                return cropped.clone();
            }
            std::vector<cv::Mat> channels;
            cv::split(cropped, channels);
            std::vector<cv::Mat> kept(channels.begin() + sliceBegin,
                                      channels.begin() + sliceBegin + sliceCount);
            cv::Mat out;
            cv::merge(kept, out);
            return out;
        },
        name.str());
}

FrameTransformPtr makeResizeTransform(double scale, int depth)
{
    std::ostringstream name;
    name << "resize x" << scale << " depth " << depth;
    return std::make_shared<FunctionTransform>(
        [scale, depth](const cv::Mat& frame) {
            cv::Mat resized = perChannel(frame, [&](const cv::Mat& src) {
                cv::Mat dst;
                cv::resize(src, dst, cv::Size(), scale, scale, cv::INTER_LINEAR);
                return dst;
            });
            if (depth == 1) {
                return resized;
            }
            std::vector<cv::Mat> copies(static_cast<std::size_t>(depth), resized);
            cv::Mat out;
            cv::merge(copies, out);
            return out;
        },
        name.str());
}

}  // namespace fv
