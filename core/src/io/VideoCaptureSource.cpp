#include "fv/core/io/FrameSource.hpp"

#include <cmath>

#include <opencv2/videoio.hpp>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fv::io
{

struct VideoCaptureSource::Impl {
    cv::VideoCapture cap;
    std::filesystem::path path;
};

VideoCaptureSource::VideoCaptureSource(const std::filesystem::path& path)
    : impl_(std::make_unique<Impl>())
{
    if (!std::filesystem::exists(path)) {
        throw NotFoundError("video file not found: " + path.string());
    }
    impl_->path = path;
    if (!impl_->cap.open(path.string()) || !impl_->cap.isOpened()) {
        throw FormatError("cannot decode video " + path.string());
    }
    fps_ = impl_->cap.get(cv::CAP_PROP_FPS);
    if (!(fps_ > 0)) {
        throw FormatError("video " + path.string() + " reports no frame rate");
    }
    const double frames = impl_->cap.get(cv::CAP_PROP_FRAME_COUNT);
    duration_ = frames > 0 ? frames / fps_ : 0;
    Logger()->debug("Opened {} ({} fps, {} s)", path.string(), fps_, duration_);
}

VideoCaptureSource::~VideoCaptureSource()
{
    if (impl_ && impl_->cap.isOpened()) {
        impl_->cap.release();
    }
}

void VideoCaptureSource::seek(double seconds)
{
    if (impl_->cap.set(cv::CAP_PROP_POS_MSEC, seconds * 1000.0)) {
        return;
    }
    // Some backends cannot seek by time; fall back to the frame index
    const double frame = std::round(seconds * fps_);
    if (!impl_->cap.set(cv::CAP_PROP_POS_FRAMES, frame)) {
        throw FormatError("cannot seek to " + std::to_string(seconds) + " s in " +
                          impl_->path.string());
    }
}

cv::Mat VideoCaptureSource::decodeNext()
{
    cv::Mat frame;
    if (!impl_->cap.read(frame)) {
        return {};
    }
    return frame;
}

std::unique_ptr<SequentialSource> openVideoCapture(const std::filesystem::path& path)
{
    return std::make_unique<VideoCaptureSource>(path);
}

}  // namespace fv::io
