#include "fv/core/io/Export.hpp"

#include <opencv2/videoio.hpp>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

namespace
{

int fourccFor(ExportProfile profile)
{
    switch (profile) {
        case ExportProfile::Mpeg4:
            return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
        case ExportProfile::Archival:
            return cv::VideoWriter::fourcc('H', 'F', 'Y', 'U');
        case ExportProfile::MotionJpegAvi:
            return cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        case ExportProfile::MotionJpeg2000:
            return cv::VideoWriter::fourcc('M', 'J', '2', 'C');
        case ExportProfile::Tiff:
        case ExportProfile::TiffUncompressed:
            break;
    }
    throw InputError(exportProfileToString(profile) + " is not a video profile");
}

class VideoFrameWriter final : public FrameWriter
{
public:
    explicit VideoFrameWriter(const FrameWriterSpec& spec) : path_(spec.path), size_(spec.frameSize)
    {
        if (spec.channels != 1 && spec.channels != 3) {
            throw InputError(exportProfileToString(spec.profile) + " needs 1 or 3 slices, got " +
                             std::to_string(spec.channels));
        }
        if (!writer_.open(spec.path.string(), fourccFor(spec.profile), spec.frameRate, size_,
                          spec.channels == 3)) {
            throw WriteError("cannot open a " + exportProfileToString(spec.profile) +
                             " encoder for " + spec.path.string());
        }
    }

    ~VideoFrameWriter() override
    {
        if (writer_.isOpened()) {
            writer_.release();
        }
    }

    void write(const cv::Mat& frame) override
    {
        if (!writer_.isOpened()) {
            throw WriteError("video already closed: " + path_.string());
        }
        // VideoWriter drops mismatched frames silently
        if (frame.size() != size_ || frame.depth() != CV_8U) {
            throw InputError("frame does not match the 8-bit " + std::to_string(size_.height) +
                             "x" + std::to_string(size_.width) + " video " + path_.string());
        }
        writer_.write(frame);
    }

    void close() override { writer_.release(); }

private:
    cv::VideoWriter writer_;
    fs::path path_;
    cv::Size size_;
};

class TiffFrameWriter final : public FrameWriter
{
public:
    explicit TiffFrameWriter(const FrameWriterSpec& spec)
        : writer_(spec.path, tiffOptions(spec), needsBigTiff(spec.totalBytes, spec.tiff))
    {
    }

    void write(const cv::Mat& frame) override { writer_.append(frame); }
    void close() override { writer_.close(); }

private:
    static TiffWriteOptions tiffOptions(const FrameWriterSpec& spec)
    {
        auto o = spec.tiff;
        o.compression = spec.profile == ExportProfile::TiffUncompressed
                            ? TiffWriteOptions::Compression::NONE
                            : TiffWriteOptions::Compression::LZW;
        return o;
    }

    TiffStackWriter writer_;
};

}  // namespace

std::string exportProfileToString(ExportProfile profile)
{
    switch (profile) {
        case ExportProfile::Mpeg4:
            return "MPEG-4";
        case ExportProfile::Archival:
            return "Archival";
        case ExportProfile::MotionJpegAvi:
            return "Motion JPEG AVI";
        case ExportProfile::MotionJpeg2000:
            return "Motion JPEG 2000";
        case ExportProfile::Tiff:
            return "TIF";
        case ExportProfile::TiffUncompressed:
            return "TIF NOCOMP";
    }
    return "unknown";
}

ExportProfile exportProfileFromString(const std::string& name)
{
    for (auto p : {ExportProfile::Mpeg4, ExportProfile::Archival, ExportProfile::MotionJpegAvi,
                   ExportProfile::MotionJpeg2000, ExportProfile::Tiff,
                   ExportProfile::TiffUncompressed}) {
        if (exportProfileToString(p) == name) {
            return p;
        }
    }
    throw InputError("unknown export profile '" + name +
                     "', expected MPEG-4, Archival, Motion JPEG AVI, Motion JPEG 2000, TIF or "
                     "TIF NOCOMP");
}

std::string exportExtension(ExportProfile profile)
{
    switch (profile) {
        case ExportProfile::Mpeg4:
            return ".mp4";
        case ExportProfile::Archival:
        case ExportProfile::MotionJpegAvi:
            return ".avi";
        case ExportProfile::MotionJpeg2000:
            return ".mj2";
        case ExportProfile::Tiff:
        case ExportProfile::TiffUncompressed:
            return ".tif";
    }
    return {};
}

bool isVideoProfile(ExportProfile profile)
{
    return profile != ExportProfile::Tiff && profile != ExportProfile::TiffUncompressed;
}

std::unique_ptr<FrameWriter> openFrameWriter(const FrameWriterSpec& spec)
{
    Logger()->debug("Opening {} writer for {}", exportProfileToString(spec.profile),
                    spec.path.string());
    if (isVideoProfile(spec.profile)) {
        return std::make_unique<VideoFrameWriter>(spec);
    }
    return std::make_unique<TiffFrameWriter>(spec);
}

fs::path exportPath(const fs::path& basename, const ExportOptions& options)
{
    const auto stem = basename.stem().string();
    if (stem.empty() && options.suffix.empty()) {
        throw InputError("export file name and suffix are both empty");
    }
    return basename.parent_path() / (stem + options.suffix + exportExtension(options.profile));
}

cv::Mat toVideoDepth(const cv::Mat& frame)
{
    cv::Mat out;
    switch (frame.depth()) {
        case CV_8U:
            return frame;
        case CV_16U:
            frame.convertTo(out, CV_8U, 1.0 / 257.0);
            return out;
        case CV_32F:
        case CV_64F:
            frame.convertTo(out, CV_8U, 255.0);
            return out;
        default:
            throw InputError("cannot convert depth " + std::to_string(frame.depth()) +
                             " to 8 bits");
    }
}

}  // namespace fv::io
