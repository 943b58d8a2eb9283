#include "fv/core/util/Tiff.hpp"

#include <tiffio.h>

#include <algorithm>
#include <cstring>
#include <vector>

#include "fv/core/types/Exceptions.hpp"

namespace fv
{

namespace
{

// BigTIFF beyond this size; classic TIFF offsets are 32-bit
constexpr std::uint64_t kClassicTiffLimit = 3ull << 30;

void setCompression(TIFF* tf, const TiffWriteOptions& opts)
{
    switch (opts.compression) {
        case TiffWriteOptions::Compression::NONE:
            TIFFSetField(tf, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
            break;
        case TiffWriteOptions::Compression::LZW:
            TIFFSetField(tf, TIFFTAG_COMPRESSION, COMPRESSION_LZW);
            break;
        case TiffWriteOptions::Compression::DEFLATE:
            TIFFSetField(tf, TIFFTAG_COMPRESSION, COMPRESSION_DEFLATE);
            break;
    }
}

void setPredictor(TIFF* tf, const TiffWriteOptions& opts, bool isFloat)
{
    if (opts.compression == TiffWriteOptions::Compression::NONE) {
        return;
    }
    bool useFloatPredictor = isFloat &&
                             (opts.predictor == TiffWriteOptions::Predictor::FLOATINGPOINT);
    if (useFloatPredictor) {
#ifdef PREDICTOR_FLOATINGPOINT
        TIFFSetField(tf, TIFFTAG_PREDICTOR, PREDICTOR_FLOATINGPOINT);
#else
        TIFFSetField(tf, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
#endif
    } else if (opts.predictor == TiffWriteOptions::Predictor::HORIZONTAL) {
        TIFFSetField(tf, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
    }
}

void writePage(TIFF* tf, const cv::Mat& img, const TiffWriteOptions& opts,
               const std::filesystem::path& outPath)
{
    int bits = 0, samplefmt = 0;
    switch (img.depth()) {
        case CV_8U:
            bits = 8;
            samplefmt = SAMPLEFORMAT_UINT;
            break;
        case CV_16U:
            bits = 16;
            samplefmt = SAMPLEFORMAT_UINT;
            break;
        case CV_32F:
            bits = 32;
            samplefmt = SAMPLEFORMAT_IEEEFP;
            break;
        case CV_64F:
            bits = 64;
            samplefmt = SAMPLEFORMAT_IEEEFP;
            break;
        default:
            throw InputError("unsupported depth for " + outPath.string());
    }

    const uint32_t W = static_cast<uint32_t>(img.cols);
    const uint32_t H = static_cast<uint32_t>(img.rows);
    const uint32_t tile = static_cast<uint32_t>(std::max(16, opts.tileSize / 16 * 16));
    const uint16_t spp = static_cast<uint16_t>(img.channels());

    TIFFSetField(tf, TIFFTAG_IMAGEWIDTH,      W);
    TIFFSetField(tf, TIFFTAG_IMAGELENGTH,     H);
    TIFFSetField(tf, TIFFTAG_SAMPLESPERPIXEL, spp);
    TIFFSetField(tf, TIFFTAG_BITSPERSAMPLE,   bits);
    TIFFSetField(tf, TIFFTAG_SAMPLEFORMAT,    samplefmt);
    TIFFSetField(tf, TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
    TIFFSetField(tf, TIFFTAG_ORIENTATION,     ORIENTATION_TOPLEFT);
    TIFFSetField(tf, TIFFTAG_TILEWIDTH,       tile);
    TIFFSetField(tf, TIFFTAG_TILELENGTH,      tile);

    if (spp == 3 && bits == 8) {
        TIFFSetField(tf, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    } else {
        TIFFSetField(tf, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
        if (spp > 1) {
            std::vector<uint16_t> extra(spp - 1, EXTRASAMPLE_UNSPECIFIED);
            TIFFSetField(tf, TIFFTAG_EXTRASAMPLES, static_cast<uint16_t>(extra.size()), extra.data());
        }
    }

    setCompression(tf, opts);
    setPredictor(tf, opts, samplefmt == SAMPLEFORMAT_IEEEFP);

    const std::size_t px = img.elemSize();
    const tmsize_t tileBytes = static_cast<tmsize_t>(tile) * tile * static_cast<tmsize_t>(px);
    std::vector<uint8_t> tileBuf(static_cast<size_t>(tileBytes), 0);

    for (uint32_t y0 = 0; y0 < H; y0 += tile) {
        const uint32_t dy = std::min(tile, H - y0);
        for (uint32_t x0 = 0; x0 < W; x0 += tile) {
            const uint32_t dx = std::min(tile, W - x0);

            // Fill tile (pad with zeros)
            std::fill(tileBuf.begin(), tileBuf.end(), 0);
            for (uint32_t ty = 0; ty < dy; ++ty) {
                const uint8_t* src = img.ptr<uint8_t>(static_cast<int>(y0 + ty)) + x0 * px;
                std::memcpy(tileBuf.data() + static_cast<size_t>(ty) * tile * px, src, dx * px);
            }

            const ttile_t tileIndex = TIFFComputeTile(tf, x0, y0, 0, 0);
            if (TIFFWriteEncodedTile(tf, tileIndex, tileBuf.data(), tileBytes) < 0) {
                throw WriteError("TIFFWriteEncodedTile failed at tile (" + std::to_string(x0) + "," +
                                 std::to_string(y0) + ") in " + outPath.string());
            }
        }
    }

    if (!TIFFWriteDirectory(tf)) {
        throw WriteError("TIFFWriteDirectory failed for " + outPath.string());
    }
}

}  // namespace

bool needsBigTiff(std::uint64_t totalBytes, const TiffWriteOptions& opts)
{
    return opts.forceBigTiff || totalBytes > kClassicTiffLimit;
}

struct TiffStackWriter::Impl {
    TIFF* tf = nullptr;
    std::filesystem::path path;
    TiffWriteOptions opts;
};

TiffStackWriter::TiffStackWriter(const std::filesystem::path& outPath,
                                 const TiffWriteOptions& opts, bool bigTiff)
    : impl_(std::make_unique<Impl>())
{
    impl_->path = outPath;
    impl_->opts = opts;
    impl_->tf = TIFFOpen(outPath.string().c_str(), bigTiff ? "w8" : "w");
    if (!impl_->tf)
        throw WriteError("Failed to open TIFF for writing: " + outPath.string());
}

TiffStackWriter::~TiffStackWriter()
{
    if (impl_->tf) {
        TIFFClose(impl_->tf);
    }
}

void TiffStackWriter::append(const cv::Mat& page)
{
    if (!impl_->tf)
        throw WriteError("TIFF already closed: " + impl_->path.string());
    if (page.empty())
        throw InputError("empty frame for " + impl_->path.string());
    writePage(impl_->tf, page, impl_->opts, impl_->path);
    ++pages_;
}

void TiffStackWriter::close()
{
    if (impl_->tf) {
        TIFFClose(impl_->tf);
        impl_->tf = nullptr;
    }
}

void writeTiffStack(const std::filesystem::path& outPath,
                    const std::vector<cv::Mat>& frames,
                    const TiffWriteOptions& opts)
{
    if (frames.empty())
        throw InputError("no frames to write to " + outPath.string());

    std::uint64_t total = 0;
    for (const auto& f : frames) {
        if (f.empty())
            throw InputError("empty frame for " + outPath.string());
        total += static_cast<std::uint64_t>(f.total() * f.elemSize());
    }

    TiffStackWriter writer(outPath, opts, needsBigTiff(total, opts));
    for (const auto& f : frames) {
        writer.append(f);
    }
    writer.close();
}

void writeTiffStack(const std::filesystem::path& outPath,
                    const FrameBlock& block,
                    const TiffWriteOptions& opts)
{
    std::vector<cv::Mat> frames;
    frames.reserve(block.shape().frames);
    for (std::size_t f = 0; f < block.shape().frames; ++f) {
        frames.push_back(block.frame(f));
    }
    writeTiffStack(outPath, frames, opts);
}

}  // namespace fv
