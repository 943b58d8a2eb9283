#include "fv/core/io/FrameSource.hpp"

#include <algorithm>
#include <cstring>

#include <tiffio.h>

#include "fv/core/io/MultiPartTiff.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

namespace
{

struct TiffCloser {
    void operator()(TIFF* t) const
    {
        if (t) TIFFClose(t);
    }
};
using TiffPtr = std::unique_ptr<TIFF, TiffCloser>;

struct PageFormat {
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t bps = 0;
    uint16_t spp = 1;
    uint16_t sampleFormat = SAMPLEFORMAT_UINT;
    uint16_t planar = PLANARCONFIG_CONTIG;

    bool operator==(const PageFormat& o) const
    {
        return width == o.width && height == o.height && bps == o.bps && spp == o.spp &&
               sampleFormat == o.sampleFormat && planar == o.planar;
    }
};

PageFormat readPageFormat(TIFF* tif)
{
    PageFormat fmt;
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &fmt.width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &fmt.height);
    TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &fmt.bps);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &fmt.spp);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLEFORMAT, &fmt.sampleFormat);
    TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &fmt.planar);
    return fmt;
}

ElementType elementTypeOf(const PageFormat& fmt, const fs::path& path)
{
    if (fmt.sampleFormat == SAMPLEFORMAT_UINT && fmt.bps == 8) return ElementType::UInt8;
    if (fmt.sampleFormat == SAMPLEFORMAT_UINT && fmt.bps == 16) return ElementType::UInt16;
    if (fmt.sampleFormat == SAMPLEFORMAT_IEEEFP && fmt.bps == 32) return ElementType::Float32;
    if (fmt.sampleFormat == SAMPLEFORMAT_IEEEFP && fmt.bps == 64) return ElementType::Float64;
    throw FormatError("unsupported TIFF sample format " + std::to_string(fmt.sampleFormat) + "/" +
                      std::to_string(fmt.bps) + " bits in " + path.string());
}

}  // namespace

struct TiffStackSource::Impl {
    MultiPartSequence seq;
    std::vector<TiffPtr> handles;
    PageFormat format;
    std::size_t elemBytes = 0;

    // Copy the pixels of one decoded image row that fall in `cols`
    void copyRow(const uint8_t* row, std::size_t dstRow, Range cols, std::size_t frameInRead,
                 const Range& frames, TiledBuffer& out) const
    {
        const std::size_t px = out.slices * elemBytes;
        for (std::size_t c = cols.begin; c < cols.end; ++c) {
            const std::size_t dstCol = c - cols.begin;
            std::uint8_t* dst =
                out.bytes.data() + ((dstRow * out.cols + dstCol) * frames.size() + frameInRead) * px;
            std::memcpy(dst, row + c * px, px);
        }
    }

    void readPage(TIFF* tif, const fs::path& path, Range rows, Range cols, std::size_t frameInRead,
                  const Range& frames, TiledBuffer& out) const
    {
        const std::size_t px = out.slices * elemBytes;
        if (TIFFIsTiled(tif)) {
            uint32_t tileW = 0, tileH = 0;
            TIFFGetField(tif, TIFFTAG_TILEWIDTH, &tileW);
            TIFFGetField(tif, TIFFTAG_TILELENGTH, &tileH);
            std::vector<uint8_t> buf(static_cast<std::size_t>(TIFFTileSize(tif)));
            const uint32_t y0 = static_cast<uint32_t>(rows.begin / tileH) * tileH;
            const uint32_t x0 = static_cast<uint32_t>(cols.begin / tileW) * tileW;
            std::vector<uint8_t> row(static_cast<std::size_t>(format.width) * px);
            for (uint32_t y = y0; y < rows.end; y += tileH) {
                for (uint32_t x = x0; x < cols.end; x += tileW) {
                    if (TIFFReadTile(tif, buf.data(), x, y, 0, 0) < 0) {
                        throw FormatError("TIFFReadTile failed at (" + std::to_string(x) + "," +
                                          std::to_string(y) + ") in " + path.string());
                    }
                    const std::size_t rEnd = std::min<std::size_t>(y + tileH, rows.end);
                    const std::size_t cBegin = std::max<std::size_t>(x, cols.begin);
                    const std::size_t cEnd = std::min<std::size_t>(x + tileW, cols.end);
                    for (std::size_t r = std::max<std::size_t>(y, rows.begin); r < rEnd; ++r) {
                        // Place the tile row at its image position, then copy the wanted columns
                        const uint8_t* src = buf.data() + (r - y) * tileW * px;
                        std::memcpy(row.data() + cBegin * px, src + (cBegin - x) * px,
                                    (cEnd - cBegin) * px);
                        copyRow(row.data(), r - rows.begin, Range{cBegin, cEnd}, frameInRead,
                                frames, out);
                    }
                }
            }
            return;
        }

        uint32_t rowsPerStrip = format.height;
        TIFFGetFieldDefaulted(tif, TIFFTAG_ROWSPERSTRIP, &rowsPerStrip);
        rowsPerStrip = std::min(rowsPerStrip, format.height);
        const std::size_t scanline = static_cast<std::size_t>(format.width) * px;
        std::vector<uint8_t> buf(static_cast<std::size_t>(TIFFStripSize(tif)));
        const uint32_t firstStrip = static_cast<uint32_t>(rows.begin / rowsPerStrip);
        const uint32_t lastStrip = static_cast<uint32_t>((rows.end - 1) / rowsPerStrip);
        for (uint32_t strip = firstStrip; strip <= lastStrip; ++strip) {
            if (TIFFReadEncodedStrip(tif, strip, buf.data(), -1) < 0) {
                throw FormatError("TIFFReadEncodedStrip failed for strip " + std::to_string(strip) +
                                  " in " + path.string());
            }
            const std::size_t stripRow = static_cast<std::size_t>(strip) * rowsPerStrip;
            const std::size_t rBegin = std::max<std::size_t>(stripRow, rows.begin);
            const std::size_t rEnd = std::min<std::size_t>(stripRow + rowsPerStrip, rows.end);
            for (std::size_t r = rBegin; r < rEnd; ++r) {
                copyRow(buf.data() + (r - stripRow) * scanline, r - rows.begin, cols, frameInRead,
                        frames, out);
            }
        }
    }
};

TiffStackSource::TiffStackSource(const fs::path& path, bool multiPart)
    : impl_(std::make_unique<Impl>())
{
    if (multiPart) {
        impl_->seq = detectMultiPart(path);
    } else if (fs::exists(path)) {
        impl_->seq.files = {path};
    }
    if (impl_->seq.files.empty()) {
        throw NotFoundError("TIFF stack not found: " + path.string());
    }

    bool first = true;
    for (const auto& file : impl_->seq.files) {
        TiffPtr tif(TIFFOpen(file.string().c_str(), "r"));
        if (!tif) {
            throw FormatError("cannot open TIFF " + file.string());
        }
        auto fmt = readPageFormat(tif.get());
        if (first) {
            impl_->format = fmt;
            type_ = elementTypeOf(fmt, file);
            if (fmt.planar != PLANARCONFIG_CONTIG && fmt.spp > 1) {
                throw FormatError("planar TIFF layout is not supported: " + file.string());
            }
            first = false;
        } else if (!(fmt == impl_->format)) {
            throw FormatError("TIFF part " + file.string() +
                              " does not match the format of the first part");
        }
        impl_->seq.framesPerFile.push_back(TIFFNumberOfDirectories(tif.get()));
        impl_->handles.push_back(std::move(tif));
    }
    impl_->elemBytes = elementSize(type_);
    shape_ = {impl_->format.height, impl_->format.width, impl_->format.spp,
              impl_->seq.totalFrames()};
    if (impl_->seq.files.size() > 1) {
        Logger()->info("Reading {} as {} parts with {} frames in total", path.string(),
                       impl_->seq.files.size(), shape_.frames);
    }
}

TiffStackSource::~TiffStackSource() = default;

const std::vector<fs::path>& TiffStackSource::files() const
{
    return impl_->seq.files;
}

TiledBuffer TiffStackSource::read(Range rows, Range cols, Range frames)
{
    if (rows.end > shape_.rows || cols.end > shape_.cols || frames.end > shape_.frames) {
        throw InputError("region exceeds the TIFF stack extent");
    }
    TiledBuffer out;
    out.rows = rows.size();
    out.cols = cols.size();
    out.frames = frames.size();
    out.slices = shape_.slices;
    out.type = type_;
    out.bytes.assign(out.rows * out.cols * out.frames * out.slices * impl_->elemBytes, 0);
    if (out.bytes.empty()) {
        return out;
    }

    for (std::size_t f = frames.begin; f < frames.end; ++f) {
        auto [file, page] = impl_->seq.locate(f);
        TIFF* tif = impl_->handles[file].get();
        if (!TIFFSetDirectory(tif, static_cast<tdir_t>(page))) {
            throw FormatError("cannot select page " + std::to_string(page) + " of " +
                              impl_->seq.files[file].string());
        }
        impl_->readPage(tif, impl_->seq.files[file], rows, cols, f - frames.begin, frames, out);
    }
    return out;
}

std::unique_ptr<TiledSource> openTiffStack(const fs::path& path)
{
    return std::make_unique<TiffStackSource>(path);
}

FrameBlock permuteTiledToCanonical(const TiledBuffer& buf)
{
    FrameBlock out(Shape{buf.rows, buf.cols, buf.slices, buf.frames}, buf.type);
    const std::size_t px = out.pixelBytes();
    for (std::size_t r = 0; r < buf.rows; ++r) {
        for (std::size_t c = 0; c < buf.cols; ++c) {
            const std::uint8_t* src = buf.bytes.data() + ((r * buf.cols + c) * buf.frames) * px;
            for (std::size_t f = 0; f < buf.frames; ++f) {
                std::memcpy(out.frameData(f) + (r * buf.cols + c) * px, src + f * px, px);
            }
        }
    }
    return out;
}

}  // namespace fv::io
