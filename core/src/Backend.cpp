#include "fv/core/types/Backend.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv
{

// --- WritableBackend ---------------------------------------------------------

FrameBlock WritableBackend::readFrames(const std::vector<std::size_t>& frames)
{
    auto s = shape();
    FrameBlock out(Shape{s.rows, s.cols, s.slices, frames.size()}, elementType());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (frames[i] >= s.frames) {
            throw InputError("frame " + std::to_string(frames[i]) + " is out of range (" +
                             std::to_string(s.frames) + " frames)");
        }
        std::memcpy(out.frameData(i), frameData(frames[i]), out.frameBytes());
    }
    return out;
}

// --- MappedBackend -----------------------------------------------------------

struct ContainerMapping {
    void* data = MAP_FAILED;
    size_t size = 0;
    io::ContainerHeader header;

    ~ContainerMapping()
    {
        if (data != MAP_FAILED) {
            munmap(data, size);
        }
    }
};

MappedBackend::MappedBackend(fs::path path, bool readOnly)
    : state_(BackendMode::MappedContainer, std::move(path)), readOnly_(readOnly)
{
}

MappedBackend::~MappedBackend() = default;

void MappedBackend::link()
{
    if (state_.linked()) {
        return;
    }
    const auto& path = state_.path();
    if (!fs::exists(path)) {
        throw NotFoundError("container not found: " + path.string());
    }
    auto header = io::probeContainer(path);
    if (!header) {
        throw FormatError("file too small to be a container: " + path.string());
    }

    auto mapping = std::make_unique<ContainerMapping>();
    mapping->header = *header;
    mapping->size = io::kContainerHeaderBytes + io::containerDataBytes(*header);

    int fd = open(path.c_str(), readOnly_ ? O_RDONLY : O_RDWR);
    if (fd == -1) {
        throw Error("Failed to open file: " + path.string() + ": " + std::strerror(errno));
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
        close(fd);
        throw Error("Failed to stat file: " + path.string());
    }
    if (static_cast<std::uint64_t>(sb.st_size) < mapping->size) {
        close(fd);
        throw FormatError("container " + path.string() + " holds " + std::to_string(sb.st_size) +
                          " bytes but its header describes " + std::to_string(mapping->size));
    }

    const int prot = readOnly_ ? PROT_READ : (PROT_READ | PROT_WRITE);
    mapping->data = mmap(nullptr, mapping->size, prot, MAP_SHARED, fd, 0);
    close(fd);  // the mapping stays valid without the descriptor
    if (mapping->data == MAP_FAILED) {
        throw Error("Failed to mmap file: " + path.string() + ": " + std::strerror(errno));
    }

    Logger()->debug("Mapped {} ({} bytes{})", path.string(), mapping->size,
                    readOnly_ ? ", read-only" : "");
    state_.setLinked(std::move(mapping));
}

void MappedBackend::unlink()
{
    if (state_.linked()) {
        state_.setUnlinked(BackendMode::MappedContainer);
    }
}

const io::ContainerHeader& MappedBackend::header()
{
    link();
    return state_.resource().header;
}

Shape MappedBackend::shape()
{
    return header().shape;
}

ElementType MappedBackend::elementType()
{
    return header().type;
}

std::uint8_t* MappedBackend::frameData(std::size_t f)
{
    const auto& h = header();
    if (f >= h.shape.frames) {
        throw InputError("frame " + std::to_string(f) + " is out of range (" +
                         std::to_string(h.shape.frames) + " frames)");
    }
    const std::size_t frameBytes = h.shape.frameElements() * elementSize(h.type);
    return static_cast<std::uint8_t*>(state_.resource().data) + io::kContainerHeaderBytes +
           f * frameBytes;
}

void MappedBackend::flush()
{
    if (!state_.linked() || readOnly_) {
        return;
    }
    auto& m = state_.resource();
    if (msync(m.data, m.size, MS_SYNC) == -1) {
        throw WriteError("msync failed for " + state_.path().string() + ": " +
                         std::strerror(errno));
    }
}

// --- StreamBackend -----------------------------------------------------------

struct StreamBackend::Cursor {
    std::unique_ptr<io::SequentialSource> source;
    // Frame the next decodeNext() returns, if known
    std::optional<std::size_t> next;
};

StreamBackend::StreamBackend(fs::path path, io::SequentialSourceFactory factory)
    : state_(BackendMode::StreamDecoder, std::move(path)),
      factory_(factory ? std::move(factory) : io::SequentialSourceFactory(io::openVideoCapture))
{
}

StreamBackend::~StreamBackend() = default;

void StreamBackend::link()
{
    if (state_.linked()) {
        return;
    }
    auto cursor = std::make_unique<Cursor>();
    cursor->source = factory_(state_.path());
    if (!cursor->source) {
        throw FormatError("no decoder for " + state_.path().string());
    }
    state_.setLinked(std::move(cursor));
}

void StreamBackend::unlink()
{
    if (state_.linked()) {
        state_.setUnlinked(BackendMode::StreamDecoder);
    }
}

void StreamBackend::probe()
{
    if (shape_) {
        return;
    }
    link();
    auto& cur = state_.resource();
    const double fps = cur.source->frameRate();
    if (!(fps > 0)) {
        throw FormatError("no frame rate for " + state_.path().string());
    }
    const auto frames = static_cast<std::size_t>(std::floor(cur.source->duration() * fps + 1e-6));

    cur.source->seek(0);
    ++seeks_;
    cv::Mat first = cur.source->decodeNext();
    if (first.empty()) {
        throw FormatError("no decodable frame in " + state_.path().string());
    }
    cur.next = 1;

    type_ = elementTypeFromCvDepth(first.depth());
    if (type_ == ElementType::Unknown) {
        throw FormatError("unsupported pixel depth in " + state_.path().string());
    }
    shape_ = Shape{static_cast<std::size_t>(first.rows), static_cast<std::size_t>(first.cols),
                   static_cast<std::size_t>(first.channels()), frames};
}

Shape StreamBackend::shape()
{
    probe();
    return *shape_;
}

ElementType StreamBackend::elementType()
{
    probe();
    return type_;
}

FrameBlock StreamBackend::readFrames(const std::vector<std::size_t>& frames)
{
    probe();
    for (auto f : frames) {
        if (f >= shape_->frames) {
            throw InputError("frame " + std::to_string(f) + " is out of range (" +
                             std::to_string(shape_->frames) + " frames)");
        }
    }
    if (frames.empty()) {
        return FrameBlock(Shape{shape_->rows, shape_->cols, shape_->slices, 0}, type_);
    }

    link();
    auto& cur = state_.resource();
    const double fps = cur.source->frameRate();
    FrameBlock out;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto f = frames[i];
        if (!cur.next || *cur.next != f) {
            cur.source->seek(static_cast<double>(f) / fps);
            ++seeks_;
        }
        cv::Mat m = cur.source->decodeNext();
        if (m.empty()) {
            cur.next.reset();
            throw FormatError("decoding stopped before frame " + std::to_string(f) + " of " +
                              state_.path().string());
        }
        cur.next = f + 1;

        // The first decoded frame sizes the output for all requested frames
        if (i == 0) {
            out = FrameBlock(Shape{static_cast<std::size_t>(m.rows), static_cast<std::size_t>(m.cols),
                                   static_cast<std::size_t>(m.channels()), frames.size()},
                             elementTypeFromCvDepth(m.depth()));
        }
        out.setFrame(i, m);
    }
    return out;
}

// --- TiledBackend ------------------------------------------------------------

TiledBackend::TiledBackend(fs::path path, io::TiledSourceFactory factory)
    : state_(BackendMode::TiledDecoder, std::move(path)),
      factory_(factory ? std::move(factory) : io::TiledSourceFactory(io::openTiffStack))
{
}

TiledBackend::~TiledBackend() = default;

void TiledBackend::link()
{
    if (state_.linked()) {
        return;
    }
    auto source = factory_(state_.path());
    if (!source) {
        throw FormatError("no decoder for " + state_.path().string());
    }
    state_.setLinked(std::move(source));
}

void TiledBackend::unlink()
{
    if (state_.linked()) {
        state_.setUnlinked(BackendMode::TiledDecoder);
    }
}

Shape TiledBackend::shape()
{
    link();
    return state_.resource().shape();
}

ElementType TiledBackend::elementType()
{
    link();
    return state_.resource().elementType();
}

FrameBlock TiledBackend::readFrames(const std::vector<std::size_t>& frames)
{
    auto s = shape();
    return readRegion(io::Range{0, s.rows}, io::Range{0, s.cols}, frames);
}

FrameBlock TiledBackend::readRegion(io::Range rows, io::Range cols,
                                    const std::vector<std::size_t>& frames)
{
    auto s = shape();
    if (rows.end > s.rows || cols.end > s.cols) {
        throw InputError("region exceeds the image extent");
    }
    for (auto f : frames) {
        if (f >= s.frames) {
            throw InputError("frame " + std::to_string(f) + " is out of range (" +
                             std::to_string(s.frames) + " frames)");
        }
    }

    FrameBlock out(Shape{rows.size(), cols.size(), s.slices, frames.size()}, elementType());
    auto& source = state_.resource();

    // Consecutive frame indices are read in one request
    std::size_t i = 0;
    while (i < frames.size()) {
        std::size_t j = i + 1;
        while (j < frames.size() && frames[j] == frames[j - 1] + 1) {
            ++j;
        }
        auto run = io::permuteTiledToCanonical(
            source.read(rows, cols, io::Range{frames[i], frames[j - 1] + 1}));
        for (std::size_t k = i; k < j; ++k) {
            std::memcpy(out.frameData(k), run.frameData(k - i), out.frameBytes());
        }
        i = j;
    }
    return out;
}

}  // namespace fv
