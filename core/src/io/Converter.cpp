#include "fv/core/io/Converter.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <memory>
#include <numeric>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/FileResolver.hpp"
#include "fv/core/types/Backend.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv::io
{

namespace
{

constexpr double kMiB = 1024.0 * 1024.0;

double sizeMiB(const Shape& s, ElementType t)
{
    return static_cast<double>(s.elements()) * static_cast<double>(elementSize(t)) / kMiB;
}

bool samePath(const fs::path& a, const fs::path& b)
{
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec)) {
        return fs::equivalent(a, b, ec);
    }
    return a.lexically_normal() == b.lexically_normal();
}

// Read-only view of a caller's FrameBlock behind the Backend interface
class BlockReader final : public Backend
{
public:
    explicit BlockReader(const FrameBlock& block) : block_(block) {}

    [[nodiscard]] BackendMode mode() const override { return BackendMode::InMemory; }
    Shape shape() override { return block_.shape(); }
    ElementType elementType() override { return block_.elementType(); }
    [[nodiscard]] bool isLinked() const override { return true; }
    void link() override {}
    void unlink() override {}

    FrameBlock readFrames(const std::vector<std::size_t>& frames) override
    {
        const auto& s = block_.shape();
        FrameBlock out(Shape{s.rows, s.cols, s.slices, frames.size()}, block_.elementType());
        for (std::size_t i = 0; i < frames.size(); ++i) {
            std::memcpy(out.frameData(i), block_.frameData(frames[i]), out.frameBytes());
        }
        return out;
    }

private:
    const FrameBlock& block_;
};

std::unique_ptr<Backend> openReader(const fs::path& path, const ConvertOptions& opts)
{
    const auto ext = path.extension().string();
    if (ext == kContainerExtension) {
        if (!isContainer(path)) {
            throw FormatError(path.string() + " is not a container");
        }
        return std::make_unique<MappedBackend>(path, true);
    }
    if (isTiledExtension(ext)) {
        auto factory = opts.tiledFactory;
        if (!factory) {
            const bool multiPart = opts.multiPart;
            factory = [multiPart](const fs::path& p) -> std::unique_ptr<TiledSource> {
                return std::make_unique<TiffStackSource>(p, multiPart);
            };
        }
        return std::make_unique<TiledBackend>(path, factory);
    }
    if (isVideoExtension(ext)) {
        return std::make_unique<StreamBackend>(path, opts.videoFactory);
    }
    throw InputError("unsupported source format: " + path.string());
}

struct FileCloser {
    void operator()(std::FILE* f) const
    {
        if (f) std::fclose(f);
    }
};

// Output of one conversion, removed again unless commit() is called
class PendingOutput
{
public:
    explicit PendingOutput(fs::path path) : path_(std::move(path))
    {
        file_.reset(std::fopen(path_.c_str(), "wb"));
        if (!file_) {
            throw WriteError("cannot create " + path_.string() + ": " + std::strerror(errno));
        }
    }

    ~PendingOutput()
    {
        if (!committed_) {
            file_.reset();
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    std::FILE* get() { return file_.get(); }

    void write(const FrameBlock& block)
    {
        const auto n = std::fwrite(block.data(), 1, block.sizeBytes(), file_.get());
        if (n != block.sizeBytes()) {
            throw WriteError("wrote " + std::to_string(n) + " of " +
                             std::to_string(block.sizeBytes()) + " bytes to " + path_.string());
        }
    }

    void commit()
    {
        std::FILE* f = file_.release();
        if (std::fclose(f) != 0) {
            throw WriteError("cannot close " + path_.string() + ": " + std::strerror(errno));
        }
        committed_ = true;
    }

private:
    fs::path path_;
    std::unique_ptr<std::FILE, FileCloser> file_;
    bool committed_ = false;
};

// Renames a container away for an in-place rewrite and restores it on failure
class TemporaryRename
{
public:
    explicit TemporaryRename(const fs::path& original)
        : original_(original), temp_(temporaryContainerPath(original))
    {
        fs::rename(original_, temp_);
        Logger()->debug("Moved {} to {}", original_.string(), temp_.string());
    }

    ~TemporaryRename()
    {
        std::error_code ec;
        if (succeeded_) {
            fs::remove(temp_, ec);
        } else {
            fs::remove(original_, ec);
            fs::rename(temp_, original_, ec);
            if (ec) {
                Logger()->error("Could not restore {} from {}: {}", original_.string(),
                                temp_.string(), ec.message());
            }
        }
    }

    [[nodiscard]] const fs::path& path() const { return temp_; }
    void succeeded() { succeeded_ = true; }

private:
    fs::path original_;
    fs::path temp_;
    bool succeeded_ = false;
};

std::vector<std::size_t> selectFrames(const ConvertOptions& opts, std::size_t available)
{
    std::vector<std::size_t> frames;
    if (!opts.frames) {
        frames.resize(available);
        std::iota(frames.begin(), frames.end(), std::size_t{0});
        return frames;
    }
    const auto& req = *opts.frames;
    for (std::size_t i = 1; i < req.size(); ++i) {
        if (req[i] <= req[i - 1]) {
            throw InputError("frame indices must be strictly increasing");
        }
    }
    std::copy_if(req.begin(), req.end(), std::back_inserter(frames),
                 [available](std::size_t f) { return f < available; });
    if (frames.size() < req.size()) {
        Logger()->warn("Dropped {} requested frames beyond the {} available", req.size() - frames.size(),
                       available);
    }
    return frames;
}

fs::path convert(Backend& reader, const fs::path& sourcePath, const fs::path& destination,
                 const ConvertOptions& opts)
{
    if (!(opts.chunkBudgetMiB > 0)) {
        throw InputError("chunk budget must be positive");
    }
    if (destination.empty()) {
        throw InputError("a destination file is required");
    }

    const Shape inShape = reader.shape();
    const ElementType inType = reader.elementType();

    // The output shape comes from transforming one blank frame
    Shape outShape = inShape;
    ElementType outType = inType;
    if (opts.transform && inShape.frameElements() > 0) {
        FrameBlock probe(Shape{inShape.rows, inShape.cols, inShape.slices, 1}, inType);
        auto transformed = applyTransform(probe, *opts.transform);
        outShape = transformed.shape();
        outType = transformed.elementType();
    }
    if (outType == ElementType::Unknown) {
        throw InputError("unsupported output element type");
    }

    const auto frames = selectFrames(opts, inShape.frames);
    if (frames.empty()) {
        Logger()->warn("No frames left to convert from {}", sourcePath.string());
        return {};
    }
    outShape.frames = frames.size();

    const double inMiB = sizeMiB(inShape, inType);
    const double outMiB = sizeMiB(outShape, outType);
    BackendMode mode = opts.mode.value_or(std::max(inMiB, outMiB) > opts.chunkBudgetMiB
                                              ? BackendMode::MappedContainer
                                              : BackendMode::InMemory);
    if (isReadOnlyMode(mode)) {
        throw InputError("containers can only record the in-memory or mapped mode");
    }

    std::error_code ec;
    const bool destExists = fs::exists(destination, ec);
    std::optional<ContainerHeader> destHeader;
    if (destExists) {
        destHeader = probeContainer(destination);
        if (!destHeader) {
            throw FormatError(destination.string() + " exists and is not a container");
        }
    }

    const bool inPlace = !sourcePath.empty() && destExists && samePath(sourcePath, destination);
    if (inPlace && !opts.transform && !opts.forceNew && frames.size() == inShape.frames &&
        headerMatches(*destHeader, outShape, outType)) {
        Logger()->info("{} is up to date", destination.string());
        return destination;
    }

    std::unique_ptr<TemporaryRename> rename;
    std::unique_ptr<Backend> tempReader;
    Backend* src = &reader;
    if (inPlace) {
        reader.unlink();
        rename = std::make_unique<TemporaryRename>(destination);
        tempReader = std::make_unique<MappedBackend>(rename->path(), true);
        src = tempReader.get();
    }

    const double inFrameMiB = inMiB / std::max<std::size_t>(1, inShape.frames);
    const double outFrameMiB = outMiB / std::max<std::size_t>(1, outShape.frames);
    std::size_t framesChunk = frames.size();
    if (mode == BackendMode::MappedContainer && std::max(inMiB, outMiB) > opts.chunkBudgetMiB) {
        const double fit = std::min(opts.chunkBudgetMiB / std::max(inFrameMiB, 1e-12),
                                    opts.chunkBudgetMiB / std::max(outFrameMiB, 1e-12));
        framesChunk = std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(fit)));
    }

    Logger()->info("Converting {} frames of {} to {} ({} chunk(s))", frames.size(),
                   sourcePath.empty() ? std::string("memory") : sourcePath.string(),
                   destination.string(), (frames.size() + framesChunk - 1) / framesChunk);

    PendingOutput out(destination);
    writeContainerHeader(out.get(), ContainerHeader{outShape, outType, mode}, destination);

    for (std::size_t begin = 0; begin < frames.size(); begin += framesChunk) {
        const std::size_t end = std::min(frames.size(), begin + framesChunk);
        std::vector<std::size_t> chunk(frames.begin() + static_cast<std::ptrdiff_t>(begin),
                                       frames.begin() + static_cast<std::ptrdiff_t>(end));
        FrameBlock block = src->readFrames(chunk);
        if (opts.transform) {
            block = applyTransform(block, *opts.transform);
        }
        const Shape& got = block.shape();
        if (got.rows != outShape.rows || got.cols != outShape.cols ||
            got.slices != outShape.slices || block.elementType() != outType) {
            throw InputError("transform output changed shape after the probe frame");
        }
        out.write(block);
        Logger()->info("{} of {} frames in the range {} to {}", end, frames.size(), begin + 1, end);
    }

    out.commit();
    if (rename) {
        tempReader.reset();
        rename->succeeded();
    }
    return destination;
}

}  // namespace

fs::path temporaryContainerPath(const fs::path& path)
{
    const auto dir = path.parent_path();
    const auto stem = path.stem().string();
    for (int k = 1;; ++k) {
        auto candidate = dir / (stem + "_temp-" + std::to_string(k) + kContainerExtension);
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
}

fs::path convertToContainer(const fs::path& source, const ConvertOptions& options)
{
    fs::path sourcePath = source;
    if (!isSupportedExtension(source.extension().string()) || !fs::exists(source)) {
        sourcePath = resolveFiles(source).source;
    }
    fs::path destination = options.destination;
    if (destination.empty()) {
        destination = fs::path(stripExtension(sourcePath).string() + kContainerExtension);
    }

    auto reader = openReader(sourcePath, options);
    return convert(*reader, sourcePath, destination, options);
}

fs::path convertToContainer(const FrameBlock& data, const fs::path& destination,
                            const ConvertOptions& options)
{
    if (data.elementType() == ElementType::Unknown) {
        throw InputError("cannot convert an array without element type");
    }
    BlockReader reader(data);
    return convert(reader, {}, destination, options);
}

}  // namespace fv::io
