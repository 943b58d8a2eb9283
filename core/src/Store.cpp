#include "fv/core/types/Store.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>
#include <sstream>

#include <nlohmann/json.hpp>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/Converter.hpp"
#include "fv/core/io/Sidecar.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace fv
{

namespace
{

constexpr double kMiB = 1024.0 * 1024.0;

double sizeMiB(const Shape& s, ElementType type)
{
    return static_cast<double>(s.elements()) * static_cast<double>(elementSize(type)) / kMiB;
}

std::vector<std::size_t> iota(std::size_t begin, std::size_t end)
{
    std::vector<std::size_t> v(end - begin);
    std::iota(v.begin(), v.end(), begin);
    return v;
}

bool wholeAxis(const std::vector<std::size_t>& idx, std::size_t extent)
{
    if (idx.size() != extent) {
        return false;
    }
    for (std::size_t i = 0; i < idx.size(); ++i) {
        if (idx[i] != i) {
            return false;
        }
    }
    return true;
}

// Copy the selected elements of consecutive frames into a new block
template <typename FrameAt>
FrameBlock gather(FrameAt frameAt, const Shape& src, ElementType type,
                  const std::vector<std::size_t>& rows, const std::vector<std::size_t>& cols,
                  const std::vector<std::size_t>& slices, std::size_t frames)
{
    FrameBlock out(Shape{rows.size(), cols.size(), slices.size(), frames}, type);
    const std::size_t elem = elementSize(type);
    const std::size_t srcPixel = src.slices * elem;
    const std::size_t srcRow = src.cols * srcPixel;
    const bool wholePixel = wholeAxis(slices, src.slices);

    std::uint8_t* dst = out.data();
    for (std::size_t f = 0; f < frames; ++f) {
        const std::uint8_t* base = frameAt(f);
        for (auto r : rows) {
            const std::uint8_t* row = base + r * srcRow;
            for (auto c : cols) {
                const std::uint8_t* px = row + c * srcPixel;
                if (wholePixel) {
                    std::memcpy(dst, px, srcPixel);
                    dst += srcPixel;
                    continue;
                }
                for (auto s : slices) {
                    std::memcpy(dst, px + s * elem, elem);
                    dst += elem;
                }
            }
        }
    }
    return out;
}

// Write `value` (same type as the target, selection-shaped or a single element)
template <typename FrameAt>
void scatter(FrameAt frameAt, const Shape& dst, const FrameBlock& value,
             const std::vector<std::size_t>& rows, const std::vector<std::size_t>& cols,
             const std::vector<std::size_t>& slices, const std::vector<std::size_t>& frames)
{
    const std::size_t elem = value.elementBytes();
    const bool broadcast = value.shape().elements() == 1;
    const std::uint8_t* src = value.data();
    for (auto f : frames) {
        std::uint8_t* base = frameAt(f);
        for (auto r : rows) {
            for (auto c : cols) {
                std::uint8_t* px = base + ((r * dst.cols + c) * dst.slices) * elem;
                for (auto s : slices) {
                    std::memcpy(px + s * elem, src, elem);
                    if (!broadcast) {
                        src += elem;
                    }
                }
            }
        }
    }
}

// Zero-padded copy of `data` with a larger extent
FrameBlock grow(const FrameBlock& data, const Shape& shape)
{
    FrameBlock out(shape, data.elementType());
    const auto& s = data.shape();
    const std::size_t pixel = data.pixelBytes();
    for (std::size_t f = 0; f < s.frames; ++f) {
        for (std::size_t r = 0; r < s.rows; ++r) {
            for (std::size_t c = 0; c < s.cols; ++c) {
                std::memcpy(out.frameData(f) + (r * shape.cols + c) * out.pixelBytes(),
                            data.frameData(f) + (r * s.cols + c) * pixel, pixel);
            }
        }
    }
    return out;
}

BackendMode nativeSourceMode(const fs::path& source)
{
    return io::isTiledExtension(source.extension().string()) ? BackendMode::TiledDecoder
                                                             : BackendMode::StreamDecoder;
}

// The video or TIFF file of a dataset, preferring an explicitly named one
std::optional<fs::path> decodableSource(const io::Resolution& r)
{
    if (!r.sourceIsContainer() && r.sourceExists()) {
        return r.source;
    }
    return r.richerSource();
}

}  // namespace

// --- Index -------------------------------------------------------------------

Index::Index(std::size_t i) : kind_(Kind::List), list_{i} {}

Index Index::all()
{
    return Index();
}

Index Index::range(std::size_t begin, std::size_t end)
{
    if (begin > end) {
        throw InputError("index range " + std::to_string(begin) + ".." + std::to_string(end) +
                         " is reversed");
    }
    Index idx;
    idx.kind_ = Kind::Range;
    idx.begin_ = begin;
    idx.end_ = end;
    return idx;
}

Index Index::list(std::vector<std::size_t> indices)
{
    Index idx;
    idx.kind_ = Kind::List;
    idx.list_ = std::move(indices);
    return idx;
}

std::vector<std::size_t> Index::resolve(std::size_t extent, const char* axis) const
{
    switch (kind_) {
        case Kind::All:
            return iota(0, extent);
        case Kind::Range:
            if (end_ > extent) {
                throw InputError(std::string(axis) + " range ends at " + std::to_string(end_) +
                                 " but the axis has " + std::to_string(extent) + " elements");
            }
            return iota(begin_, end_);
        case Kind::List:
            for (auto i : list_) {
                if (i >= extent) {
                    throw InputError(std::string(axis) + " index " + std::to_string(i) +
                                     " is out of range (" + std::to_string(extent) + " elements)");
                }
            }
            return list_;
    }
    return {};
}

std::size_t Index::requiredExtent() const
{
    switch (kind_) {
        case Kind::All:
            return 0;
        case Kind::Range:
            return end_;
        case Kind::List:
            return list_.empty() ? 0 : *std::max_element(list_.begin(), list_.end()) + 1;
    }
    return 0;
}

// --- Store: construction -----------------------------------------------------

Store::Store() : backend_(std::make_unique<MemoryBackend>()) {}

Store::Store(FrameBlock data, StoreOptions options)
    : options_(std::move(options)), backend_(std::make_unique<MemoryBackend>(std::move(data)))
{
    options_.validate();
    transform_ = options_.transform;
    chunkBudgetMiB_ = options_.chunkBudgetMiB;
    changed_ = hasData();
}

Store::Store(const fs::path& name, StoreOptions options)
    : requestedName_(name), options_(std::move(options)),
      backend_(std::make_unique<MemoryBackend>())
{
    options_.validate();
    transform_ = options_.transform;
    chunkBudgetMiB_ = options_.chunkBudgetMiB;
    recall(RecallOptions{options_.ignoreCachedContainer, options_.backendMode});
}

Store::~Store()
{
    // Release maps and decoders before anything else goes away
    backend_.reset();
}

Store::Ptr Store::New(const fs::path& name, StoreOptions options)
{
    return std::make_shared<Store>(name, std::move(options));
}

std::unique_ptr<Store> Store::clone() const
{
    auto c = std::make_unique<Store>();
    c->requestedName_ = requestedName_;
    c->files_ = files_;
    c->options_ = options_;
    c->transform_ = transform_;
    c->chunkBudgetMiB_ = chunkBudgetMiB_;
    c->locked_ = locked_;
    c->changed_ = changed_;

    switch (backend_->mode()) {
        case BackendMode::InMemory:
            c->backend_ = std::make_unique<MemoryBackend>(
                static_cast<const MemoryBackend&>(*backend_).data());
            break;
        case BackendMode::MappedContainer:
            c->backend_ = std::make_unique<MappedBackend>(backend_->path());
            break;
        case BackendMode::StreamDecoder:
            c->backend_ = std::make_unique<StreamBackend>(backend_->path(), options_.videoFactory);
            break;
        case BackendMode::TiledDecoder:
            c->backend_ = std::make_unique<TiledBackend>(backend_->path(), options_.tiledFactory);
            break;
    }
    return c;
}

// --- Store: helpers ----------------------------------------------------------

void Store::requireUnlocked(const char* operation) const
{
    if (locked_) {
        throw InputError(std::string("store ") + files_.basename.string() +
                         " is locked, cannot " + operation + " it");
    }
}

void Store::requireBasename(const char* operation) const
{
    if (requestedName_.empty()) {
        throw InputError(std::string("store has no file name, cannot ") + operation + " it");
    }
}

MemoryBackend& Store::memory()
{
    if (backend_->mode() != BackendMode::InMemory) {
        throw Error("store is not held in memory");
    }
    return static_cast<MemoryBackend&>(*backend_);
}

MappedBackend& Store::mapped()
{
    if (backend_->mode() != BackendMode::MappedContainer) {
        throw Error("store is not mapped");
    }
    return static_cast<MappedBackend&>(*backend_);
}

void Store::setBackend(std::unique_ptr<Backend> backend)
{
    backend_.reset();
    backend_ = std::move(backend);
}

io::ConvertOptions Store::convertOptions() const
{
    io::ConvertOptions o;
    o.chunkBudgetMiB = chunkBudgetMiB_;
    o.videoFactory = options_.videoFactory;
    o.tiledFactory = options_.tiledFactory;
    return o;
}

std::unique_ptr<Backend> Store::openSource(const fs::path& source) const
{
    const auto ext = source.extension().string();
    if (io::isTiledExtension(ext)) {
        return std::make_unique<TiledBackend>(source, options_.tiledFactory);
    }
    if (io::isVideoExtension(ext)) {
        return std::make_unique<StreamBackend>(source, options_.videoFactory);
    }
    if (ext == io::kContainerExtension) {
        return std::make_unique<MappedBackend>(source, true);
    }
    throw InputError("unsupported file type: " + source.string());
}

std::unique_ptr<Backend> Store::loadIntoMemory(Backend& reader) const
{
    const auto s = reader.shape();
    const auto type = reader.elementType();
    const double mib = sizeMiB(s, type);
    if (mib > options_.maxLoadMiB) {
        throw InputError(reader.path().string() + " needs " + std::to_string(mib) +
                         " MiB, more than the " + std::to_string(options_.maxLoadMiB) +
                         " MiB allowed in memory; use the mapped backend");
    }
    auto block = reader.readFrames(iota(0, s.frames));
    reader.unlink();
    Logger()->debug("Loaded {} frames of {} into memory", s.frames, reader.path().string());
    return std::make_unique<MemoryBackend>(std::move(block));
}

void Store::releaseIfMapped(const fs::path& file)
{
    if (backend_->mode() != BackendMode::MappedContainer) {
        return;
    }
    std::error_code ec;
    if (fs::equivalent(backend_->path(), file, ec)) {
        // Relinks on the next access if the new backend never materializes
        backend_->unlink();
    }
}

std::unique_ptr<Backend> Store::openContainer(const fs::path& container, BackendMode mode) const
{
    if (mode == BackendMode::InMemory) {
        MappedBackend reader(container, true);
        return loadIntoMemory(reader);
    }
    auto b = std::make_unique<MappedBackend>(container);
    b->link();
    return b;
}

std::unique_ptr<Backend> Store::openFromSource(const io::Resolution& files, const fs::path& source,
                                               BackendMode mode)
{
    switch (mode) {
        case BackendMode::StreamDecoder:
        case BackendMode::TiledDecoder:
            if (mode != nativeSourceMode(source)) {
                Logger()->warn("{} cannot use the {} backend, using {}", source.string(),
                               backendModeToString(mode),
                               backendModeToString(nativeSourceMode(source)));
            }
            return openSource(source);
        case BackendMode::MappedContainer: {
            auto o = convertOptions();
            o.destination = files.container;
            o.mode = BackendMode::MappedContainer;
            releaseIfMapped(files.container);
            if (io::convertToContainer(source, o).empty()) {
                return std::make_unique<MemoryBackend>();
            }
            return openContainer(files.container, BackendMode::MappedContainer);
        }
        case BackendMode::InMemory:
            break;
    }
    auto reader = openSource(source);
    return loadIntoMemory(*reader);
}

std::unique_ptr<Backend> Store::openBackend(const io::Resolution& files, const RecallOptions& options)
{
    const auto richer = decodableSource(files);
    const bool hasContainer = files.containerExists();

    if (options.mode && isReadOnlyMode(*options.mode)) {
        if (!richer) {
            if (hasContainer) {
                throw InputError("only a container exists for " + files.basename.string() +
                                 ", decoder backends need a video or TIFF file");
            }
            throw NotFoundError("no video or TIFF file for " + files.basename.string());
        }
        return openFromSource(files, *richer, *options.mode);
    }
    if (hasContainer && !(options.ignoreCachedContainer && richer)) {
        BackendMode mode = BackendMode::MappedContainer;
        if (options.mode) {
            mode = *options.mode;
        } else {
            auto header = io::probeContainer(files.container);
            if (!header) {
                throw FormatError(files.container.string() + " is too small to be a container");
            }
            // Decoder modes cannot apply to a container
            mode = isReadOnlyMode(header->mode) ? BackendMode::MappedContainer : header->mode;
        }
        return openContainer(files.container, mode);
    }
    if (richer) {
        return openFromSource(files, *richer, options.mode.value_or(nativeSourceMode(*richer)));
    }
    if (options.mode) {
        throw NotFoundError("no file found for " + files.basename.string());
    }
    Logger()->warn("No data found for {}, starting empty", files.basename.string());
    return std::make_unique<MemoryBackend>();
}

void Store::rewriteContainer(const FrameTransformPtr& transform,
                             std::optional<std::vector<std::size_t>> frames)
{
    requireBasename("rewrite");
    store();
    auto o = convertOptions();
    o.destination = files_.container;
    o.transform = transform;
    o.frames = std::move(frames);
    o.mode = BackendMode::MappedContainer;
    o.forceNew = true;

    backend_->unlink();
    io::convertToContainer(files_.container, o);
    setBackend(openContainer(files_.container, BackendMode::MappedContainer));
    changed_ = false;
    resetDerived();
}

// --- Store: files and backends -----------------------------------------------

void Store::setBasename(const fs::path& name)
{
    requireUnlocked("rename");
    auto r = io::resolveFiles(name, true);
    const auto mode = backend_->mode();
    if (mode == BackendMode::InMemory) {
        requestedName_ = name;
        files_ = std::move(r);
        // The data now belongs to the new file
        changed_ = hasData();
        return;
    }
    if (mode == BackendMode::MappedContainer && !r.containerExists()) {
        throw NotFoundError("no container for " + r.basename.string());
    }
    if (isReadOnlyMode(mode) && !decodableSource(r)) {
        throw NotFoundError("no video or TIFF file for " + r.basename.string());
    }

    auto backend = openBackend(r, RecallOptions{false, mode});
    requestedName_ = name;
    files_ = std::move(r);
    setBackend(std::move(backend));
    changed_ = false;
    resetDerived();
}

void Store::setBackendMode(BackendMode mode)
{
    requireUnlocked("change the backend of");
    if (static_cast<std::uint64_t>(mode) > 3) {
        throw InputError("backend mode must be 0, 1, 2 or 3");
    }
    const auto current = backend_->mode();
    if (mode == current) {
        return;
    }
    if (mode != BackendMode::InMemory) {
        requireBasename("change the backend of");
    }
    Logger()->debug("Switching {} from {} to {}", files_.basename.string(),
                    backendModeToString(current), backendModeToString(mode));

    switch (mode) {
        case BackendMode::InMemory:
            if (current == BackendMode::MappedContainer) {
                store();
                backend_->unlink();
                setBackend(openContainer(files_.container, BackendMode::InMemory));
            } else {
                setBackend(loadIntoMemory(*backend_));
            }
            break;
        case BackendMode::MappedContainer: {
            auto o = convertOptions();
            o.destination = files_.container;
            o.mode = BackendMode::MappedContainer;
            o.forceNew = true;
            if (current == BackendMode::InMemory) {
                if (!hasData()) {
                    throw InputError("the store holds no data to map");
                }
                io::convertToContainer(memory().data(), files_.container, o);
            } else {
                const auto src = backend_->path();
                backend_->unlink();
                io::convertToContainer(src, o);
            }
            setBackend(openContainer(files_.container, BackendMode::MappedContainer));
            break;
        }
        case BackendMode::StreamDecoder:
        case BackendMode::TiledDecoder: {
            store();
            auto r = io::resolveFiles(requestedName_, true);
            auto src = decodableSource(r);
            if (!src) {
                throw InputError("no video or TIFF file exists for " + r.basename.string());
            }
            if (nativeSourceMode(*src) != mode) {
                throw InputError(src->string() + " cannot be read with the " +
                                 backendModeToString(mode) + " backend");
            }
            files_ = std::move(r);
            setBackend(openSource(*src));
            break;
        }
    }
    changed_ = false;
    resetDerived();
}

// --- Store: metadata ---------------------------------------------------------

bool Store::hasData() const
{
    if (backend_->mode() == BackendMode::InMemory) {
        return static_cast<const MemoryBackend&>(*backend_).data().elementType() !=
               ElementType::Unknown;
    }
    return true;
}

const Metadata& Store::metadata()
{
    if (meta_) {
        return *meta_;
    }
    if (!hasData()) {
        throw InputError("the store holds no data");
    }
    Metadata m;
    m.diskShape = backend_->shape();
    m.diskType = backend_->elementType();
    m.shape = m.diskShape;
    m.type = m.diskType;
    if (transform_ && m.diskShape.frames > 0) {
        auto probe = applyTransform(backend_->readFrames({0}), *transform_);
        m.shape = probe.shape();
        m.shape.frames = m.diskShape.frames;
        m.type = probe.elementType();
    }
    meta_ = m;
    return *meta_;
}

Shape Store::shape()
{
    return hasData() ? metadata().shape : Shape{};
}

ElementType Store::elementType()
{
    return hasData() ? metadata().type : ElementType::Unknown;
}

Shape Store::diskShape()
{
    return hasData() ? metadata().diskShape : Shape{};
}

ElementType Store::diskElementType()
{
    return hasData() ? metadata().diskType : ElementType::Unknown;
}

double Store::memoryMiB()
{
    return hasData() ? sizeMiB(metadata().shape, metadata().type) : 0.0;
}

double Store::diskMiB()
{
    return hasData() ? sizeMiB(metadata().diskShape, metadata().diskType) : 0.0;
}

void Store::resetDerived()
{
    meta_.reset();
    if (!observer_) {
        return;
    }
    if (observer_->hasOwner && observer_->owner.expired()) {
        observer_.reset();
        return;
    }
    observer_->notify();
}

void Store::setInvalidationObserver(std::function<void()> callback, std::weak_ptr<void> owner)
{
    if (!callback) {
        observer_.reset();
        return;
    }
    const bool hasOwner = !owner.expired();
    observer_ = Observer{std::move(callback), std::move(owner), hasOwner};
}

void Store::setChunkBudgetMiB(double mib)
{
    requireUnlocked("change the chunk budget of");
    if (!(mib > 0)) {
        throw InputError("chunk budget must be positive, got " + std::to_string(mib));
    }
    chunkBudgetMiB_ = mib;
}

void Store::setTransform(FrameTransformPtr transform)
{
    requireUnlocked("change the transform of");
    transform_ = std::move(transform);
    resetDerived();
}

// --- Store: data access ------------------------------------------------------

FrameBlock Store::get(Index row, Index col, Index slice, Index frame)
{
    return get(std::vector<Index>{std::move(row), std::move(col), std::move(slice),
                                  std::move(frame)});
}

FrameBlock Store::get(const std::vector<Index>& indices)
{
    if (!hasData()) {
        throw InputError("the store holds no data");
    }
    if (indices.size() > 4) {
        throw InputError("at most four indices (row, col, slice, frame) are allowed");
    }
    const auto mode = backend_->mode();
    if ((transform_ || isReadOnlyMode(mode)) && indices.size() != 4) {
        throw InputError("all four indices are required with a transform or a decoder backend");
    }
    std::vector<Index> idx(indices);
    while (idx.size() < 4) {
        idx.push_back(Index::all());
    }

    const auto& meta = metadata();
    const auto frames = idx[3].resolve(meta.shape.frames, "frame");
    if (meta.diskShape.frames > 0) {
        const double mib = sizeMiB(meta.diskShape, meta.diskType) *
                           static_cast<double>(frames.size()) /
                           static_cast<double>(meta.diskShape.frames);
        if (mib > chunkBudgetMiB_) {
            Logger()->warn("Reading {} MiB from {}, more than the chunk budget of {} MiB",
                           static_cast<long long>(mib), files_.basename.string(),
                           static_cast<long long>(chunkBudgetMiB_));
        }
    }

    if (transform_) {
        auto block = applyTransform(backend_->readFrames(frames), *transform_);
        const Shape s{meta.shape.rows, meta.shape.cols, meta.shape.slices, frames.size()};
        if (!frames.empty() && block.shape() != s) {
            throw InputError("transform output changed shape after the probe frame");
        }
        return gather([&](std::size_t f) -> const std::uint8_t* { return block.frameData(f); },
                      s, meta.type, idx[0].resolve(s.rows, "row"), idx[1].resolve(s.cols, "col"),
                      idx[2].resolve(s.slices, "slice"), frames.size());
    }

    const auto& s = meta.diskShape;
    auto rows = idx[0].resolve(s.rows, "row");
    auto cols = idx[1].resolve(s.cols, "col");
    const auto slices = idx[2].resolve(s.slices, "slice");

    if (auto* w = dynamic_cast<WritableBackend*>(backend_.get())) {
        return gather(
            [&](std::size_t i) -> const std::uint8_t* { return w->frameData(frames[i]); }, s,
            meta.diskType, rows, cols, slices, frames.size());
    }

    if (auto* t = dynamic_cast<TiledBackend*>(backend_.get())) {
        if (rows.empty() || cols.empty() || frames.empty()) {
            return FrameBlock(Shape{rows.size(), cols.size(), slices.size(), frames.size()},
                              meta.diskType);
        }
        // Decode the bounding window only
        const auto [r0, r1] = std::minmax_element(rows.begin(), rows.end());
        const auto [c0, c1] = std::minmax_element(cols.begin(), cols.end());
        const io::Range rr{*r0, *r1 + 1};
        const io::Range cr{*c0, *c1 + 1};
        auto block = t->readRegion(rr, cr, frames);
        for (auto& r : rows) {
            r -= rr.begin;
        }
        for (auto& c : cols) {
            c -= cr.begin;
        }
        return gather([&](std::size_t f) -> const std::uint8_t* { return block.frameData(f); },
                      block.shape(), meta.diskType, rows, cols, slices, frames.size());
    }

    auto block = backend_->readFrames(frames);
    return gather([&](std::size_t f) -> const std::uint8_t* { return block.frameData(f); },
                  block.shape(), meta.diskType, rows, cols, slices, frames.size());
}

void Store::set(const std::vector<Index>& indices, const FrameBlock& value)
{
    requireUnlocked("set values in");
    if (transform_) {
        throw InputError("values cannot be set through a transform");
    }
    if (!backend_->writable()) {
        throw InputError(std::string("the ") + backendModeToString(backend_->mode()) +
                         " backend is read-only");
    }
    if (indices.size() > 4) {
        throw InputError("at most four indices (row, col, slice, frame) are allowed");
    }
    if (value.elementType() == ElementType::Unknown || value.empty()) {
        throw InputError("no values to set");
    }
    std::vector<Index> idx(indices);
    while (idx.size() < 4) {
        idx.push_back(Index::all());
    }

    auto* w = static_cast<WritableBackend*>(backend_.get());
    bool sizeChanged = false;
    Shape s = backend_->shape();
    ElementType type = backend_->elementType();

    if (backend_->mode() == BackendMode::InMemory) {
        auto& data = memory().data();
        const bool fresh = type == ElementType::Unknown;
        const auto& v = value.shape();
        const std::size_t valueExtent[4] = {v.rows, v.cols, v.slices, v.frames};
        const std::size_t current[4] = {s.rows, s.cols, s.slices, s.frames};
        std::size_t want[4];
        for (int a = 0; a < 4; ++a) {
            if (idx[a].isAll()) {
                want[a] = fresh ? valueExtent[a] : current[a];
            } else {
                want[a] = std::max(fresh ? 0 : current[a], idx[a].requiredExtent());
            }
        }
        const Shape grown{want[0], want[1], want[2], want[3]};
        if (fresh) {
            data = FrameBlock(grown, value.elementType());
            type = value.elementType();
            sizeChanged = true;
        } else if (grown != s) {
            Logger()->debug("Growing {} from {} to {}", files_.basename.string(), s, grown);
            data = grow(data, grown);
            sizeChanged = true;
        }
        s = grown;
    }

    const auto rows = idx[0].resolve(s.rows, "row");
    const auto cols = idx[1].resolve(s.cols, "col");
    const auto slices = idx[2].resolve(s.slices, "slice");
    const auto frames = idx[3].resolve(s.frames, "frame");
    const Shape selection{rows.size(), cols.size(), slices.size(), frames.size()};
    if (value.shape().elements() != 1 && value.shape() != selection) {
        std::ostringstream msg;
        msg << "values of shape " << value.shape() << " do not fit the selection " << selection;
        throw InputError(msg.str());
    }

    FrameBlock converted;
    const FrameBlock* src = &value;
    if (value.elementType() != type) {
        Logger()->warn("Converting {} values to {}", elementTypeToString(value.elementType()),
                       elementTypeToString(type));
        converted = value.convertTo(type);
        src = &converted;
    }

    scatter([&](std::size_t f) { return w->frameData(f); }, s, *src, rows, cols, slices, frames);
    changed_ = true;
    if (sizeChanged) {
        resetDerived();
    }
}

void Store::set(const std::vector<Index>& indices, double value)
{
    const ElementType type = hasData() ? backend_->elementType() : ElementType::Float64;
    FrameBlock v(Shape{1, 1, 1, 1}, type);
    v.fill(value);
    set(indices, v);
}

void Store::setData(FrameBlock data)
{
    requireUnlocked("replace the data of");
    if (backend_->mode() != BackendMode::InMemory) {
        throw InputError("data can only be replaced in memory; switch the backend first");
    }
    memory().data() = std::move(data);
    changed_ = true;
    resetDerived();
}

// --- Store: persistence ------------------------------------------------------

void Store::store()
{
    requireUnlocked("store");
    switch (backend_->mode()) {
        case BackendMode::StreamDecoder:
        case BackendMode::TiledDecoder:
            Logger()->debug("{} is read-only, nothing to store", files_.basename.string());
            return;
        case BackendMode::InMemory: {
            requireBasename("store");
            const auto& data = memory().data();
            if (data.elementType() == ElementType::Unknown) {
                Logger()->warn("Nothing to store for {}", files_.basename.string());
                return;
            }
            std::optional<io::ContainerHeader> header;
            std::error_code ec;
            if (fs::exists(files_.container, ec)) {
                header = io::probeContainer(files_.container);
                if (!header) {
                    throw FormatError(files_.container.string() + " exists and is not a container");
                }
            }
            const bool mismatch =
                header && !io::headerMatches(*header, data.shape(), data.elementType());
            if (!changed_ && !mismatch) {
                return;
            }
            auto o = convertOptions();
            o.mode = BackendMode::InMemory;
            o.forceNew = true;
            io::convertToContainer(data, files_.container, o);
            break;
        }
        case BackendMode::MappedContainer: {
            auto& m = mapped();
            m.flush();
            if (changed_) {
                const auto h = m.header();
                io::writeContainerHeader(m.path(), io::ContainerHeader{h.shape, h.type,
                                                                       BackendMode::MappedContainer});
            }
            break;
        }
    }
    changed_ = false;
}

void Store::recall(const RecallOptions& options)
{
    requireUnlocked("recall");
    if (requestedName_.empty()) {
        Logger()->warn("Nothing to recall, the store has no file name");
        return;
    }
    auto files = io::resolveFiles(requestedName_, true);
    auto backend = openBackend(files, options);
    files_ = std::move(files);
    setBackend(std::move(backend));
    changed_ = false;
    resetDerived();
}

void Store::crop(const CropRect& rect)
{
    requireUnlocked("crop");
    if (!hasData()) {
        throw InputError("the store holds no data");
    }
    if (!backend_->writable()) {
        throw InputError(std::string("the ") + backendModeToString(backend_->mode()) +
                         " backend is read-only, convert it before cropping");
    }
    const Shape s = metadata().diskShape;
    CropRect r = rect;
    if (r.slices == 0 && r.slice < s.slices) {
        r.slices = s.slices - r.slice;
    }
    if (r.frames == 0 && r.frame < s.frames) {
        r.frames = s.frames - r.frame;
    }
    if (r.rows == 0 || r.cols == 0 || r.slices == 0 || r.frames == 0 || r.row + r.rows > s.rows ||
        r.col + r.cols > s.cols || r.slice + r.slices > s.slices || r.frame + r.frames > s.frames) {
        std::ostringstream msg;
        msg << "crop window at (" << r.row << ", " << r.col << ", " << r.slice << ", " << r.frame
            << ") of size " << Shape{r.rows, r.cols, r.slices, r.frames} << " does not fit " << s;
        throw InputError(msg.str());
    }

    const auto rows = iota(r.row, r.row + r.rows);
    const auto cols = iota(r.col, r.col + r.cols);
    const auto slices = iota(r.slice, r.slice + r.slices);

    if (backend_->mode() == BackendMode::InMemory) {
        auto& data = memory().data();
        data = gather(
            [&](std::size_t i) -> const std::uint8_t* { return data.frameData(r.frame + i); }, s,
            data.elementType(), rows, cols, slices, r.frames);
        changed_ = true;
        resetDerived();
        return;
    }

    FrameTransformPtr t;
    if (r.rows != s.rows || r.cols != s.cols || r.slices != s.slices) {
        t = makeCropTransform(cv::Rect(static_cast<int>(r.col), static_cast<int>(r.row),
                                       static_cast<int>(r.cols), static_cast<int>(r.rows)),
                              static_cast<int>(r.slice), static_cast<int>(r.slices));
    }
    rewriteContainer(t, iota(r.frame, r.frame + r.frames));
}

void Store::resize(double scale, int depth)
{
    requireUnlocked("resize");
    if (!(scale > 0) || depth < 1) {
        throw InputError("resize needs a positive scale and a depth of at least 1");
    }
    if (!hasData() || diskShape().frames == 0) {
        throw InputError("the store holds no frames to resize");
    }
    if (!backend_->writable()) {
        throw InputError(std::string("the ") + backendModeToString(backend_->mode()) +
                         " backend is read-only, convert it before resizing");
    }
    auto t = makeResizeTransform(scale, depth);
    if (backend_->mode() == BackendMode::InMemory) {
        auto& data = memory().data();
        data = applyTransform(data, *t);
        changed_ = true;
        resetDerived();
        return;
    }
    rewriteContainer(t, std::nullopt);
}

std::vector<std::string> Store::check(bool reset)
{
    std::vector<std::string> problems;
    auto report = [&](std::string msg) {
        Logger()->warn("{}", msg);
        problems.push_back(std::move(msg));
    };

    if (!hasData()) {
        report("store " + files_.basename.string() + " holds no data");
    }
    if (files_.ambiguity) {
        report(*files_.ambiguity);
    }
    if (!requestedName_.empty() && files_.containerExists()) {
        try {
            auto h = io::probeContainer(files_.container);
            if (!h) {
                report(files_.container.string() + " is too small to be a container");
            } else {
                const auto need = io::kContainerHeaderBytes + io::containerDataBytes(*h);
                if (fs::file_size(files_.container) < need) {
                    report(files_.container.string() + " is truncated");
                }
                if (backend_->mode() == BackendMode::MappedContainer && backend_->isLinked() &&
                    !io::headerMatches(*h, mapped().header().shape, mapped().header().type)) {
                    report(files_.container.string() + " changed on disk since it was mapped");
                }
                if (backend_->mode() == BackendMode::InMemory && hasData() && !changed_ &&
                    !io::headerMatches(*h, memory().data().shape(), memory().data().elementType())) {
                    report(files_.container.string() + " does not match the data in memory");
                }
            }
        } catch (const FormatError& e) {
            report(e.what());
        }
    }
    if (meta_ && hasData() &&
        (meta_->diskShape != backend_->shape() || meta_->diskType != backend_->elementType())) {
        report("cached metadata of " + files_.basename.string() + " is stale");
    }

    if (reset) {
        resetDerived();
        if (hasData()) {
            metadata();
        }
    }
    return problems;
}

fs::path Store::exportAs(const io::ExportOptions& options)
{
    if (!(options.frameRate > 0)) {
        throw InputError("export frame rate must be positive");
    }
    const fs::path base = options.filename.empty() ? files_.basename : options.filename;
    if (base.empty()) {
        throw InputError("store has no file name, give an export file name");
    }
    const auto target = io::exportPath(base, options);
    const auto total = shape().frames;

    std::vector<std::size_t> frames;
    if (options.frames) {
        for (auto f : *options.frames) {
            if (f < total) {
                frames.push_back(f);
            }
        }
        if (frames.size() < options.frames->size()) {
            Logger()->warn("Dropping {} frame(s) past the end of {} from the export",
                           options.frames->size() - frames.size(), files_.basename.string());
        }
    } else {
        frames = iota(0, total);
    }
    if (frames.empty()) {
        Logger()->warn("No frames selected for {}, nothing exported", target.string());
        return {};
    }
    std::error_code ec;
    if (!options.overwrite && fs::exists(target, ec)) {
        Logger()->warn("{} exists and overwriting is off, nothing exported", target.string());
        return {};
    }

    const auto s = shape();
    const double frameMiB = sizeMiB(Shape{s.rows, s.cols, s.slices, 1}, elementType());
    const auto perChunk = static_cast<std::size_t>(
        std::max(1.0, std::floor(chunkBudgetMiB_ / std::max(frameMiB, 1e-12))));
    const bool video = io::isVideoProfile(options.profile);
    auto factory = options.writerFactory;
    if (!factory) {
        factory = io::openFrameWriter;
    }

    Logger()->info("Writing {} frames of {} to {}", frames.size(), files_.basename.string(),
                   target.string());
    std::unique_ptr<io::FrameWriter> writer;
    bool warnedDepth = false;
    for (std::size_t begin = 0; begin < frames.size(); begin += perChunk) {
        const auto end = std::min(frames.size(), begin + perChunk);
        std::vector<std::size_t> chunk(frames.begin() + static_cast<std::ptrdiff_t>(begin),
                                       frames.begin() + static_cast<std::ptrdiff_t>(end));
        auto block = get(Index::all(), Index::all(), Index::all(), Index::list(std::move(chunk)));
        for (std::size_t i = 0; i < block.shape().frames; ++i) {
            cv::Mat frame = block.frame(i);
            if (options.transform) {
                frame = options.transform->apply(frame);
            }
            if (video && frame.depth() != CV_8U) {
                if (!warnedDepth) {
                    Logger()->warn("Converting frames of {} to 8 bits for {}",
                                   files_.basename.string(),
                                   io::exportProfileToString(options.profile));
                    warnedDepth = true;
                }
                frame = io::toVideoDepth(frame);
            }
            if (!writer) {
                io::FrameWriterSpec spec;
                spec.path = target;
                spec.profile = options.profile;
                spec.frameRate = options.frameRate;
                spec.frameSize = frame.size();
                spec.channels = frame.channels();
                spec.totalBytes = static_cast<std::uint64_t>(frame.total() * frame.elemSize()) *
                                  frames.size();
                spec.tiff = options.tiff;
                writer = factory(spec);
            }
            writer->write(frame);
        }
        Logger()->debug("  {} of {} frames written", end, frames.size());
    }
    writer->close();
    Logger()->info("Exported {} frames to {}", frames.size(), target.string());
    return target;
}

// --- Store: sidecar ----------------------------------------------------------

std::vector<std::string> Store::listExtra() const
{
    requireBasename("list metadata of");
    return io::Sidecar(files_.sidecar).listKeys();
}

nlohmann::json Store::readExtra(const std::vector<std::string>& keys) const
{
    requireBasename("read metadata of");
    return io::Sidecar(files_.sidecar).read(keys);
}

void Store::writeExtra(const nlohmann::json& values, bool cleanRewrite)
{
    requireUnlocked("write metadata of");
    requireBasename("write metadata of");
    io::Sidecar(files_.sidecar).write(values, cleanRewrite);
}

std::string Store::describe()
{
    std::ostringstream os;
    os << (files_.basename.empty() ? std::string("<memory>") : files_.basename.string()) << " ["
       << backendModeToString(backend_->mode());
    if (isLinked()) {
        os << ", linked";
    }
    if (locked_) {
        os << ", locked";
    }
    if (changed_) {
        os << ", changed";
    }
    os << "]";
    if (!hasData()) {
        os << " empty";
        return os.str();
    }
    const auto& m = metadata();
    os << " " << m.shape << " " << elementTypeToString(m.type);
    if (transform_) {
        os << " (disk " << m.diskShape << " " << elementTypeToString(m.diskType) << ", transform "
           << transform_->describe() << ")";
    }
    os << ", " << diskMiB() << " MiB on disk";
    return os.str();
}

}  // namespace fv
