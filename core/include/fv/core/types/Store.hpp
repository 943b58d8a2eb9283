#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fv/core/io/Export.hpp"
#include "fv/core/io/FileResolver.hpp"
#include "fv/core/types/Backend.hpp"
#include "fv/core/types/BackendMode.hpp"
#include "fv/core/types/FrameBlock.hpp"
#include "fv/core/types/StoreOptions.hpp"
#include "fv/core/util/Transform.hpp"

namespace fv
{

/** Selection along one axis of a Store: everything, one index, a range or a list */
class Index
{
public:
    // A single 0-based index
    Index(std::size_t i);  // NOLINT(google-explicit-constructor)

    static Index all();
    // Half-open [begin, end)
    static Index range(std::size_t begin, std::size_t end);
    static Index list(std::vector<std::size_t> indices);

    [[nodiscard]] bool isAll() const { return kind_ == Kind::All; }

    /**
     * Concrete indices for an axis of the given extent.
     * @throws InputError if an index lies outside the axis
     */
    [[nodiscard]] std::vector<std::size_t> resolve(std::size_t extent, const char* axis) const;

    // Smallest extent that contains every index; 0 for all()
    [[nodiscard]] std::size_t requiredExtent() const;

private:
    enum class Kind { All, Range, List };

    Index() = default;

    Kind kind_ = Kind::All;
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
    std::vector<std::size_t> list_;
};

/**
 * Crop window: origin and extent along all four axes (0-based). An extent of
 * 0 for slices or frames keeps the rest of that axis.
 */
struct CropRect {
    std::size_t row = 0;
    std::size_t col = 0;
    std::size_t slice = 0;
    std::size_t frame = 0;
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::size_t slices = 0;
    std::size_t frames = 0;

    // Image-plane window keeping every slice and frame
    static CropRect area(std::size_t row, std::size_t col, std::size_t rows, std::size_t cols)
    {
        return {row, col, 0, 0, rows, cols, 0, 0};
    }
};

struct RecallOptions {
    bool ignoreCachedContainer = false;
    std::optional<BackendMode> mode;
};

/** Derived shape information, cached as one unit */
struct Metadata {
    Shape diskShape;
    ElementType diskType = ElementType::Unknown;
    // After the transform, if any
    Shape shape;
    ElementType type = ElementType::Unknown;
};

/**
 * @brief 4-D pixel array (row, col, slice, frame) with interchangeable backends
 *
 * A Store points at a basename. Construction resolves the sibling files and
 * either loads the data, maps a container, or prepares a decoder that opens
 * on first access. get() and set() behave the same whatever the backend;
 * set() is only possible on the in-memory and mapped backends.
 *
 * Mutations mark the store as changed; store() writes them out. While the
 * store is locked every mutating call throws InputError.
 */
class Store
{
public:
    using Ptr = std::shared_ptr<Store>;

    // Empty in-memory store without a file
    Store();
    // In-memory store holding `data`, without a file
    explicit Store(FrameBlock data, StoreOptions options = {});
    /**
     * Store for a basename (an extension selects a specific source).
     * @throws NotFoundError if options.backendMode is set and nothing exists
     */
    explicit Store(const std::filesystem::path& name, StoreOptions options = {});
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    static Ptr New(const std::filesystem::path& name, StoreOptions options = {});

    /**
     * Independent copy: in-memory data is copied, the transform is shared,
     * file backends start unlinked, derived metadata is recomputed and no
     * observer is registered.
     */
    [[nodiscard]] std::unique_ptr<Store> clone() const;

    // Files
    [[nodiscard]] const std::filesystem::path& basename() const { return files_.basename; }
    [[nodiscard]] const io::Resolution& files() const { return files_; }
    void setBasename(const std::filesystem::path& name);

    // Backend
    [[nodiscard]] BackendMode backendMode() const { return backend_->mode(); }
    void setBackendMode(BackendMode mode);
    [[nodiscard]] bool isLinked() const { return backend_->isLinked(); }
    void link() { backend_->link(); }
    void unlink() { backend_->unlink(); }

    // Derived metadata
    [[nodiscard]] bool hasData() const;
    [[nodiscard]] bool metadataCached() const { return meta_.has_value(); }
    Shape shape();
    ElementType elementType();
    Shape diskShape();
    ElementType diskElementType();
    double memoryMiB();
    double diskMiB();
    // Drop the cached metadata and notify the observer
    void resetDerived();

    // Flags and settings
    [[nodiscard]] bool locked() const { return locked_; }
    void setLocked(bool locked) { locked_ = locked; }
    [[nodiscard]] bool isChanged() const { return changed_; }
    [[nodiscard]] double chunkBudgetMiB() const { return chunkBudgetMiB_; }
    void setChunkBudgetMiB(double mib);
    [[nodiscard]] const FrameTransformPtr& transform() const { return transform_; }
    void setTransform(FrameTransformPtr transform);

    /**
     * Read a selection. Missing trailing selectors mean all(); with a
     * transform or a decoder backend all four must be given.
     */
    FrameBlock get(const std::vector<Index>& indices = {});
    FrameBlock get(Index row, Index col, Index slice, Index frame);

    /**
     * Write a selection. `value` must have the selection's shape or hold a
     * single element. In-memory stores grow to fit indices beyond their extent.
     */
    void set(const std::vector<Index>& indices, const FrameBlock& value);
    void set(const std::vector<Index>& indices, double value);

    // Replace the whole array (in-memory backend only)
    void setData(FrameBlock data);

    // Persistence
    void store();
    void recall(const RecallOptions& options = {});
    void crop(const CropRect& rect);
    void resize(double scale, int depth = 1);
    // Problems found, also logged; with `reset` the metadata is recomputed
    std::vector<std::string> check(bool reset = false);
    /**
     * Write transformed frames to a video or TIFF file, one chunk at a time.
     * Frames past the end are dropped with a warning. Video profiles get
     * 8-bit frames; other depths are scaled down with a warning.
     *
     * @return the written file, or an empty path when nothing was written
     *         (no frame selected, or the file exists and overwriting is off)
     */
    std::filesystem::path exportAs(const io::ExportOptions& options = {});

    // Sidecar metadata
    [[nodiscard]] std::vector<std::string> listExtra() const;
    [[nodiscard]] nlohmann::json readExtra(const std::vector<std::string>& keys = {}) const;
    void writeExtra(const nlohmann::json& values, bool cleanRewrite = true);

    /**
     * Register a callback run whenever derived metadata is reset. With an
     * owner, the callback is skipped once the owner has expired.
     */
    void setInvalidationObserver(std::function<void()> callback, std::weak_ptr<void> owner = {});
    void clearInvalidationObserver() { observer_.reset(); }

    std::string describe();

private:
    struct Observer {
        std::function<void()> notify;
        std::weak_ptr<void> owner;
        bool hasOwner = false;
    };

    void requireUnlocked(const char* operation) const;
    void requireBasename(const char* operation) const;
    const Metadata& metadata();
    MemoryBackend& memory();
    MappedBackend& mapped();

    // Backends are opened completely before they replace the current one
    std::unique_ptr<Backend> openBackend(const io::Resolution& files, const RecallOptions& options);
    std::unique_ptr<Backend> openContainer(const std::filesystem::path& container,
                                           BackendMode mode) const;
    std::unique_ptr<Backend> openFromSource(const io::Resolution& files,
                                            const std::filesystem::path& source, BackendMode mode);
    std::unique_ptr<Backend> openSource(const std::filesystem::path& source) const;
    std::unique_ptr<Backend> loadIntoMemory(Backend& reader) const;
    void releaseIfMapped(const std::filesystem::path& file);
    [[nodiscard]] io::ConvertOptions convertOptions() const;
    void rewriteContainer(const FrameTransformPtr& transform,
                          std::optional<std::vector<std::size_t>> frames);
    void setBackend(std::unique_ptr<Backend> backend);

    std::filesystem::path requestedName_;
    io::Resolution files_;
    StoreOptions options_;
    std::unique_ptr<Backend> backend_;
    std::optional<Metadata> meta_;
    FrameTransformPtr transform_;
    double chunkBudgetMiB_ = io::kDefaultChunkBudgetMiB;
    bool locked_ = false;
    bool changed_ = false;
    std::optional<Observer> observer_;
};

}  // namespace fv
