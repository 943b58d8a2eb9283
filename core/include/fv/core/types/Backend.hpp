#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "fv/core/io/ContainerCodec.hpp"
#include "fv/core/io/FrameSource.hpp"
#include "fv/core/types/BackendMode.hpp"
#include "fv/core/types/Dtype.hpp"
#include "fv/core/types/FrameBlock.hpp"

namespace fv
{

/**
 * @brief Strategy that supplies frames to a Store
 *
 * Every variant exposes the same capabilities; only InMemory and
 * MappedContainer accept writes (see WritableBackend). File-backed variants
 * may be unlinked to release their descriptors and relinked on demand;
 * link() and unlink() are idempotent.
 */
class Backend
{
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual BackendMode mode() const = 0;
    [[nodiscard]] virtual std::filesystem::path path() const { return {}; }

    // On-disk extent and type; links if needed
    virtual Shape shape() = 0;
    virtual ElementType elementType() = 0;

    // Full frames, in the order requested; links if needed
    virtual FrameBlock readFrames(const std::vector<std::size_t>& frames) = 0;

    [[nodiscard]] virtual bool isLinked() const = 0;
    virtual void link() = 0;
    virtual void unlink() = 0;

    [[nodiscard]] virtual bool writable() const { return false; }
};

/** Backend whose elements can be addressed and modified in place */
class WritableBackend : public Backend
{
public:
    [[nodiscard]] bool writable() const override { return true; }

    // Start of frame f in the canonical layout; links if needed
    virtual std::uint8_t* frameData(std::size_t f) = 0;

    FrameBlock readFrames(const std::vector<std::size_t>& frames) override;
};

/**
 * Link state of a file-backed backend: either the path and mode needed to
 * reopen, or the open resource.
 */
template <typename Resource>
class LinkState
{
public:
    struct Unlinked {
        BackendMode mode;
        std::filesystem::path path;
    };
    struct Linked {
        std::filesystem::path path;
        std::unique_ptr<Resource> resource;
    };

    LinkState(BackendMode mode, std::filesystem::path path)
        : state_(Unlinked{mode, std::move(path)})
    {
    }

    [[nodiscard]] bool linked() const { return std::holds_alternative<Linked>(state_); }

    [[nodiscard]] const std::filesystem::path& path() const
    {
        return linked() ? std::get<Linked>(state_).path : std::get<Unlinked>(state_).path;
    }

    Resource& resource() { return *std::get<Linked>(state_).resource; }

    void setLinked(std::unique_ptr<Resource> resource)
    {
        auto p = path();
        state_ = Linked{std::move(p), std::move(resource)};
    }

    void setUnlinked(BackendMode mode)
    {
        auto p = path();
        state_ = Unlinked{mode, std::move(p)};
    }

private:
    std::variant<Unlinked, Linked> state_;
};

/** Frames owned in memory; always linked */
class MemoryBackend final : public WritableBackend
{
public:
    MemoryBackend() = default;
    explicit MemoryBackend(FrameBlock data) : data_(std::move(data)) {}

    [[nodiscard]] BackendMode mode() const override { return BackendMode::InMemory; }
    Shape shape() override { return data_.shape(); }
    ElementType elementType() override { return data_.elementType(); }

    [[nodiscard]] bool isLinked() const override { return true; }
    void link() override {}
    void unlink() override {}

    std::uint8_t* frameData(std::size_t f) override { return data_.frameData(f); }

    FrameBlock& data() { return data_; }
    [[nodiscard]] const FrameBlock& data() const { return data_; }

private:
    FrameBlock data_;
};

/** Memory mapping of a container file's header and data region */
struct ContainerMapping;

/** Writable (or read-only) memory mapping of a container file */
class MappedBackend final : public WritableBackend
{
public:
    explicit MappedBackend(std::filesystem::path path, bool readOnly = false);
    ~MappedBackend() override;

    MappedBackend(const MappedBackend&) = delete;
    MappedBackend& operator=(const MappedBackend&) = delete;

    [[nodiscard]] BackendMode mode() const override { return BackendMode::MappedContainer; }
    [[nodiscard]] std::filesystem::path path() const override { return state_.path(); }
    Shape shape() override;
    ElementType elementType() override;

    [[nodiscard]] bool isLinked() const override { return state_.linked(); }
    void link() override;
    void unlink() override;

    [[nodiscard]] bool writable() const override { return !readOnly_; }
    std::uint8_t* frameData(std::size_t f) override;

    // Header as read when the mapping was established
    const io::ContainerHeader& header();

    // Write dirty pages back to the file
    void flush();

private:
    LinkState<ContainerMapping> state_;
    bool readOnly_;
};

/** Sequential video decoding with a forward-only cursor */
class StreamBackend final : public Backend
{
public:
    explicit StreamBackend(std::filesystem::path path, io::SequentialSourceFactory factory = {});
    ~StreamBackend() override;

    [[nodiscard]] BackendMode mode() const override { return BackendMode::StreamDecoder; }
    [[nodiscard]] std::filesystem::path path() const override { return state_.path(); }
    Shape shape() override;
    ElementType elementType() override;

    /**
     * Seeks once to the first requested frame and decodes forward from there.
     * A frame that does not follow its predecessor costs another seek.
     */
    FrameBlock readFrames(const std::vector<std::size_t>& frames) override;

    [[nodiscard]] bool isLinked() const override { return state_.linked(); }
    void link() override;
    void unlink() override;

    // Number of seeks issued so far (diagnostics)
    [[nodiscard]] std::size_t seekCount() const { return seeks_; }

private:
    struct Cursor;

    void probe();

    LinkState<Cursor> state_;
    io::SequentialSourceFactory factory_;
    std::optional<Shape> shape_;
    ElementType type_ = ElementType::Unknown;
    std::size_t seeks_ = 0;
};

/** Random access into a tiled image stack */
class TiledBackend final : public Backend
{
public:
    explicit TiledBackend(std::filesystem::path path, io::TiledSourceFactory factory = {});
    ~TiledBackend() override;

    [[nodiscard]] BackendMode mode() const override { return BackendMode::TiledDecoder; }
    [[nodiscard]] std::filesystem::path path() const override { return state_.path(); }
    Shape shape() override;
    ElementType elementType() override;
    FrameBlock readFrames(const std::vector<std::size_t>& frames) override;

    // Row and column window over the given frames, in canonical order
    FrameBlock readRegion(io::Range rows, io::Range cols, const std::vector<std::size_t>& frames);

    [[nodiscard]] bool isLinked() const override { return state_.linked(); }
    void link() override;
    void unlink() override;

private:
    LinkState<io::TiledSource> state_;
    io::TiledSourceFactory factory_;
};

}  // namespace fv
