#include "fv/core/io/ContainerCodec.hpp"

#include <array>
#include <bit>
#include <cerrno>
#include <cstring>
#include <memory>

#include "fv/core/types/Exceptions.hpp"

namespace fv::io
{

namespace
{

// Header words are little-endian on disk
std::uint64_t toLittleEndian(std::uint64_t v)
{
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    } else {
        return __builtin_bswap64(v);
    }
}

struct FileCloser {
    void operator()(std::FILE* f) const
    {
        if (f) std::fclose(f);
    }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

}  // namespace

std::optional<ContainerHeader> probeContainer(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size < kContainerHeaderBytes) {
        return std::nullopt;
    }

    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) {
        throw FormatError("cannot open container " + path.string() + ": " + std::strerror(errno));
    }
    std::array<std::uint64_t, 6> words{};
    if (std::fread(words.data(), sizeof(std::uint64_t), words.size(), f.get()) != words.size()) {
        throw FormatError("cannot read container header of " + path.string());
    }
    for (auto& w : words) {
        w = toLittleEndian(w);
    }

    ContainerHeader header;
    header.shape = {words[0], words[1], words[2], words[3]};
    header.type = elementTypeFromBits(words[4]);
    if (header.type == ElementType::Unknown) {
        throw FormatError("unrecognized element bit width " + std::to_string(words[4]) + " in " +
                          path.string());
    }
    if (words[5] > 3) {
        throw FormatError("unrecognized backend mode " + std::to_string(words[5]) + " in " +
                          path.string());
    }
    header.mode = static_cast<BackendMode>(words[5]);
    return header;
}

bool isContainer(const std::filesystem::path& path)
{
    return probeContainer(path).has_value();
}

void writeContainerHeader(std::FILE* file, const ContainerHeader& header,
                          const std::filesystem::path& pathForErrors)
{
    if (header.type == ElementType::Unknown) {
        throw InputError("cannot write a header without element type to " + pathForErrors.string());
    }
    std::array<std::uint64_t, kContainerHeaderWords> words{};
    words[0] = header.shape.rows;
    words[1] = header.shape.cols;
    words[2] = header.shape.slices;
    words[3] = header.shape.frames;
    words[4] = elementBits(header.type);
    words[5] = static_cast<std::uint64_t>(header.mode);
    for (auto& w : words) {
        w = toLittleEndian(w);
    }

    if (std::fseek(file, 0, SEEK_SET) != 0) {
        throw WriteError("cannot seek to the header of " + pathForErrors.string());
    }
    auto written = std::fwrite(words.data(), sizeof(std::uint64_t), words.size(), file);
    if (written != kContainerHeaderWords) {
        throw WriteError("wrote " + std::to_string(written) + " of " +
                         std::to_string(kContainerHeaderWords) + " header words to " +
                         pathForErrors.string());
    }
}

void writeContainerHeader(const std::filesystem::path& path, const ContainerHeader& header)
{
    FilePtr f(std::fopen(path.c_str(), "r+b"));
    if (!f) {
        f.reset(std::fopen(path.c_str(), "w+b"));
    }
    if (!f) {
        throw WriteError("cannot open " + path.string() + " for writing: " + std::strerror(errno));
    }
    writeContainerHeader(f.get(), header, path);
    if (std::fflush(f.get()) != 0) {
        throw WriteError("cannot flush header of " + path.string());
    }
}

std::uint64_t containerDataBytes(const ContainerHeader& header)
{
    return static_cast<std::uint64_t>(header.shape.elements()) * elementSize(header.type);
}

bool headerMatches(const ContainerHeader& header, const Shape& shape, ElementType type)
{
    return header.shape == shape && header.type == type;
}

}  // namespace fv::io
