#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>

#include "fv/core/types/BackendMode.hpp"
#include "fv/core/types/Dtype.hpp"
#include "fv/core/types/FrameBlock.hpp"

namespace fv::io
{

// Size of the fixed preamble; element data starts right after it
constexpr std::size_t kContainerHeaderBytes = 1024;
constexpr std::size_t kContainerHeaderWords = kContainerHeaderBytes / sizeof(std::uint64_t);
constexpr const char* kContainerExtension = ".dat";

struct ContainerHeader {
    Shape shape;
    ElementType type = ElementType::Unknown;
    BackendMode mode = BackendMode::MappedContainer;

    bool operator==(const ContainerHeader& o) const
    {
        return shape == o.shape && type == o.type && mode == o.mode;
    }
};

/**
 * Read and validate the header of a container file.
 *
 * @return std::nullopt if the file is missing or shorter than the header
 * @throws FormatError on an unknown bit width or backend mode
 */
std::optional<ContainerHeader> probeContainer(const std::filesystem::path& path);

// True if probeContainer() yields a header; propagates FormatError
bool isContainer(const std::filesystem::path& path);

/**
 * Write the 1024-byte header at offset 0, creating the file if needed.
 * Data already following the header is left untouched.
 *
 * @throws WriteError if fewer than 128 words were written
 */
void writeContainerHeader(const std::filesystem::path& path, const ContainerHeader& header);
void writeContainerHeader(std::FILE* file, const ContainerHeader& header,
                          const std::filesystem::path& pathForErrors);

// Size of the element region described by a header
std::uint64_t containerDataBytes(const ContainerHeader& header);

// Shape and element type match; the mode word is not compared
bool headerMatches(const ContainerHeader& header, const Shape& shape, ElementType type);

}  // namespace fv::io
