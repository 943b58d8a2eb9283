#pragma once

#include <cstdint>
#include <string>

namespace fv
{

// Numeric values are the ones stored in the container header
enum class BackendMode : std::uint64_t {
    InMemory = 0,
    MappedContainer = 1,
    StreamDecoder = 2,
    TiledDecoder = 3
};

std::string backendModeToString(BackendMode mode);

// Throws InputError outside 0..3
BackendMode backendModeFromInt(long long value);

inline bool isReadOnlyMode(BackendMode mode)
{
    return mode == BackendMode::StreamDecoder || mode == BackendMode::TiledDecoder;
}

}  // namespace fv
