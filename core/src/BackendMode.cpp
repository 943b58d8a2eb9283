#include "fv/core/types/BackendMode.hpp"

#include "fv/core/types/Exceptions.hpp"

namespace fv
{

std::string backendModeToString(BackendMode mode)
{
    switch (mode) {
        case BackendMode::InMemory:
            return "in-memory";
        case BackendMode::MappedContainer:
            return "mapped container";
        case BackendMode::StreamDecoder:
            return "stream decoder";
        case BackendMode::TiledDecoder:
            return "tiled decoder";
    }
    return "unknown";
}

BackendMode backendModeFromInt(long long value)
{
    if (value < 0 || value > 3) {
        throw InputError("backend mode must be 0, 1, 2 or 3, got " + std::to_string(value));
    }
    return static_cast<BackendMode>(value);
}

}  // namespace fv
