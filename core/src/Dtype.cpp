#include "fv/core/types/Dtype.hpp"

#include <opencv2/core.hpp>

namespace fv
{

std::string elementTypeToString(ElementType type)
{
    switch (type) {
        case ElementType::UInt8:
            return "uint8";
        case ElementType::UInt16:
            return "uint16";
        case ElementType::Float32:
            return "float32";
        case ElementType::Float64:
            return "float64";
        default:
            return "unknown";
    }
}

ElementType elementTypeFromString(const std::string& s)
{
    if (s == "uint8" || s == "u1") return ElementType::UInt8;
    if (s == "uint16" || s == "u2") return ElementType::UInt16;
    if (s == "float32" || s == "single" || s == "f4") return ElementType::Float32;
    if (s == "float64" || s == "double" || s == "f8") return ElementType::Float64;
    return ElementType::Unknown;
}

std::size_t elementSize(ElementType type)
{
    switch (type) {
        case ElementType::UInt8:
            return 1;
        case ElementType::UInt16:
            return 2;
        case ElementType::Float32:
            return 4;
        case ElementType::Float64:
            return 8;
        default:
            return 0;
    }
}

std::uint64_t elementBits(ElementType type)
{
    return static_cast<std::uint64_t>(elementSize(type)) * 8;
}

ElementType elementTypeFromBits(std::uint64_t bits)
{
    switch (bits) {
        case 8:
            return ElementType::UInt8;
        case 16:
            return ElementType::UInt16;
        case 32:
            return ElementType::Float32;
        case 64:
            return ElementType::Float64;
        default:
            return ElementType::Unknown;
    }
}

int elementTypeToCvDepth(ElementType type)
{
    switch (type) {
        case ElementType::UInt8:
            return CV_8U;
        case ElementType::UInt16:
            return CV_16U;
        case ElementType::Float32:
            return CV_32F;
        case ElementType::Float64:
            return CV_64F;
        default:
            return -1;
    }
}

ElementType elementTypeFromCvDepth(int depth)
{
    switch (depth) {
        case CV_8U:
            return ElementType::UInt8;
        case CV_16U:
            return ElementType::UInt16;
        case CV_32F:
            return ElementType::Float32;
        case CV_64F:
            return ElementType::Float64;
        default:
            return ElementType::Unknown;
    }
}

}  // namespace fv
