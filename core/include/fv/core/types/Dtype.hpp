#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace fv
{

enum class ElementType { UInt8, UInt16, Float32, Float64, Unknown };

std::string elementTypeToString(ElementType type);
ElementType elementTypeFromString(const std::string& s);

// Bytes per element, 0 for Unknown
std::size_t elementSize(ElementType type);

// 8/16/32/64 bit widths as stored in the container header
std::uint64_t elementBits(ElementType type);
ElementType elementTypeFromBits(std::uint64_t bits);

// OpenCV depth (CV_8U, CV_16U, CV_32F, CV_64F); -1 for Unknown
int elementTypeToCvDepth(ElementType type);
ElementType elementTypeFromCvDepth(int depth);

}  // namespace fv
