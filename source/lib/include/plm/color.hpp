#pragma once

#include <cstdint>

#include <dla/vector.h>

using ColorRGB8 = dla::tvec3<uint8_t>;

inline constexpr ColorRGB8 c_Black{ 0, 0, 0 };
inline constexpr ColorRGB8 c_White{ 255, 255, 255 };
