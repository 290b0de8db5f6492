#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <dla/vector.h>

struct ScaleSearchResult
{
    float m_Factor;
    uint32_t m_Achieved;
    // Exactly the target number of images fits at the factor
    bool m_Exact;
    // At least the target number of images fits at the factor
    bool m_Feasible;
};

// Images that fit on the first page at the given factor
using FitCounter = std::function<uint32_t(float)>;

/*
        Finds the largest factor in [min_factor, max_factor] at which at least target images fit,
        relies on fewer images fitting the larger they get. When not even the smallest factor
        fits target images the smallest factor is returned and the result is not feasible.
*/
ScaleSearchResult SearchScale(uint32_t target,
                              float min_factor,
                              float max_factor,
                              float tolerance,
                              const FitCounter& count_fitting);

// Largest side in pixels any image may have after scaling
inline constexpr int32_t c_MaxScaledSide{ 1 << 24 };

// Rounded to whole pixels, never below a single pixel, empty if a side exceeds c_MaxScaledSide
std::optional<dla::ivec2> ScaledSize(dla::ivec2 intrinsic_size, float factor);
