#include <plm/layout/scale.hpp>

#include <algorithm>
#include <cmath>

#include <plm/util/log.hpp>

ScaleSearchResult SearchScale(uint32_t target,
                              float min_factor,
                              float max_factor,
                              float tolerance,
                              const FitCounter& count_fitting)
{
    static constexpr uint32_t c_MaxIterations{ 64 };

    const uint32_t max_factor_count{ count_fitting(max_factor) };
    if (max_factor_count >= target)
    {
        return ScaleSearchResult{
            .m_Factor = max_factor,
            .m_Achieved = max_factor_count,
            .m_Exact = max_factor_count == target,
            .m_Feasible = true,
        };
    }

    const uint32_t min_factor_count{ count_fitting(min_factor) };
    if (min_factor_count < target)
    {
        return ScaleSearchResult{
            .m_Factor = min_factor,
            .m_Achieved = min_factor_count,
            .m_Exact = false,
            .m_Feasible = false,
        };
    }

    // Invariant: count(fitting) >= target > count(overflowing)
    float fitting{ min_factor };
    uint32_t fitting_count{ min_factor_count };
    float overflowing{ max_factor };
    for (uint32_t i = 0; i < c_MaxIterations && overflowing - fitting > tolerance; i++)
    {
        const float middle{ fitting + (overflowing - fitting) / 2.0f };
        const uint32_t middle_count{ count_fitting(middle) };
        if (middle_count >= target)
        {
            fitting = middle;
            fitting_count = middle_count;
        }
        else
        {
            overflowing = middle;
        }
    }

    LogDebug("Scale search settled on {} with {} images per page", fitting, fitting_count);

    return ScaleSearchResult{
        .m_Factor = fitting,
        .m_Achieved = fitting_count,
        .m_Exact = fitting_count == target,
        .m_Feasible = true,
    };
}

std::optional<dla::ivec2> ScaledSize(dla::ivec2 intrinsic_size, float factor)
{
    const double width{ std::round(static_cast<double>(intrinsic_size.x) * factor) };
    const double height{ std::round(static_cast<double>(intrinsic_size.y) * factor) };
    if (!(width <= c_MaxScaledSide && height <= c_MaxScaledSide))
    {
        return std::nullopt;
    }

    return dla::ivec2{
        std::max(1, static_cast<int32_t>(width)),
        std::max(1, static_cast<int32_t>(height)),
    };
}
