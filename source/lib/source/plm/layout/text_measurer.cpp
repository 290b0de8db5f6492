#include <plm/layout/text_measurer.hpp>

#include <cmath>

FixedWidthTextMeasurer::FixedWidthTextMeasurer(float advance_ratio, float line_height_ratio)
    : m_AdvanceRatio{ advance_ratio }
    , m_LineHeightRatio{ line_height_ratio }
{
}

dla::ivec2 FixedWidthTextMeasurer::Measure(std::string_view text, int32_t font_size, bool /*bold*/) const
{
    const float advance{ static_cast<float>(font_size) * m_AdvanceRatio };
    return dla::ivec2{
        static_cast<int32_t>(std::ceil(advance * static_cast<float>(text.size()))),
        static_cast<int32_t>(std::ceil(static_cast<float>(font_size) * m_LineHeightRatio)),
    };
}
