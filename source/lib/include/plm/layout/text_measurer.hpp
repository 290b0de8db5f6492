#pragma once

#include <cstdint>
#include <string_view>

#include <dla/vector.h>

/*
        Font metrics as seen by the layout, sizes are in pixels for a font size in pixels
*/
class TextMeasurer
{
  public:
    virtual ~TextMeasurer() = default;

    virtual dla::ivec2 Measure(std::string_view text, int32_t font_size, bool bold) const = 0;
};

/*
        Every glyph takes the same advance, used for previews and wherever no font is available
*/
class FixedWidthTextMeasurer final : public TextMeasurer
{
  public:
    FixedWidthTextMeasurer(float advance_ratio = 0.6f, float line_height_ratio = 1.2f);

    virtual dla::ivec2 Measure(std::string_view text, int32_t font_size, bool bold) const override;

  private:
    float m_AdvanceRatio;
    float m_LineHeightRatio;
};
