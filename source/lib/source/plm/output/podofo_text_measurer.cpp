#include <plm/output/podofo_text_measurer.hpp>

#include <cmath>

#include <podofo/podofo.h>

PoDoFoTextMeasurer::PoDoFoTextMeasurer()
    : m_Document{ std::make_unique<PoDoFo::PdfMemDocument>() }
{
}

PoDoFoTextMeasurer::~PoDoFoTextMeasurer() = default;

dla::ivec2 PoDoFoTextMeasurer::Measure(std::string_view text, int32_t font_size, bool bold) const
{
    static constexpr double c_LineHeightRatio{ 1.2 };

    auto& font{
        m_Document
            ->GetFonts()
            .GetStandard14Font(bold ? PoDoFo::PdfStandard14FontType::HelveticaBold
                                    : PoDoFo::PdfStandard14FontType::Helvetica),
    };

    // Widths scale linearly with the font size, so pixels in give pixels out
    PoDoFo::PdfTextState state{};
    state.Font = &font;
    state.FontSize = static_cast<double>(font_size);

    return dla::ivec2{
        static_cast<int32_t>(std::ceil(font.GetStringLength(text, state))),
        static_cast<int32_t>(std::ceil(font_size * c_LineHeightRatio)),
    };
}
