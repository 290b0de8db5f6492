#pragma once

#include <memory>

#include <plm/layout/text_measurer.hpp>

namespace PoDoFo
{
class PdfMemDocument;
}

/*
        Measures with the Helvetica metrics the pdf output uses
*/
class PoDoFoTextMeasurer final : public TextMeasurer
{
  public:
    PoDoFoTextMeasurer();
    virtual ~PoDoFoTextMeasurer() override;

    virtual dla::ivec2 Measure(std::string_view text, int32_t font_size, bool bold) const override;

  private:
    std::unique_ptr<PoDoFo::PdfMemDocument> m_Document;
};
