#include <plm/output/podofo_backend.hpp>

#include <fmt/format.h>

#include <podofo/podofo.h>

#include <plm/config.hpp>
#include <plm/image.hpp>
#include <plm/layout/errors.hpp>
#include <plm/util/at_scope_exit.hpp>
#include <plm/util/log.hpp>

static auto Save(PoDoFo::PdfPainter& painter)
{
    painter.Save();
    return AtScopeExit{
        [&painter]
        {
            painter.Restore();
        }
    };
}

static PoDoFo::PdfColor ToPoDoFoColor(ColorRGB8 color)
{
    return PoDoFo::PdfColor{
        color.r / 255.0,
        color.g / 255.0,
        color.b / 255.0,
    };
}

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFo::PdfPainter* painter,
                       PoDoFoDocument* document,
                       dla::ivec2 size)
    : m_Page{ page }
    , m_Painter{ painter }
    , m_Document{ document }
    , m_Size{ size }
{
    m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

PoDoFo::Rect PoDoFoPage::ToPoDoFoRect(const PixelRect& rect) const
{
    // Pdf coordinates start bottom-left
    return PoDoFo::Rect{
        m_Document->ToPoDoFoPoints(rect.Left()),
        m_Document->ToPoDoFoPoints(m_Size.y - rect.Bottom()),
        m_Document->ToPoDoFoPoints(rect.m_Size.x),
        m_Document->ToPoDoFoPoints(rect.m_Size.y),
    };
}

void PoDoFoPage::DrawImage(ImageData data)
{
    const Image loaded_image{ Image::Read(data.m_Path) };
    if (!loaded_image.Valid())
    {
        throw EncodingError{ fmt::format("Could not read image {} while writing pdf", data.m_Path.string()) };
    }

    const auto encoded_image{
        loaded_image
            .ToBGR()
            .Resize(data.m_Rect.m_Size)
            .EncodeJpg(g_Cfg.m_JpgQuality),
    };

    std::unique_ptr podofo_image{ m_Document->MakeImage() };
    podofo_image->LoadFromBuffer(
        PoDoFo::bufferview{
            reinterpret_cast<const char*>(encoded_image.data()),
            encoded_image.size(),
        });

    const auto rect{ ToPoDoFoRect(data.m_Rect) };
    const auto w_scale{ rect.Width / podofo_image->GetWidth() };
    const auto h_scale{ rect.Height / podofo_image->GetHeight() };

    auto save{ Save(*m_Painter) };
    m_Painter->DrawImage(*podofo_image, rect.X, rect.Y, w_scale, h_scale);
}

void PoDoFoPage::FillRect(PixelRect rect, ColorRGB8 color)
{
    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetNonStrokingColor(ToPoDoFoColor(color));
    m_Painter->DrawRectangle(ToPoDoFoRect(rect), PoDoFo::PdfPathDrawMode::Fill);
}

void PoDoFoPage::StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color)
{
    // Strokes are centered on the path, move the path inwards by half the thickness
    const int32_t inset{ thickness / 2 };
    const PixelRect path_rect{
        { rect.Left() + inset, rect.Top() + inset },
        { rect.m_Size.x - 2 * inset, rect.m_Size.y - 2 * inset },
    };

    auto save{ Save(*m_Painter) };
    m_Painter->GraphicsState.SetLineWidth(m_Document->ToPoDoFoPoints(thickness));
    m_Painter->GraphicsState.SetStrokingColor(ToPoDoFoColor(color));
    m_Painter->SetStrokeStyle(PoDoFo::PdfStrokeStyle::Solid);
    m_Painter->DrawRectangle(ToPoDoFoRect(path_rect), PoDoFo::PdfPathDrawMode::Stroke);
}

void PoDoFoPage::DrawText(TextData data)
{
    static constexpr double c_BaselineRatio{ 0.25 };

    const auto rect{ ToPoDoFoRect(data.m_Bounds) };
    const auto font_size{ m_Document->ToPoDoFoPoints(data.m_FontSize) };
    auto& font{ m_Document->GetFont(data.m_Bold) };

    auto save{ Save(*m_Painter) };
    m_Painter->TextState.SetFont(font, font_size);
    m_Painter->GraphicsState.SetNonStrokingColor(ToPoDoFoColor(c_Black));

    const auto& text_state{ m_Painter->TextState.GetState() };
    const auto text_width{ font.GetStringLength(data.m_Text, text_state) };
    const auto x{
        [&]()
        {
            switch (data.m_Alignment)
            {
            case TextAlignment::Left:
                return rect.X;
            case TextAlignment::Right:
                return rect.X + rect.Width - text_width;
            case TextAlignment::Center:
            default:
                return rect.X + (rect.Width - text_width) / 2.0;
            }
        }()
    };
    const auto y{ rect.Y + rect.Height * c_BaselineRatio };

    m_Painter->DrawText(data.m_Text, x, y);
}

void PoDoFoPage::Finish()
{
    m_Painter->FinishDrawing();
}

PoDoFoDocument::PoDoFoDocument()
    : m_PointsPerPixel{ static_cast<double>(1_pix / g_Cfg.m_OutputDPI / 1_pts) }
{
}

PoDoFoPage* PoDoFoDocument::NextPage(dla::ivec2 size)
{
    const unsigned new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
    PoDoFo::PdfPage* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(size.x),
                ToPoDoFoPoints(size.y))),
    };

    auto* painter{ m_Painters.emplace_back(new PoDoFo::PdfPainter).get() };
    m_Pages.emplace_back(new PoDoFoPage{ page, painter, this, size });
    return m_Pages.back().get();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        const auto pdf_path{ path.replace_extension(".pdf") };
        LogInfo("Saving to {}...", pdf_path.string());

        if (g_Cfg.m_DeterministicPdfOutput)
        {
            auto& trailer{ m_Document.GetTrailer() };
            const auto& ref = trailer.GetDictionary().GetKey("Info")->GetReference();
            auto* obj = m_Document.GetObjects().GetObject(ref);
            obj->GetDictionary().RemoveKey("CreationDate");

            m_Document.Save(pdf_path.string(), PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        }
        else
        {
            m_Document.Save(pdf_path.string());
        }

        return pdf_path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw EncodingError{ e.what() };
    }
}

PoDoFo::PdfFont& PoDoFoDocument::GetFont(bool bold)
{
    return m_Document
        .GetFonts()
        .GetStandard14Font(bold ? PoDoFo::PdfStandard14FontType::HelveticaBold
                                : PoDoFo::PdfStandard14FontType::Helvetica);
}

std::unique_ptr<PoDoFo::PdfImage> PoDoFoDocument::MakeImage()
{
    return m_Document.CreateImage();
}

double PoDoFoDocument::ToPoDoFoPoints(double pixels) const
{
    return pixels * m_PointsPerPixel;
}
