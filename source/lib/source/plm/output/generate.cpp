#include <plm/output/generate.hpp>

#include <utility>

#include <fmt/format.h>

#include <plm/layout/errors.hpp>
#include <plm/util/log.hpp>

#include <plm/output/backend.hpp>
#include <plm/output/podofo_backend.hpp>
#include <plm/output/raster_backend.hpp>
#include <plm/output/svg_backend.hpp>

std::unique_ptr<OutputDocument> CreateOutputDocument(OutputFormat format)
{
    switch (format)
    {
    case OutputFormat::Pdf:
        return std::make_unique<PoDoFoDocument>();
    case OutputFormat::Png:
    case OutputFormat::Jpg:
        return std::make_unique<RasterDocument>(format);
    case OutputFormat::Svg:
        return std::make_unique<SvgDocument>();
    }
    std::unreachable();
}

std::optional<OutputFormat> OutputFormatFromPath(const fs::path& path)
{
    const std::string extension{ ToLower(path.extension().string()) };
    if (extension == ".pdf")
    {
        return OutputFormat::Pdf;
    }
    else if (extension == ".png")
    {
        return OutputFormat::Png;
    }
    else if (extension == ".jpg" || extension == ".jpeg")
    {
        return OutputFormat::Jpg;
    }
    else if (extension == ".svg")
    {
        return OutputFormat::Svg;
    }
    return std::nullopt;
}

static void DrawScaleBar(const ScaleBarOverlay& scale_bar, OutputPage& output_page)
{
    const PixelRect& bar{ scale_bar.m_Bar };
    const int32_t segments{ static_cast<int32_t>(scale_bar.m_Segments) };
    for (int32_t i = 0; i < segments; i++)
    {
        const int32_t left{ bar.Left() + bar.m_Size.x * i / segments };
        const int32_t right{ bar.Left() + bar.m_Size.x * (i + 1) / segments };
        output_page.FillRect(PixelRect{ { left, bar.Top() }, { right - left, bar.m_Size.y } },
                             i % 2 == 0 ? c_Black : c_White);
    }
    output_page.StrokeRect(bar, 1, c_Black);

    for (const TextOverlay* label : { &scale_bar.m_StartLabel, &scale_bar.m_EndLabel })
    {
        output_page.DrawText({ label->m_Text, label->m_Bounds, label->m_FontSize, label->m_Alignment, label->m_Bold });
    }
}

static void DrawPage(const Page& page, OutputPage& output_page)
{
    for (const PlacedImage& image : page.m_Images)
    {
        output_page.DrawImage({
            image.m_Item->m_Source,
            image.m_Image.Translated(page.m_ContentOrigin),
        });
    }

    const PageOverlays& overlays{ page.m_Overlays };
    if (overlays.m_Border.has_value())
    {
        output_page.StrokeRect(overlays.m_Border->m_Bounds, overlays.m_Border->m_Thickness, c_Black);
    }

    for (const LineOverlay& divider : overlays.m_Dividers)
    {
        output_page.FillRect(divider.m_Bounds, c_Black);
    }

    for (const TextOverlay& caption : overlays.m_Captions)
    {
        output_page.DrawText({ caption.m_Text, caption.m_Bounds, caption.m_FontSize, caption.m_Alignment, caption.m_Bold });
    }

    if (overlays.m_ScaleBar.has_value())
    {
        DrawScaleBar(overlays.m_ScaleBar.value(), output_page);
    }

    for (const TextOverlay& number : overlays.m_Numbers)
    {
        output_page.DrawText({ number.m_Text, number.m_Bounds, number.m_FontSize, number.m_Alignment, number.m_Bold });
    }

    output_page.Finish();
}

fs::path EncodeDocument(const Document& document, const fs::path& path)
{
    const auto format{ OutputFormatFromPath(path) };
    if (!format.has_value())
    {
        throw EncodingError{
            fmt::format("Unsupported output {}, expected a .pdf, .png, .jpg or .svg file", path.string()),
        };
    }

    LogInfo("Encoding {} pages as {}...", document.m_Pages.size(), path.extension().string());

    try
    {
        auto output_document{ CreateOutputDocument(format.value()) };
        for (const Page& page : document.m_Pages)
        {
            DrawPage(page, *output_document->NextPage(page.m_Size));
        }
        return output_document->Write(path);
    }
    catch (const EncodingError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        // PoDoFo, OpenCV and the filesystem all report through std::exception
        throw EncodingError{ fmt::format("Failed encoding {}: {}", path.string(), e.what()) };
    }
}
