#include <plm/layout/annotations.hpp>

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include <plm/layout/scale.hpp>

std::string CaptionDisplayName(const ImageItem& image, const CaptionSpec& spec)
{
    if (spec.m_RemoveExtension)
    {
        return fs::path{ image.m_Name }.stem().string();
    }
    return image.m_Name;
}

std::vector<std::string> CaptionLines(const ImageItem& image, const CaptionSpec& spec)
{
    std::vector<std::string> lines{ CaptionDisplayName(image, spec) };

    const auto push_field{
        [&](const std::string& name, const std::string& value)
        {
            if (value.empty())
            {
                return;
            }

            if (spec.m_HideFieldNames)
            {
                lines.push_back(value);
            }
            else
            {
                lines.push_back(fmt::format("{}: {}", name, value));
            }
        }
    };

    if (spec.m_Fields.empty())
    {
        for (const MetadataField& field : image.m_Metadata)
        {
            push_field(field.m_Name, field.m_Value);
        }
    }
    else
    {
        for (const std::string& field_name : spec.m_Fields)
        {
            if (const std::string* value{ image.FindField(field_name) })
            {
                push_field(field_name, *value);
            }
        }
    }

    return lines;
}

CaptionBlock BuildCaption(const ImageItem& image, const CaptionSpec& spec, const TextMeasurer& measurer)
{
    if (!spec.m_Enabled)
    {
        return CaptionBlock{};
    }

    CaptionBlock caption{};
    caption.m_Lines = CaptionLines(image, spec);

    int32_t width{ 0 };
    int32_t height{ 0 };
    for (size_t i = 0; i < caption.m_Lines.size(); i++)
    {
        const bool bold{ i == 0 };
        const dla::ivec2 line_size{ measurer.Measure(caption.m_Lines[i], spec.m_FontSize, bold) };
        caption.m_LineSizes.push_back(line_size);
        width = std::max(width, line_size.x);
        height += line_size.y;
    }
    height += static_cast<int32_t>(caption.m_Lines.size() - 1) * c_CaptionLineGap;

    caption.m_Size = dla::ivec2{
        width + 2 * spec.m_Padding,
        height + 2 * spec.m_Padding,
    };
    return caption;
}

int32_t ScaleBarLength(const ScaleBarSpec& spec, float scale)
{
    const double length{ std::round(static_cast<double>(spec.m_LengthCm) * spec.m_PixelsPerCm * scale) };
    return static_cast<int32_t>(std::clamp(length, 1.0, static_cast<double>(c_MaxScaledSide)));
}

ScaleBarOverlay BuildScaleBar(const LayoutConfig& config, float scale, const TextMeasurer& measurer)
{
    const ScaleBarSpec& spec{ config.m_ScaleBar };
    const int32_t font_size{ config.m_Caption.m_FontSize };
    const dla::ivec2 content_origin{ config.ContentOrigin() };
    const dla::ivec2 content_size{ config.ContentSize() };

    const std::string start_text{ "0" };
    const std::string end_text{ fmt::format("{} cm", spec.m_LengthCm) };
    const dla::ivec2 start_size{ measurer.Measure(start_text, font_size, false) };
    const dla::ivec2 end_size{ measurer.Measure(end_text, font_size, false) };
    const int32_t label_height{ std::max(start_size.y, end_size.y) };

    const int32_t length{ ScaleBarLength(spec, scale) };
    const PixelRect bar{
        { content_origin.x, content_origin.y + content_size.y - label_height - c_ScaleBarLabelGap - c_ScaleBarHeight },
        { length, c_ScaleBarHeight },
    };
    const int32_t label_top{ bar.Bottom() + c_ScaleBarLabelGap };

    return ScaleBarOverlay{
        .m_Bar{ bar },
        .m_Segments = std::max(1u, spec.m_LengthCm),
        .m_StartLabel{
            .m_Text{ start_text },
            .m_Bounds{ { bar.Left(), label_top }, start_size },
            .m_FontSize = font_size,
            .m_Alignment = TextAlignment::Left,
        },
        .m_EndLabel{
            .m_Text{ end_text },
            .m_Bounds{ { bar.Right() - end_size.x, label_top }, end_size },
            .m_FontSize = font_size,
            .m_Alignment = TextAlignment::Right,
        },
    };
}

std::string NumberText(const NumberingSpec& spec, uint32_t number)
{
    if (spec.m_Prefix.empty())
    {
        return fmt::format("{}", number);
    }
    return fmt::format("{} {}", spec.m_Prefix, number);
}

static void PushCaption(const PlacedImage& image,
                        dla::ivec2 content_origin,
                        const CaptionSpec& spec,
                        std::vector<TextOverlay>& captions)
{
    const CaptionBlock& caption{ image.m_Caption };
    const int32_t center_x{ content_origin.x + image.m_Image.Left() + image.m_Image.m_Size.x / 2 };
    int32_t line_top{ content_origin.y + image.m_Image.Bottom() + spec.m_Padding };
    for (size_t i = 0; i < caption.m_Lines.size(); i++)
    {
        const dla::ivec2 line_size{ caption.m_LineSizes[i] };
        captions.push_back(TextOverlay{
            .m_Text{ caption.m_Lines[i] },
            .m_Bounds{ { center_x - line_size.x / 2, line_top }, line_size },
            .m_FontSize = spec.m_FontSize,
            .m_Alignment = TextAlignment::Center,
            .m_Bold = i == 0,
        });
        line_top += line_size.y + c_CaptionLineGap;
    }
}

static TextOverlay MakeNumber(const PixelRect& anchor,
                              const NumberingSpec& spec,
                              uint32_t number,
                              const TextMeasurer& measurer)
{
    std::string text{ NumberText(spec, number) };
    const dla::ivec2 size{ measurer.Measure(text, spec.m_FontSize, true) };

    const bool left{ spec.m_Position == NumberPosition::TopLeft || spec.m_Position == NumberPosition::BottomLeft };
    const bool top{ spec.m_Position == NumberPosition::TopLeft || spec.m_Position == NumberPosition::TopRight };
    const dla::ivec2 position{
        left ? anchor.Left() + c_NumberInset : anchor.Right() - c_NumberInset - size.x,
        top ? anchor.Top() + c_NumberInset : anchor.Bottom() - c_NumberInset - size.y,
    };

    return TextOverlay{
        .m_Text{ std::move(text) },
        .m_Bounds{ position, size },
        .m_FontSize = spec.m_FontSize,
        .m_Alignment = left ? TextAlignment::Left : TextAlignment::Right,
        .m_Bold = true,
    };
}

PageOverlays ComposeOverlays(const Page& page,
                             std::span<const PixelRect> dividers,
                             const LayoutConfig& config,
                             float scale,
                             const TextMeasurer& measurer,
                             uint32_t& running_number)
{
    PageOverlays overlays{};
    const dla::ivec2 content_origin{ page.m_ContentOrigin };
    const PixelRect content_rect{ content_origin, config.ContentSize() };

    if (config.m_MarginBorder)
    {
        overlays.m_Border = BorderOverlay{
            .m_Bounds{ content_rect },
            .m_Thickness = c_BorderThickness,
        };
    }

    for (const PixelRect& divider : dividers)
    {
        overlays.m_Dividers.push_back(LineOverlay{ divider.Translated(content_origin) });
    }

    if (config.m_Caption.m_Enabled)
    {
        for (const PlacedImage& image : page.m_Images)
        {
            PushCaption(image, content_origin, config.m_Caption, overlays.m_Captions);
        }
    }

    if (config.m_ScaleBar.m_Enabled)
    {
        overlays.m_ScaleBar = BuildScaleBar(config, scale, measurer);
    }

    if (config.m_Numbering.m_Enabled)
    {
        switch (config.m_Numbering.m_Scope)
        {
        case NumberingScope::Image:
            for (const PlacedImage& image : page.m_Images)
            {
                overlays.m_Numbers.push_back(MakeNumber(image.m_Image.Translated(content_origin),
                                                        config.m_Numbering,
                                                        running_number++,
                                                        measurer));
            }
            break;
        case NumberingScope::Page:
            overlays.m_Numbers.push_back(MakeNumber(content_rect, config.m_Numbering, running_number++, measurer));
            break;
        }
    }

    return overlays;
}
