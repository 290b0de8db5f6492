#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <plm/layout/annotations.hpp>
#include <plm/layout/scale.hpp>

namespace
{
const FixedWidthTextMeasurer g_Measurer{};

ImageItem MakeImage()
{
    return ImageItem{
        .m_Name{ "site_01.png" },
        .m_Source{},
        .m_Size{ 100, 100 },
        .m_Metadata{
            { "site", "Pompeii" },
            { "layer", "3" },
            { "notes", "" },
        },
    };
}
} // namespace

TEST_CASE("Caption lists all fields without a selection", "[caption_lines]")
{
    const ImageItem image{ MakeImage() };

    CaptionSpec spec{};
    REQUIRE(CaptionLines(image, spec) == std::vector<std::string>{ "site_01.png", "site: Pompeii", "layer: 3" });

    spec.m_Fields = { "layer", "missing" };
    spec.m_HideFieldNames = true;
    spec.m_RemoveExtension = true;
    REQUIRE(CaptionLines(image, spec) == std::vector<std::string>{ "site_01", "3" });
}

TEST_CASE("Caption size covers all lines and padding", "[caption_size]")
{
    const ImageItem image{ MakeImage() };

    CaptionSpec spec{};
    spec.m_FontSize = 10;
    spec.m_Padding = 5;

    // Glyphs are 6 pixels wide and lines 12 pixels high at font size 10
    const CaptionBlock caption{ BuildCaption(image, spec, g_Measurer) };
    REQUIRE(caption.m_Lines.size() == 3);
    REQUIRE(caption.m_LineSizes[1] == dla::ivec2{ 78, 12 });
    REQUIRE(caption.m_Size == dla::ivec2{ 78 + 10, 3 * 12 + 2 * c_CaptionLineGap + 10 });

    spec.m_Enabled = false;
    REQUIRE(BuildCaption(image, spec, g_Measurer) == CaptionBlock{});
}

TEST_CASE("Scale bar follows the image scale", "[scale_bar]")
{
    LayoutConfig config{};
    config.m_PageSize = { 1000, 1000 };
    config.m_Margin = 50;
    config.m_Caption.m_FontSize = 10;
    config.m_ScaleBar.m_LengthCm = 5;
    config.m_ScaleBar.m_PixelsPerCm = 118.0f;

    REQUIRE(ScaleBarLength(config.m_ScaleBar, 1.0f) == 590);
    REQUIRE(ScaleBarLength(config.m_ScaleBar, 0.5f) == 295);
    REQUIRE(ScaleBarLength(config.m_ScaleBar, 0.0001f) == 1);
    REQUIRE(ScaleBarLength(config.m_ScaleBar, 1e8f) == c_MaxScaledSide);

    const ScaleBarOverlay bar{ BuildScaleBar(config, 0.5f, g_Measurer) };
    REQUIRE(bar.m_Segments == 5);
    REQUIRE(bar.m_Bar.m_Size == dla::ivec2{ 295, c_ScaleBarHeight });
    REQUIRE(bar.m_Bar.Left() == 50);
    REQUIRE(bar.m_EndLabel.m_Text == "5 cm");
    REQUIRE(bar.m_EndLabel.m_Bounds.Right() == bar.m_Bar.Right());
    REQUIRE(bar.m_StartLabel.m_Bounds.Bottom() == 950);
    REQUIRE(bar.m_StartLabel.m_Bounds.Top() == bar.m_Bar.Bottom() + c_ScaleBarLabelGap);
}

TEST_CASE("Numbers count on across pages", "[numbering]")
{
    LayoutConfig config{};
    config.m_PageSize = { 1000, 1000 };
    config.m_Margin = 50;
    config.m_Caption.m_Enabled = false;
    config.m_ScaleBar.m_Enabled = false;
    config.m_Numbering.m_Enabled = true;
    config.m_Numbering.m_Prefix = "Tav.";
    config.m_Numbering.m_Position = NumberPosition::TopLeft;

    const ImageItem image{ MakeImage() };
    const Page page{
        .m_Index = 0,
        .m_Size{ config.m_PageSize },
        .m_ContentOrigin{ config.ContentOrigin() },
        .m_Images{
            PlacedImage{ &image, { { 0, 0 }, { 100, 100 } }, { { 0, 0 }, { 100, 100 } }, {}, 0 },
            PlacedImage{ &image, { { 200, 0 }, { 100, 100 } }, { { 200, 0 }, { 100, 100 } }, {}, 0 },
        },
        .m_Overlays{},
    };

    uint32_t running_number{ 7 };
    const PageOverlays first{ ComposeOverlays(page, {}, config, 1.0f, g_Measurer, running_number) };
    REQUIRE(first.m_Numbers.size() == 2);
    REQUIRE(first.m_Numbers[0].m_Text == "Tav. 7");
    REQUIRE(first.m_Numbers[1].m_Text == "Tav. 8");
    REQUIRE(first.m_Numbers[0].m_Bounds.m_Position == dla::ivec2{ 50 + c_NumberInset, 50 + c_NumberInset });
    REQUIRE(first.m_Numbers[0].m_Bold);

    config.m_Numbering.m_Scope = NumberingScope::Page;
    config.m_Numbering.m_Prefix.clear();
    const PageOverlays second{ ComposeOverlays(page, {}, config, 1.0f, g_Measurer, running_number) };
    REQUIRE(second.m_Numbers.size() == 1);
    REQUIRE(second.m_Numbers[0].m_Text == "9");
    REQUIRE(running_number == 10);
}

TEST_CASE("Overlays are in page coordinates", "[overlays]")
{
    LayoutConfig config{};
    config.m_PageSize = { 1000, 1000 };
    config.m_Margin = 50;
    config.m_MarginBorder = true;
    config.m_ScaleBar.m_Enabled = false;
    config.m_Caption.m_FontSize = 10;

    const ImageItem image{ MakeImage() };
    const CaptionBlock caption{ BuildCaption(image, config.m_Caption, g_Measurer) };
    const Page page{
        .m_Index = 0,
        .m_Size{ config.m_PageSize },
        .m_ContentOrigin{ config.ContentOrigin() },
        .m_Images{
            PlacedImage{ &image, { { 10, 20 }, { 100, 100 } }, { { 10, 20 }, { 100, 100 + caption.m_Size.y } }, caption, 0 },
        },
        .m_Overlays{},
    };
    const std::vector<PixelRect> dividers{ PixelRect{ { 0, 200 }, { 900, 2 } } };

    uint32_t running_number{ 1 };
    const PageOverlays overlays{ ComposeOverlays(page, dividers, config, 1.0f, g_Measurer, running_number) };

    REQUIRE(overlays.m_Border.has_value());
    REQUIRE(overlays.m_Border->m_Bounds == PixelRect{ { 50, 50 }, { 900, 900 } });

    REQUIRE(overlays.m_Dividers.size() == 1);
    REQUIRE(overlays.m_Dividers[0].m_Bounds == PixelRect{ { 50, 250 }, { 900, 2 } });

    REQUIRE(overlays.m_Captions.size() == 3);
    REQUIRE(overlays.m_Captions[0].m_Bold);
    REQUIRE(overlays.m_Captions[0].m_Bounds.Top() == 50 + 120 + config.m_Caption.m_Padding);
    REQUIRE_FALSE(overlays.m_ScaleBar.has_value());
    REQUIRE(overlays.m_Numbers.empty());
}
