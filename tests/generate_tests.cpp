#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include <plm/layout/generate.hpp>
#include <plm/layout/scale.hpp>
#include <plm/util/log.hpp>

namespace
{
const FixedWidthTextMeasurer g_Measurer{};

std::vector<ImageItem> MakeImages(size_t count, dla::ivec2 size)
{
    std::vector<ImageItem> images;
    for (size_t i = 0; i < count; i++)
    {
        images.push_back(ImageItem{
            .m_Name{ "img" + std::to_string(i + 1) + ".png" },
            .m_Source{},
            .m_Size{ size },
            .m_Metadata{ { "site", i % 2 == 0 ? "A" : "B" } },
        });
    }
    return images;
}

LayoutConfig MakeConfig(LayoutMode mode)
{
    LayoutConfig config{};
    config.m_Mode = mode;
    config.m_PageSize = { 1000, 1000 };
    config.m_Margin = 0;
    config.m_Spacing = 0;
    config.m_GridColumns = 3;
    config.m_GridRows = 2;
    config.m_Scale.m_Factor = 1.0f;
    config.m_Caption.m_Enabled = false;
    config.m_ScaleBar.m_Enabled = false;
    config.m_Sort.m_Primary = SortKey{ "natural_name" };
    return config;
}

// Collects the warnings logged while it is alive
struct WarningCollector
{
    WarningCollector()
        : m_Log{ LogFlags{}, Log::c_MainLogName }
    {
        m_Log.InstallHook(
            [this](const Log::DetailInformation&, Log::LogLevel level, std::string_view message)
            {
                if (level == Log::LogLevel::Warning)
                {
                    m_Warnings.emplace_back(message);
                }
            });
    }

    Log m_Log;
    std::vector<std::string> m_Warnings;
};
} // namespace

TEST_CASE("Generate a grid document", "[generate_grid]")
{
    const auto images{ MakeImages(10, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_Numbering.m_Enabled = true;
    config.m_Numbering.m_Prefix.clear();

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_TotalPages == 2);
    REQUIRE(document.m_TotalImages == 10);
    REQUIRE(document.m_Failures.empty());
    REQUIRE(document.Status() == PlacementStatus::FullyPlaced);
    REQUIRE(document.m_Scale.m_Factor == 1.0f);
    REQUIRE_FALSE(document.m_Scale.m_Auto);

    for (uint32_t i = 0; i < document.m_Pages.size(); i++)
    {
        const Page& page{ document.m_Pages[i] };
        REQUIRE(page.m_Index == i);
        REQUIRE(page.m_Size == config.m_PageSize);
        for (const PlacedImage& image : page.m_Images)
        {
            REQUIRE(image.m_PageIndex == i);
        }
    }

    REQUIRE(document.m_Pages[0].m_Images[0].m_Item->m_Name == "img1.png");
    REQUIRE(document.m_Pages[1].m_Images.back().m_Item->m_Name == "img10.png");
    REQUIRE(document.m_Pages[1].m_Overlays.m_Numbers.front().m_Text == "7");
    REQUIRE(document.m_Pages[1].m_Overlays.m_Numbers.back().m_Text == "10");
}

TEST_CASE("Generation is deterministic", "[generate_deterministic]")
{
    const auto images{ MakeImages(25, { 120, 80 }) };
    for (const LayoutMode mode : { LayoutMode::Grid, LayoutMode::Puzzle, LayoutMode::Masonry })
    {
        LayoutConfig config{ MakeConfig(mode) };
        config.m_Caption.m_Enabled = true;
        config.m_ScaleBar.m_Enabled = true;
        config.m_Sort.m_Primary = SortKey{ "random" };
        config.m_Sort.m_RandomSeed = 99;

        const Document first{ GenerateDocument(images, config, g_Measurer) };
        const Document second{ GenerateDocument(images, config, g_Measurer) };
        REQUIRE(first == second);
        REQUIRE(first.m_TotalImages == images.size());
    }
}

TEST_CASE("Preview matches the first generated page", "[generate_preview]")
{
    const auto images{ MakeImages(10, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };
    config.m_Caption.m_Enabled = true;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    const Page preview{ PreviewFirstPage(images, config, g_Measurer) };
    REQUIRE(preview == document.m_Pages.front());

    const Page empty_preview{ PreviewFirstPage({}, config, g_Measurer) };
    REQUIRE(empty_preview.m_Images.empty());
    REQUIRE(empty_preview.m_Size == config.m_PageSize);
}

TEST_CASE("Images that can't fit are reported", "[generate_oversized]")
{
    const auto images{ MakeImages(3, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };
    config.m_PageSize = { 200, 200 };
    config.m_Caption.m_Enabled = true;
    config.m_Caption.m_FontSize = 200;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_TotalImages == 0);
    REQUIRE(document.m_Failures.size() == 3);
    REQUIRE(std::ranges::all_of(document.m_Failures,
                                [](const GenerationFailure& failure)
                                { return failure.m_Kind == FailureKind::OversizedImage; }));
    REQUIRE(document.Status() == PlacementStatus::PartiallyPlaced);
}

TEST_CASE("Load failures are kept in the document", "[generate_load_failures]")
{
    const auto images{ MakeImages(2, { 100, 100 }) };
    const LayoutConfig config{ MakeConfig(LayoutMode::Grid) };

    GenerationFailures load_failures{
        GenerationFailure{ FailureKind::ImageLoadFailure, "broken.png", "Could not decode broken.png" },
    };
    const Document document{ GenerateDocument(images, config, g_Measurer, load_failures) };
    REQUIRE(document.m_TotalImages == 2);
    REQUIRE(document.m_Failures == load_failures);
    REQUIRE(document.Status() == PlacementStatus::PartiallyPlaced);
}

TEST_CASE("Invalid configurations throw", "[generate_config_error]")
{
    const auto images{ MakeImages(2, { 100, 100 }) };

    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_Margin = 600;
    REQUIRE_THROWS_AS(GenerateDocument(images, config, g_Measurer), GenerationError);

    config = MakeConfig(LayoutMode::Grid);
    config.m_GridColumns = 0;
    REQUIRE_THROWS_AS(GenerateDocument(images, config, g_Measurer), GenerationError);

    config = MakeConfig(LayoutMode::Puzzle);
    config.m_Scale.m_Mode = ScaleMode::Auto;
    config.m_Scale.m_TargetImagesPerPage = 0;
    REQUIRE_THROWS_AS(GenerateDocument(images, config, g_Measurer), GenerationError);
}

TEST_CASE("Auto scale hits the requested images per page", "[generate_auto_scale]")
{
    const auto images{ MakeImages(10, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };
    config.m_Scale.m_Mode = ScaleMode::Auto;
    config.m_Scale.m_TargetImagesPerPage = 4;
    config.m_Scale.m_MinFactor = 0.1f;
    config.m_Scale.m_MaxFactor = 4.0f;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_Scale.m_Auto);
    REQUIRE(document.m_Scale.m_Exact);
    REQUIRE(document.m_Scale.m_AchievedImagesPerPage == 4);
    REQUIRE(document.m_Pages.front().m_Images.size() == 4);
    REQUIRE(document.m_Failures.empty());

    // Laying out again at the resolved factor gives the same pages
    LayoutConfig fixed_config{ config };
    fixed_config.m_Scale.m_Mode = ScaleMode::Fixed;
    fixed_config.m_Scale.m_Factor = document.m_Scale.m_Factor;
    const Document fixed_document{ GenerateDocument(images, fixed_config, g_Measurer) };
    REQUIRE(fixed_document.m_Pages == document.m_Pages);
}

TEST_CASE("Unreachable auto scale targets are reported", "[generate_auto_scale_infeasible]")
{
    const auto images{ MakeImages(10, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };
    config.m_Scale.m_Mode = ScaleMode::Auto;
    config.m_Scale.m_TargetImagesPerPage = 3;
    config.m_Scale.m_MinFactor = 0.1f;
    config.m_Scale.m_MaxFactor = 4.0f;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE_FALSE(document.m_Scale.m_Exact);
    REQUIRE(document.m_Scale.m_AchievedImagesPerPage == 4);
    REQUIRE(document.m_Failures.size() == 1);
    REQUIRE(document.m_Failures[0].m_Kind == FailureKind::InfeasibleAutoScale);
    REQUIRE(document.Status() == PlacementStatus::FullyPlaced);
    REQUIRE(document.m_TotalImages == images.size());
}

TEST_CASE("Group breaks apply to the whole document", "[generate_page_breaks]")
{
    const auto images{ MakeImages(6, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Masonry) };
    config.m_Sort.m_Primary = SortKey{ "site" };
    config.m_PageBreak.m_Enabled = true;
    config.m_PageBreak.m_Kind = BreakKind::NewPage;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_TotalPages == 2);
    for (const Page& page : document.m_Pages)
    {
        const std::string* site{ page.m_Images.front().m_Item->FindField("site") };
        REQUIRE(std::ranges::all_of(page.m_Images,
                                    [site](const PlacedImage& image)
                                    { return *image.m_Item->FindField("site") == *site; }));
    }
}

TEST_CASE("Auto scale in grid mode keeps images at the scale of the bar", "[generate_auto_scale_grid]")
{
    const auto images{ MakeImages(10, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_Scale.m_Mode = ScaleMode::Auto;
    config.m_Scale.m_TargetImagesPerPage = 6;
    config.m_Scale.m_MinFactor = 0.1f;
    config.m_Scale.m_MaxFactor = 4.0f;
    config.m_ScaleBar.m_Enabled = true;
    config.m_ScaleBar.m_LengthCm = 1;
    config.m_ScaleBar.m_PixelsPerCm = 100.0f;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_Scale.m_Exact);
    REQUIRE(document.m_Scale.m_AchievedImagesPerPage == 6);
    REQUIRE(document.m_Failures.empty());

    // Cells are 333 pixels wide, larger factors would shrink the images
    REQUIRE(document.m_Scale.m_Factor < 3.34f);
    REQUIRE(document.m_Scale.m_Factor > 3.3f);

    const Page& page{ document.m_Pages.front() };
    REQUIRE(page.m_Images.size() == 6);
    REQUIRE(page.m_Overlays.m_ScaleBar.has_value());
    const int32_t bar_length{ page.m_Overlays.m_ScaleBar->m_Bar.m_Size.x };
    for (const PlacedImage& image : page.m_Images)
    {
        REQUIRE_FALSE(image.m_Shrunk);
        REQUIRE(image.m_Image.m_Size == ScaledSize(image.m_Item->m_Size, document.m_Scale.m_Factor).value());

        // One centimeter of bar covers the 100 pixels per centimeter of the image
        REQUIRE(std::abs(image.m_Image.m_Size.x - bar_length) <= 1);
    }
}

TEST_CASE("Images too large to scale are reported", "[generate_scale_overflow]")
{
    WarningCollector collector{};
    std::vector<ImageItem> images{ MakeImages(2, { 100, 100 }) };
    images[1].m_Size = { 4000, 3000 };
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_Scale.m_Factor = 1e5f;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_TotalImages == 1);
    REQUIRE(document.m_Failures.size() == 1);
    REQUIRE(document.m_Failures[0].m_Kind == FailureKind::OversizedImage);
    REQUIRE(document.m_Failures[0].m_ImageName == "img2.png");
    REQUIRE(document.m_Pages.front().m_Images.front().m_Item->m_Name == "img1.png");
    REQUIRE(document.m_Pages.front().m_Images.front().m_Shrunk);

    // The remaining image only fits its cell by shrinking, which breaks the scale bar
    REQUIRE(collector.m_Warnings.size() == 1);
    REQUIRE(collector.m_Warnings[0].contains("img1.png"));
}

TEST_CASE("Page breaks without a metadata sort field are reported", "[generate_page_break_warning]")
{
    WarningCollector collector{};
    const auto images{ MakeImages(6, { 100, 100 }) };
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_PageBreak.m_Enabled = true;

    const Document document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(document.m_TotalPages == 1);
    REQUIRE(collector.m_Warnings.size() == 1);
    REQUIRE(collector.m_Warnings[0].contains("natural_name"));

    collector.m_Warnings.clear();
    config.m_Sort.m_Primary = SortKey{ "site" };
    const Document grouped_document{ GenerateDocument(images, config, g_Measurer) };
    REQUIRE(grouped_document.m_TotalPages == 2);
    REQUIRE(collector.m_Warnings.empty());
}
