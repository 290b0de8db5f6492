#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <plm/layout/grid_placement.hpp>
#include <plm/layout/manual_placement.hpp>
#include <plm/layout/masonry_placement.hpp>
#include <plm/layout/paginator.hpp>
#include <plm/layout/puzzle_placement.hpp>

namespace
{
LayoutConfig MakeConfig(LayoutMode mode)
{
    LayoutConfig config{};
    config.m_Mode = mode;
    config.m_PageSize = { 1000, 1000 };
    config.m_Margin = 0;
    config.m_Spacing = 10;
    config.m_Caption.m_Enabled = false;
    config.m_ScaleBar.m_Enabled = false;
    return config;
}

// Keeps the images alive and at a stable address for the placement items
struct TestItems
{
    std::deque<ImageItem> m_Images;
    std::vector<PlacementItem> m_Items;

    void Add(std::string name, dla::ivec2 size, std::optional<std::string> group = std::nullopt)
    {
        const ImageItem& image{ m_Images.emplace_back(ImageItem{
            .m_Name{ std::move(name) },
            .m_Source{},
            .m_Size{ size },
            .m_Metadata{},
        }) };
        m_Items.push_back(PlacementItem{
            .m_Item = &image,
            .m_ImageSize{ size },
            .m_Caption{},
            .m_GroupKey{ std::move(group) },
        });
    }
};

bool NoOverlaps(const std::vector<PlacedImage>& images)
{
    for (size_t i = 0; i < images.size(); i++)
    {
        for (size_t j = i + 1; j < images.size(); j++)
        {
            if (images[i].m_Footprint.Intersects(images[j].m_Footprint))
            {
                return false;
            }
        }
    }
    return true;
}

bool InsideContent(const std::vector<PlacedImage>& images, dla::ivec2 content_size)
{
    const PixelRect content{ { 0, 0 }, content_size };
    for (const PlacedImage& image : images)
    {
        if (!content.Contains(image.m_Footprint))
        {
            return false;
        }
    }
    return true;
}
} // namespace

TEST_CASE("Footprints shrink to the available space", "[placement_footprint]")
{
    const CaptionBlock caption{
        .m_Lines{ "a" },
        .m_LineSizes{ { 40, 20 } },
        .m_Size{ 50, 30 },
    };

    const auto unchanged{ FitFootprint({ 100, 50 }, caption, { 200, 200 }) };
    REQUIRE(unchanged.has_value());
    REQUIRE_FALSE(unchanged->m_Shrunk);
    REQUIRE(unchanged->m_ImageSize == dla::ivec2{ 100, 50 });
    REQUIRE(unchanged->m_Size == dla::ivec2{ 100, 80 });

    const auto shrunk{ FitFootprint({ 400, 200 }, caption, { 200, 200 }) };
    REQUIRE(shrunk.has_value());
    REQUIRE(shrunk->m_Shrunk);
    REQUIRE(shrunk->m_ImageSize == dla::ivec2{ 200, 100 });
    REQUIRE(shrunk->m_Size == dla::ivec2{ 200, 130 });

    REQUIRE_FALSE(FitFootprint({ 100, 100 }, caption, { 200, 30 }).has_value());
}

TEST_CASE("Grid fills rows and pages", "[placement_grid]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_GridColumns = 3;
    config.m_GridRows = 2;

    TestItems items{};
    for (int i = 0; i < 7; i++)
    {
        items.Add("img" + std::to_string(i) + ".png", { 100, 100 });
    }

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ GridPlacement{}.Place(items.m_Items, config, paginator) };
    REQUIRE(result.m_Failures.empty());
    REQUIRE(result.m_Pages.size() == 2);
    REQUIRE(result.m_Pages[0].m_Images.size() == 6);
    REQUIRE(result.m_Pages[1].m_Images.size() == 1);

    for (const PlacedPage& page : result.m_Pages)
    {
        REQUIRE(NoOverlaps(page.m_Images));
        REQUIRE(InsideContent(page.m_Images, config.ContentSize()));
    }

    // Cells are 326x495, the first image sits centered in the first cell
    REQUIRE(result.m_Pages[0].m_Images[0].m_Image.m_Position == dla::ivec2{ 113, 197 });

    // The single image on the last page is centered horizontally
    REQUIRE(result.m_Pages[1].m_Images[0].m_Image.m_Position == dla::ivec2{ 450, 197 });
}

TEST_CASE("Grid shrinks images to their cell", "[placement_grid_shrink]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_GridColumns = 2;
    config.m_GridRows = 2;

    TestItems items{};
    items.Add("huge.png", { 3960, 1980 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ GridPlacement{}.Place(items.m_Items, config, paginator) };
    REQUIRE(result.m_Failures.empty());
    REQUIRE(result.m_Pages.size() == 1);
    REQUIRE(result.m_Pages[0].m_Images[0].m_Image.m_Size == dla::ivec2{ 495, 247 });
    REQUIRE(result.m_Pages[0].m_Images[0].m_Shrunk);
}

TEST_CASE("Grid without room for cells is a configuration error", "[placement_grid_error]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Grid) };
    config.m_GridColumns = 200;
    config.m_Spacing = 10;

    TestItems items{};
    items.Add("a.png", { 10, 10 });

    Paginator paginator{ config.m_PageBreak };
    REQUIRE_THROWS_AS(GridPlacement{}.Place(items.m_Items, config, paginator), GenerationError);
}

TEST_CASE("Puzzle packs without overlaps", "[placement_puzzle]")
{
    const LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };

    TestItems items{};
    std::mt19937 generator{ 42 };
    std::uniform_int_distribution<int32_t> size_distribution{ 50, 400 };
    for (int i = 0; i < 40; i++)
    {
        items.Add("img" + std::to_string(i) + ".png", { size_distribution(generator), size_distribution(generator) });
    }

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ PuzzlePlacement{}.Place(items.m_Items, config, paginator) };
    REQUIRE(result.m_Failures.empty());
    REQUIRE_FALSE(result.m_Pages.empty());

    size_t placed{ 0 };
    for (const PlacedPage& page : result.m_Pages)
    {
        REQUIRE_FALSE(page.m_Images.empty());
        REQUIRE(NoOverlaps(page.m_Images));
        REQUIRE(InsideContent(page.m_Images, config.ContentSize()));
        placed += page.m_Images.size();
    }
    REQUIRE(placed == items.m_Items.size());
}

TEST_CASE("Puzzle places larger images first", "[placement_puzzle_order]")
{
    const LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };

    TestItems items{};
    items.Add("small.png", { 100, 100 });
    items.Add("large.png", { 500, 500 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ PuzzlePlacement{}.Place(items.m_Items, config, paginator) };
    REQUIRE(result.m_Pages.size() == 1);
    REQUIRE(result.m_Pages[0].m_Images[0].m_Item->m_Name == "large.png");
    REQUIRE(result.m_Pages[0].m_Images[0].m_Footprint.m_Position == dla::ivec2{ 0, 0 });
}

TEST_CASE("Puzzle drops images larger than the page", "[placement_puzzle_oversized]")
{
    const LayoutConfig config{ MakeConfig(LayoutMode::Puzzle) };

    TestItems items{};
    items.Add("small.png", { 100, 100 });
    items.Add("wide.png", { 1200, 100 });
    items.Add("page.png", { 1000, 1000 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ PuzzlePlacement{}.Place(items.m_Items, config, paginator) };

    REQUIRE(result.m_Failures.size() == 1);
    REQUIRE(result.m_Failures[0].m_Kind == FailureKind::OversizedImage);
    REQUIRE(result.m_Failures[0].m_ImageName == "wide.png");

    REQUIRE(result.m_Pages.size() == 2);
    for (const PlacedPage& page : result.m_Pages)
    {
        REQUIRE(page.m_Images.size() == 1);
        REQUIRE_FALSE(page.m_Images[0].m_Shrunk);
        REQUIRE(page.m_Images[0].m_Image.m_Size == page.m_Images[0].m_Item->m_Size);
    }
}

TEST_CASE("Masonry fills the shortest column", "[placement_masonry]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Masonry) };
    config.m_MasonryColumns = 3;

    TestItems items{};
    items.Add("tall.png", { 100, 200 });
    items.Add("a.png", { 100, 100 });
    items.Add("b.png", { 100, 100 });
    items.Add("c.png", { 100, 100 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ MasonryPlacement{}.Place(items.m_Items, config, paginator) };
    REQUIRE(result.m_Pages.size() == 1);

    const auto& images{ result.m_Pages[0].m_Images };
    REQUIRE(images.size() == 4);
    REQUIRE(images[0].m_Image == PixelRect{ { 0, 0 }, { 326, 652 } });
    REQUIRE(images[1].m_Image == PixelRect{ { 336, 0 }, { 326, 326 } });
    REQUIRE(images[2].m_Image == PixelRect{ { 672, 0 }, { 326, 326 } });
    REQUIRE(images[3].m_Image == PixelRect{ { 336, 336 }, { 326, 326 } });
    REQUIRE(NoOverlaps(images));
    REQUIRE(InsideContent(images, config.ContentSize()));
}

TEST_CASE("Masonry starts a new page when the shortest column is full", "[placement_masonry_pages]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Masonry) };
    config.m_MasonryColumns = 2;

    TestItems items{};
    for (int i = 0; i < 5; i++)
    {
        items.Add("img" + std::to_string(i) + ".png", { 100, 100 });
    }

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ MasonryPlacement{}.Place(items.m_Items, config, paginator) };
    // Two rows of 495 pixel squares fill the content exactly
    REQUIRE(result.m_Pages.size() == 2);
    REQUIRE(result.m_Pages[0].m_Images.size() == 4);
    REQUIRE(result.m_Pages[1].m_Images.size() == 1);
}

TEST_CASE("Manual placement takes positions as given", "[placement_manual]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Manual) };
    config.m_ManualPlacements["a.png"] = ManualPlacement{ 0, { 10, 20 }, std::nullopt };
    config.m_ManualPlacements["c.png"] = ManualPlacement{ 2, { 30, 40 }, dla::ivec2{ 50, 60 } };
    config.m_ManualPlacements["d.png"] = ManualPlacement{ 0, { 0, 0 }, dla::ivec2{ 0, 10 } };

    TestItems items{};
    items.Add("a.png", { 100, 100 });
    items.Add("b.png", { 100, 100 });
    items.Add("c.png", { 100, 100 });
    items.Add("d.png", { 100, 100 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ ManualPlacementStrategy{}.Place(items.m_Items, config, paginator) };

    REQUIRE(result.m_Pages.size() == 3);
    REQUIRE(result.m_Pages[0].m_Images.size() == 1);
    REQUIRE(result.m_Pages[1].m_Images.empty());
    REQUIRE(result.m_Pages[2].m_Images.size() == 1);
    REQUIRE(result.m_Pages[0].m_Images[0].m_Image == PixelRect{ { 10, 20 }, { 100, 100 } });
    REQUIRE(result.m_Pages[2].m_Images[0].m_Image == PixelRect{ { 30, 40 }, { 50, 60 } });

    REQUIRE(result.m_Failures.size() == 2);
    REQUIRE(result.m_Failures[0].m_Kind == FailureKind::MissingManualPlacement);
    REQUIRE(result.m_Failures[0].m_ImageName == "b.png");
    REQUIRE(result.m_Failures[1].m_Kind == FailureKind::InvalidManualPlacement);
    REQUIRE(result.m_Failures[1].m_ImageName == "d.png");
}

TEST_CASE("Manual placement rejects pages beyond the image count", "[placement_manual_page_range]")
{
    LayoutConfig config{ MakeConfig(LayoutMode::Manual) };
    config.m_ManualPlacements["a.png"] = ManualPlacement{ 1, { 0, 0 }, std::nullopt };
    config.m_ManualPlacements["b.png"] = ManualPlacement{ 4294967295u, { 0, 0 }, std::nullopt };
    config.m_ManualPlacements["c.png"] = ManualPlacement{ 1000000000u, { 0, 0 }, std::nullopt };

    TestItems items{};
    items.Add("a.png", { 100, 100 });
    items.Add("b.png", { 100, 100 });
    items.Add("c.png", { 100, 100 });

    Paginator paginator{ config.m_PageBreak };
    const PlacementResult result{ ManualPlacementStrategy{}.Place(items.m_Items, config, paginator) };

    REQUIRE(result.m_Pages.size() == 2);
    REQUIRE(result.m_Pages[0].m_Images.empty());
    REQUIRE(result.m_Pages[1].m_Images.size() == 1);

    REQUIRE(result.m_Failures.size() == 2);
    REQUIRE(result.m_Failures[0].m_Kind == FailureKind::InvalidManualPlacement);
    REQUIRE(result.m_Failures[0].m_ImageName == "b.png");
    REQUIRE(result.m_Failures[1].m_Kind == FailureKind::InvalidManualPlacement);
    REQUIRE(result.m_Failures[1].m_ImageName == "c.png");
}
