#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <plm/config.hpp>
#include <plm/json_util.hpp>
#include <plm/layout/errors.hpp>
#include <plm/layout/layout_config.hpp>

TEST_CASE("Empty layout keeps defaults", "[layout_config_defaults]")
{
    const LayoutConfig config{ LoadLayoutConfig(nlohmann::json::object()) };
    const LayoutConfig defaults{};
    REQUIRE(config.m_Mode == defaults.m_Mode);
    REQUIRE(config.m_Margin == defaults.m_Margin);
    REQUIRE(config.m_Spacing == defaults.m_Spacing);
    REQUIRE(config.m_PageSize == g_Cfg.ResolvePageSize(g_Cfg.m_DefaultPageSize).value());
    REQUIRE(config.m_Sort.m_Primary.m_Field == "alphabetical");
    REQUIRE(config.m_Caption.m_Enabled);
}

TEST_CASE("Read a full layout", "[layout_config_read]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "mode": "Masonry",
        "page_size": "A3",
        "margin": 80,
        "spacing": 12,
        "masonry": { "columns": 4 },
        "scale": { "mode": "Auto", "target_images_per_page": 6 },
        "sort": {
            "primary": { "field": "site", "direction": "Descending" },
            "secondary": "natural_name",
            "random_seed": 7
        },
        "page_break": { "enabled": true, "kind": "Divider", "divider_thickness": 3 },
        "caption": { "fields": [ "site", "layer" ], "hide_field_names": true },
        "scale_bar": { "length_cm": 10 },
        "numbering": { "enabled": true, "position": "TopLeft", "prefix": "Fig.", "scope": "Page" },
        "manual_placements": { "a.png": { "page": 1, "x": 5, "y": 6, "width": 70, "height": 80 } }
    })");

    const LayoutConfig config{ LoadLayoutConfig(json) };
    REQUIRE(config.m_Mode == LayoutMode::Masonry);
    REQUIRE(config.m_PageSize == g_Cfg.ResolvePageSize("A3").value());
    REQUIRE(config.m_Margin == 80);
    REQUIRE(config.m_Spacing == 12);
    REQUIRE(config.m_MasonryColumns == 4);
    REQUIRE(config.m_Scale.m_Mode == ScaleMode::Auto);
    REQUIRE(config.m_Scale.m_TargetImagesPerPage == 6);
    REQUIRE(config.m_Sort.m_Primary.m_Field == "site");
    REQUIRE(config.m_Sort.m_Primary.m_Direction == SortDirection::Descending);
    REQUIRE(config.m_Sort.m_Secondary.m_Field == "natural_name");
    REQUIRE(config.m_Sort.m_RandomSeed == 7u);
    REQUIRE(config.m_PageBreak.m_Enabled);
    REQUIRE(config.m_PageBreak.m_Kind == BreakKind::Divider);
    REQUIRE(config.m_PageBreak.m_DividerThickness == 3);
    REQUIRE(config.m_Caption.m_Fields == std::vector<std::string>{ "site", "layer" });
    REQUIRE(config.m_Caption.m_HideFieldNames);
    REQUIRE(config.m_ScaleBar.m_LengthCm == 10);
    REQUIRE(config.m_Numbering.m_Enabled);
    REQUIRE(config.m_Numbering.m_Position == NumberPosition::TopLeft);
    REQUIRE(config.m_Numbering.m_Prefix == "Fig.");
    REQUIRE(config.m_Numbering.m_Scope == NumberingScope::Page);

    REQUIRE(config.m_ManualPlacements.size() == 1);
    const ManualPlacement& placement{ config.m_ManualPlacements.at("a.png") };
    REQUIRE(placement.m_PageIndex == 1);
    REQUIRE(placement.m_Position == dla::ivec2{ 5, 6 });
    REQUIRE(placement.m_Size == dla::ivec2{ 70, 80 });
}

TEST_CASE("Mistyped options keep their defaults", "[layout_config_types]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "margin": "wide",
        "spacing": -3,
        "grid": { "columns": -2, "rows": 5 },
        "caption": { "enabled": 1 }
    })");

    const LayoutConfig config{ LoadLayoutConfig(json) };
    const LayoutConfig defaults{};
    REQUIRE(config.m_Margin == defaults.m_Margin);
    REQUIRE(config.m_Spacing == -3);
    REQUIRE(config.m_GridColumns == defaults.m_GridColumns);
    REQUIRE(config.m_GridRows == 5);
    REQUIRE(config.m_Caption.m_Enabled == defaults.m_Caption.m_Enabled);

    REQUIRE_THROWS_AS(config.Validate(), GenerationError);
}

TEST_CASE("Option values accept lower case and separated spellings", "[layout_config_enum_names]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "mode": "grid",
        "scale": { "mode": "AUTO", "target_images_per_page": 2 },
        "sort": { "primary": { "field": "site", "direction": "descending" } },
        "page_break": { "enabled": true, "kind": "new-page" },
        "numbering": { "position": "bottom_right", "scope": "page" }
    })");

    const LayoutConfig config{ LoadLayoutConfig(json) };
    REQUIRE(config.m_Mode == LayoutMode::Grid);
    REQUIRE(config.m_Scale.m_Mode == ScaleMode::Auto);
    REQUIRE(config.m_Sort.m_Primary.m_Direction == SortDirection::Descending);
    REQUIRE(config.m_PageBreak.m_Kind == BreakKind::NewPage);
    REQUIRE(config.m_Numbering.m_Position == NumberPosition::BottomRight);
    REQUIRE(config.m_Numbering.m_Scope == NumberingScope::Page);

    const LayoutConfig top_left{ LoadLayoutConfig(nlohmann::json::parse(R"({
        "mode": "masonry",
        "page_break": { "kind": "divider" },
        "numbering": { "position": "top_left" }
    })")) };
    REQUIRE(top_left.m_Mode == LayoutMode::Masonry);
    REQUIRE(top_left.m_PageBreak.m_Kind == BreakKind::Divider);
    REQUIRE(top_left.m_Numbering.m_Position == NumberPosition::TopLeft);

    // Unknown values keep their defaults
    const LayoutConfig unknown{ LoadLayoutConfig(nlohmann::json::parse(R"({
        "page_break": { "kind": "chapter" },
        "numbering": { "position": "middle" }
    })")) };
    const LayoutConfig defaults{};
    REQUIRE(unknown.m_PageBreak.m_Kind == defaults.m_PageBreak.m_Kind);
    REQUIRE(unknown.m_Numbering.m_Position == defaults.m_Numbering.m_Position);
}

TEST_CASE("Unknown modes and page sizes throw", "[layout_config_errors]")
{
    REQUIRE_THROWS_AS(LoadLayoutConfig(nlohmann::json{ { "mode", "Spiral" } }), GenerationError);
    REQUIRE_THROWS_AS(LoadLayoutConfig(nlohmann::json{ { "page_size", "B12" } }), GenerationError);
    REQUIRE_THROWS_AS(LoadLayoutConfig(nlohmann::json::array()), GenerationError);
    REQUIRE_THROWS_AS(LoadLayoutConfig(fs::path{ "does_not_exist.json" }), GenerationError);
}

TEST_CASE("Dumped layouts load back", "[layout_config_dump]")
{
    LayoutConfig config{};
    config.m_Mode = LayoutMode::Puzzle;
    config.m_PageSize = { 1200, 1600 };
    config.m_Sort.m_Primary = SortKey{ "layer", SortDirection::Descending };
    config.m_Sort.m_RandomSeed = 3;
    config.m_Caption.m_Fields = { "layer" };
    config.m_Numbering.m_Enabled = true;
    config.m_ManualPlacements["a.png"] = ManualPlacement{ 2, { 10, 20 }, std::nullopt };

    const nlohmann::json dumped{ DumpLayoutConfig(config) };
    REQUIRE(dumped["mode"] == "puzzle");
    REQUIRE(dumped["numbering"]["position"] == "bottom_right");

    const LayoutConfig loaded{ LoadLayoutConfig(dumped) };
    REQUIRE(DumpLayoutConfig(loaded) == dumped);
    REQUIRE(loaded.m_ManualPlacements.at("a.png").m_PageIndex == 2);
    REQUIRE_FALSE(loaded.m_ManualPlacements.at("a.png").m_Size.has_value());
}

TEST_CASE("Read a layout file", "[layout_config_file]")
{
    const fs::path layout_path{ "layout_config_test.json" };
    {
        std::ofstream layout_file{ layout_path };
        layout_file << R"({ "mode": "Grid", "grid": { "columns": 2, "rows": 2 } })";
    }

    const LayoutConfig config{ LoadLayoutConfig(layout_path) };
    REQUIRE(config.m_GridColumns == 2);
    REQUIRE(config.m_GridRows == 2);

    {
        std::ofstream layout_file{ layout_path };
        layout_file << R"({ "mode": )";
    }
    REQUIRE_THROWS_AS(LoadLayoutConfig(layout_path), GenerationError);

    fs::remove(layout_path);
}

TEST_CASE("Override nested layout options", "[layout_config_overrides]")
{
    nlohmann::json layout{ { "mode", "Grid" } };
    SetJsonValue(layout, "caption.font_size", 20);
    SetJsonValue(layout, "grid.columns", 5);
    SetJsonValue(layout, "mode", "Puzzle");

    const LayoutConfig config{ LoadLayoutConfig(layout) };
    REQUIRE(config.m_Mode == LayoutMode::Puzzle);
    REQUIRE(config.m_Caption.m_FontSize == 20);
    REQUIRE(config.m_GridColumns == 5);

    REQUIRE_THROWS_AS(SetJsonValue(layout, "mode.name", "Grid"), std::logic_error);
}
