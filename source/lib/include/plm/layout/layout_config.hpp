#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <dla/vector.h>

#include <plm/util.hpp>

enum class LayoutMode
{
    Grid,
    Puzzle,
    Masonry,
    Manual,
};

enum class ScaleMode
{
    Fixed,
    Auto,
};

enum class SortDirection
{
    Ascending,
    Descending,
};

enum class BreakKind
{
    NewPage,
    Divider,
};

enum class NumberPosition
{
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

enum class NumberingScope
{
    Image,
    Page,
};

struct SortKey
{
    // One of "none", "alphabetical", "natural_name", "random" or a metadata field name
    std::string m_Field{ "none" };
    SortDirection m_Direction{ SortDirection::Ascending };
};

struct SortSpec
{
    SortKey m_Primary{ "alphabetical" };
    SortKey m_Secondary{};
    std::optional<uint64_t> m_RandomSeed{ std::nullopt };
};

struct ScaleSpec
{
    ScaleMode m_Mode{ ScaleMode::Fixed };
    float m_Factor{ 0.4f };
    uint32_t m_TargetImagesPerPage{ 0 };
    float m_MinFactor{ 0.01f };
    float m_MaxFactor{ 4.0f };
    float m_Tolerance{ 0.001f };
};

struct PageBreakSpec
{
    bool m_Enabled{ false };
    BreakKind m_Kind{ BreakKind::NewPage };
    int32_t m_DividerThickness{ 2 };
    // Zero spans the full content width
    int32_t m_DividerWidth{ 0 };
};

struct CaptionSpec
{
    bool m_Enabled{ true };
    int32_t m_FontSize{ 12 };
    int32_t m_Padding{ 5 };
    std::vector<std::string> m_Fields{};
    bool m_HideFieldNames{ false };
    bool m_RemoveExtension{ false };
};

struct ScaleBarSpec
{
    bool m_Enabled{ true };
    uint32_t m_LengthCm{ 5 };
    float m_PixelsPerCm{ 118.0f };
};

struct NumberingSpec
{
    bool m_Enabled{ false };
    uint32_t m_StartNumber{ 1 };
    NumberPosition m_Position{ NumberPosition::BottomRight };
    std::string m_Prefix{ "Tav." };
    int32_t m_FontSize{ 18 };
    NumberingScope m_Scope{ NumberingScope::Image };
};

struct ManualPlacement
{
    uint32_t m_PageIndex{ 0 };
    dla::ivec2 m_Position{ 0, 0 };
    std::optional<dla::ivec2> m_Size{ std::nullopt };
};

struct LayoutConfig
{
    LayoutMode m_Mode{ LayoutMode::Grid };
    dla::ivec2 m_PageSize{ 2480, 3508 };
    int32_t m_Margin{ 50 };
    int32_t m_Spacing{ 10 };

    uint32_t m_GridColumns{ 3 };
    uint32_t m_GridRows{ 4 };
    uint32_t m_MasonryColumns{ 3 };

    ScaleSpec m_Scale{};
    SortSpec m_Sort{};
    PageBreakSpec m_PageBreak{};
    CaptionSpec m_Caption{};
    ScaleBarSpec m_ScaleBar{};
    NumberingSpec m_Numbering{};
    bool m_MarginBorder{ false };

    // Keyed by image name
    std::map<std::string, ManualPlacement> m_ManualPlacements{};

    dla::ivec2 ContentSize() const;
    dla::ivec2 ContentOrigin() const;

    // Throws GenerationError for configurations that cannot produce any page
    void Validate() const;
};

/*
        Missing or mistyped options keep their defaults, an unknown mode or page size throws GenerationError
*/
LayoutConfig LoadLayoutConfig(const nlohmann::json& json);
LayoutConfig LoadLayoutConfig(const fs::path& json_path);
nlohmann::json DumpLayoutConfig(const LayoutConfig& config);
