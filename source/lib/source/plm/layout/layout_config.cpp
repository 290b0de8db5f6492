#include <plm/layout/layout_config.hpp>

#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <plm/config.hpp>
#include <plm/layout/errors.hpp>
#include <plm/util/log.hpp>

dla::ivec2 LayoutConfig::ContentSize() const
{
    return dla::ivec2{
        m_PageSize.x - 2 * m_Margin,
        m_PageSize.y - 2 * m_Margin,
    };
}

dla::ivec2 LayoutConfig::ContentOrigin() const
{
    return dla::ivec2{ m_Margin, m_Margin };
}

void LayoutConfig::Validate() const
{
    if (m_PageSize.x <= 0 || m_PageSize.y <= 0)
    {
        throw GenerationError{ fmt::format("Page size {}x{} is not positive", m_PageSize.x, m_PageSize.y) };
    }

    if (m_Margin < 0 || m_Spacing < 0)
    {
        throw GenerationError{ fmt::format("Margin {} and spacing {} may not be negative", m_Margin, m_Spacing) };
    }

    const dla::ivec2 content_size{ ContentSize() };
    if (content_size.x <= 0 || content_size.y <= 0)
    {
        throw GenerationError{
            fmt::format("Margin {} leaves no content on a page of size {}x{}", m_Margin, m_PageSize.x, m_PageSize.y),
        };
    }

    if (m_Mode == LayoutMode::Grid && (m_GridColumns == 0 || m_GridRows == 0))
    {
        throw GenerationError{ fmt::format("Grid of {}x{} has no cells", m_GridColumns, m_GridRows) };
    }

    if (m_Mode == LayoutMode::Masonry && m_MasonryColumns == 0)
    {
        throw GenerationError{ "Masonry layout needs at least one column" };
    }

    if (m_Scale.m_Mode == ScaleMode::Fixed && m_Scale.m_Factor <= 0.0f)
    {
        throw GenerationError{ fmt::format("Scale factor {} is not positive", m_Scale.m_Factor) };
    }

    if (m_Scale.m_Mode == ScaleMode::Auto)
    {
        if (m_Scale.m_TargetImagesPerPage == 0)
        {
            throw GenerationError{ "Auto scale needs a target of at least one image per page" };
        }
        if (m_Scale.m_MinFactor <= 0.0f || m_Scale.m_MaxFactor < m_Scale.m_MinFactor || m_Scale.m_Tolerance <= 0.0f)
        {
            throw GenerationError{
                fmt::format("Auto scale range [{}, {}] with tolerance {} is invalid",
                            m_Scale.m_MinFactor,
                            m_Scale.m_MaxFactor,
                            m_Scale.m_Tolerance),
            };
        }
    }

    if (m_Caption.m_Enabled && (m_Caption.m_FontSize <= 0 || m_Caption.m_Padding < 0))
    {
        throw GenerationError{
            fmt::format("Caption font size {} and padding {} are invalid", m_Caption.m_FontSize, m_Caption.m_Padding),
        };
    }

    if (m_Numbering.m_Enabled && m_Numbering.m_FontSize <= 0)
    {
        throw GenerationError{ fmt::format("Number font size {} is not positive", m_Numbering.m_FontSize) };
    }

    if (m_PageBreak.m_Enabled && m_PageBreak.m_Kind == BreakKind::Divider && m_PageBreak.m_DividerThickness <= 0)
    {
        throw GenerationError{
            fmt::format("Divider thickness {} is not positive", m_PageBreak.m_DividerThickness),
        };
    }
}

// Accepts "BottomRight" as well as "bottom_right", "bottom-right" or any casing of them
template<class T>
static std::optional<T> ParseEnumName(std::string_view name)
{
    std::string normalized{ name };
    std::erase_if(normalized,
                  [](char c)
                  { return c == '_' || c == '-'; });
    return magic_enum::enum_cast<T>(normalized, magic_enum::case_insensitive);
}

template<class T>
static std::string EnumConfigName(T value)
{
    std::string name{};
    for (const char c : magic_enum::enum_name(value))
    {
        if (std::isupper(static_cast<unsigned char>(c)))
        {
            if (!name.empty())
            {
                name.push_back('_');
            }
            name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        else
        {
            name.push_back(c);
        }
    }
    return name;
}

template<class T>
static void ReadValue(const nlohmann::json& json, std::string_view key, T& value)
{
    const auto it{ json.find(std::string{ key }) };
    if (it == json.end())
    {
        return;
    }

    if constexpr (std::is_same_v<T, bool>)
    {
        if (it->is_boolean())
        {
            value = it->get<bool>();
            return;
        }
    }
    else if constexpr (std::is_unsigned_v<T>)
    {
        if (it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0))
        {
            value = it->get<T>();
            return;
        }
    }
    else if constexpr (std::is_integral_v<T>)
    {
        if (it->is_number_integer())
        {
            value = it->get<T>();
            return;
        }
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        if (it->is_number())
        {
            value = it->get<T>();
            return;
        }
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (it->is_string())
        {
            value = it->get<std::string>();
            return;
        }
    }
    else if constexpr (std::is_enum_v<T>)
    {
        if (it->is_string())
        {
            const auto& name{ it->get_ref<const std::string&>() };
            if (const auto parsed{ ParseEnumName<T>(name) })
            {
                value = parsed.value();
            }
            else
            {
                LogWarning("Ignoring unknown value {} for layout option {}", name, key);
            }
            return;
        }
    }

    LogWarning("Ignoring layout option {} of unexpected type {}", key, it->type_name());
}

static const nlohmann::json& SubObject(const nlohmann::json& json, std::string_view key)
{
    static const nlohmann::json c_Empty = nlohmann::json::object();
    const auto it{ json.find(std::string{ key }) };
    return it != json.end() && it->is_object() ? *it : c_Empty;
}

static SortKey ReadSortKey(const nlohmann::json& json, SortKey key)
{
    if (json.is_string())
    {
        key.m_Field = json.get<std::string>();
    }
    else if (json.is_object())
    {
        ReadValue(json, "field", key.m_Field);
        ReadValue(json, "direction", key.m_Direction);
    }
    return key;
}

static dla::ivec2 ReadPageSize(const nlohmann::json& json, dla::ivec2 page_size)
{
    if (json.is_string())
    {
        const auto& name{ json.get_ref<const std::string&>() };
        if (const auto resolved{ g_Cfg.ResolvePageSize(name) })
        {
            return resolved.value();
        }
        throw GenerationError{ fmt::format("Unknown page size {}", name) };
    }
    else if (json.is_object())
    {
        ReadValue(json, "width", page_size.x);
        ReadValue(json, "height", page_size.y);
    }
    return page_size;
}

static ManualPlacement ReadManualPlacement(const nlohmann::json& json)
{
    ManualPlacement placement{};
    ReadValue(json, "page", placement.m_PageIndex);
    ReadValue(json, "x", placement.m_Position.x);
    ReadValue(json, "y", placement.m_Position.y);
    if (json.contains("width") || json.contains("height"))
    {
        dla::ivec2 size{ 0, 0 };
        ReadValue(json, "width", size.x);
        ReadValue(json, "height", size.y);
        placement.m_Size = size;
    }
    return placement;
}

LayoutConfig LoadLayoutConfig(const nlohmann::json& json)
{
    LayoutConfig config{};
    if (!json.is_object())
    {
        throw GenerationError{ fmt::format("Layout configuration must be an object, got {}", json.type_name()) };
    }

    if (const auto mode{ json.find("mode") }; mode != json.end())
    {
        const std::string mode_name{ mode->is_string() ? mode->get<std::string>() : mode->dump() };
        const auto parsed_mode{ ParseEnumName<LayoutMode>(mode_name) };
        if (!parsed_mode.has_value())
        {
            throw GenerationError{ fmt::format("Unknown layout mode {}", mode_name) };
        }
        config.m_Mode = parsed_mode.value();
    }

    if (const auto page_size{ json.find("page_size") }; page_size != json.end())
    {
        config.m_PageSize = ReadPageSize(*page_size, config.m_PageSize);
    }
    else if (const auto default_size{ g_Cfg.ResolvePageSize(g_Cfg.m_DefaultPageSize) })
    {
        config.m_PageSize = default_size.value();
    }

    ReadValue(json, "margin", config.m_Margin);
    ReadValue(json, "spacing", config.m_Spacing);
    ReadValue(json, "margin_border", config.m_MarginBorder);

    {
        const auto& grid{ SubObject(json, "grid") };
        ReadValue(grid, "columns", config.m_GridColumns);
        ReadValue(grid, "rows", config.m_GridRows);
    }

    {
        const auto& masonry{ SubObject(json, "masonry") };
        ReadValue(masonry, "columns", config.m_MasonryColumns);
    }

    {
        const auto& scale{ SubObject(json, "scale") };
        ReadValue(scale, "mode", config.m_Scale.m_Mode);
        ReadValue(scale, "factor", config.m_Scale.m_Factor);
        ReadValue(scale, "target_images_per_page", config.m_Scale.m_TargetImagesPerPage);
        ReadValue(scale, "min_factor", config.m_Scale.m_MinFactor);
        ReadValue(scale, "max_factor", config.m_Scale.m_MaxFactor);
        ReadValue(scale, "tolerance", config.m_Scale.m_Tolerance);
    }

    {
        const auto& sort{ SubObject(json, "sort") };
        if (sort.contains("primary"))
        {
            config.m_Sort.m_Primary = ReadSortKey(sort["primary"], config.m_Sort.m_Primary);
        }
        if (sort.contains("secondary"))
        {
            config.m_Sort.m_Secondary = ReadSortKey(sort["secondary"], config.m_Sort.m_Secondary);
        }
        if (sort.contains("random_seed") && sort["random_seed"].is_number_integer())
        {
            config.m_Sort.m_RandomSeed = sort["random_seed"].get<uint64_t>();
        }
    }

    {
        const auto& page_break{ SubObject(json, "page_break") };
        ReadValue(page_break, "enabled", config.m_PageBreak.m_Enabled);
        ReadValue(page_break, "kind", config.m_PageBreak.m_Kind);
        ReadValue(page_break, "divider_thickness", config.m_PageBreak.m_DividerThickness);
        ReadValue(page_break, "divider_width", config.m_PageBreak.m_DividerWidth);
    }

    {
        const auto& caption{ SubObject(json, "caption") };
        ReadValue(caption, "enabled", config.m_Caption.m_Enabled);
        ReadValue(caption, "font_size", config.m_Caption.m_FontSize);
        ReadValue(caption, "padding", config.m_Caption.m_Padding);
        ReadValue(caption, "hide_field_names", config.m_Caption.m_HideFieldNames);
        ReadValue(caption, "remove_extension", config.m_Caption.m_RemoveExtension);
        if (caption.contains("fields") && caption["fields"].is_array())
        {
            for (const nlohmann::json& field : caption["fields"])
            {
                if (field.is_string())
                {
                    config.m_Caption.m_Fields.push_back(field.get<std::string>());
                }
            }
        }
    }

    {
        const auto& scale_bar{ SubObject(json, "scale_bar") };
        ReadValue(scale_bar, "enabled", config.m_ScaleBar.m_Enabled);
        ReadValue(scale_bar, "length_cm", config.m_ScaleBar.m_LengthCm);
        ReadValue(scale_bar, "pixels_per_cm", config.m_ScaleBar.m_PixelsPerCm);
    }

    {
        const auto& numbering{ SubObject(json, "numbering") };
        ReadValue(numbering, "enabled", config.m_Numbering.m_Enabled);
        ReadValue(numbering, "start_number", config.m_Numbering.m_StartNumber);
        ReadValue(numbering, "position", config.m_Numbering.m_Position);
        ReadValue(numbering, "prefix", config.m_Numbering.m_Prefix);
        ReadValue(numbering, "font_size", config.m_Numbering.m_FontSize);
        ReadValue(numbering, "scope", config.m_Numbering.m_Scope);
    }

    for (const auto& [name, placement] : SubObject(json, "manual_placements").items())
    {
        if (placement.is_object())
        {
            config.m_ManualPlacements[name] = ReadManualPlacement(placement);
        }
    }

    return config;
}

LayoutConfig LoadLayoutConfig(const fs::path& json_path)
{
    std::ifstream file{ json_path };
    if (!file.is_open())
    {
        throw GenerationError{ fmt::format("Could not open layout file {}", json_path.string()) };
    }

    try
    {
        return LoadLayoutConfig(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::exception& e)
    {
        throw GenerationError{ fmt::format("Malformed layout file {}: {}", json_path.string(), e.what()) };
    }
}

static nlohmann::json DumpSortKey(const SortKey& key)
{
    return nlohmann::json{
        { "field", key.m_Field },
        { "direction", EnumConfigName(key.m_Direction) },
    };
}

nlohmann::json DumpLayoutConfig(const LayoutConfig& config)
{
    nlohmann::json json{
        { "mode", EnumConfigName(config.m_Mode) },
        { "page_size", { { "width", config.m_PageSize.x }, { "height", config.m_PageSize.y } } },
        { "margin", config.m_Margin },
        { "spacing", config.m_Spacing },
        { "margin_border", config.m_MarginBorder },
        { "grid", { { "columns", config.m_GridColumns }, { "rows", config.m_GridRows } } },
        { "masonry", { { "columns", config.m_MasonryColumns } } },
        {
            "scale",
            {
                { "mode", EnumConfigName(config.m_Scale.m_Mode) },
                { "factor", config.m_Scale.m_Factor },
                { "target_images_per_page", config.m_Scale.m_TargetImagesPerPage },
                { "min_factor", config.m_Scale.m_MinFactor },
                { "max_factor", config.m_Scale.m_MaxFactor },
                { "tolerance", config.m_Scale.m_Tolerance },
            },
        },
        {
            "page_break",
            {
                { "enabled", config.m_PageBreak.m_Enabled },
                { "kind", EnumConfigName(config.m_PageBreak.m_Kind) },
                { "divider_thickness", config.m_PageBreak.m_DividerThickness },
                { "divider_width", config.m_PageBreak.m_DividerWidth },
            },
        },
        {
            "caption",
            {
                { "enabled", config.m_Caption.m_Enabled },
                { "font_size", config.m_Caption.m_FontSize },
                { "padding", config.m_Caption.m_Padding },
                { "fields", config.m_Caption.m_Fields },
                { "hide_field_names", config.m_Caption.m_HideFieldNames },
                { "remove_extension", config.m_Caption.m_RemoveExtension },
            },
        },
        {
            "scale_bar",
            {
                { "enabled", config.m_ScaleBar.m_Enabled },
                { "length_cm", config.m_ScaleBar.m_LengthCm },
                { "pixels_per_cm", config.m_ScaleBar.m_PixelsPerCm },
            },
        },
        {
            "numbering",
            {
                { "enabled", config.m_Numbering.m_Enabled },
                { "start_number", config.m_Numbering.m_StartNumber },
                { "position", EnumConfigName(config.m_Numbering.m_Position) },
                { "prefix", config.m_Numbering.m_Prefix },
                { "font_size", config.m_Numbering.m_FontSize },
                { "scope", EnumConfigName(config.m_Numbering.m_Scope) },
            },
        },
    };

    json["sort"] = nlohmann::json{
        { "primary", DumpSortKey(config.m_Sort.m_Primary) },
        { "secondary", DumpSortKey(config.m_Sort.m_Secondary) },
    };
    if (config.m_Sort.m_RandomSeed.has_value())
    {
        json["sort"]["random_seed"] = config.m_Sort.m_RandomSeed.value();
    }

    nlohmann::json& manual_placements{ json["manual_placements"] = nlohmann::json::object() };
    for (const auto& [name, placement] : config.m_ManualPlacements)
    {
        nlohmann::json& placement_json{ manual_placements[name] = nlohmann::json{
                                            { "page", placement.m_PageIndex },
                                            { "x", placement.m_Position.x },
                                            { "y", placement.m_Position.y },
                                        } };
        if (placement.m_Size.has_value())
        {
            placement_json["width"] = placement.m_Size->x;
            placement_json["height"] = placement.m_Size->y;
        }
    }

    return json;
}
