#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <dla/vector.h>

#include <plm/util.hpp>

struct MetadataField
{
    std::string m_Name;
    std::string m_Value;

    bool operator==(const MetadataField&) const = default;
};
using MetadataFields = std::vector<MetadataField>;

/*
        One photograph as handed to the engine, the engine never mutates it
*/
struct ImageItem
{
    std::string m_Name;
    fs::path m_Source;
    dla::ivec2 m_Size;
    MetadataFields m_Metadata;

    // Returns nullptr when the field is missing
    const std::string* FindField(std::string_view field_name) const;
};

struct PixelRect
{
    dla::ivec2 m_Position;
    dla::ivec2 m_Size;

    int32_t Left() const
    {
        return m_Position.x;
    }
    int32_t Top() const
    {
        return m_Position.y;
    }
    int32_t Right() const
    {
        return m_Position.x + m_Size.x;
    }
    int32_t Bottom() const
    {
        return m_Position.y + m_Size.y;
    }

    bool Intersects(const PixelRect& rhs) const;
    bool Contains(const PixelRect& rhs) const;
    PixelRect Translated(dla::ivec2 offset) const;

    bool operator==(const PixelRect&) const = default;
};

struct CaptionBlock
{
    std::vector<std::string> m_Lines;
    std::vector<dla::ivec2> m_LineSizes;
    dla::ivec2 m_Size{ 0, 0 };

    bool operator==(const CaptionBlock&) const = default;
};

/*
        A single image after placement, positions are local to the page content box.
        The footprint is the image together with its caption block and is what the
        placement strategies keep apart.
*/
struct PlacedImage
{
    const ImageItem* m_Item;
    PixelRect m_Image;
    PixelRect m_Footprint;
    CaptionBlock m_Caption;
    uint32_t m_PageIndex;
    // Drawn smaller than the page scale to fit its cell or column
    bool m_Shrunk{ false };

    bool operator==(const PlacedImage&) const = default;
};

struct LineOverlay
{
    PixelRect m_Bounds;

    bool operator==(const LineOverlay&) const = default;
};

struct BorderOverlay
{
    PixelRect m_Bounds;
    int32_t m_Thickness;

    bool operator==(const BorderOverlay&) const = default;
};

enum class TextAlignment
{
    Left,
    Center,
    Right,
};

struct TextOverlay
{
    std::string m_Text;
    PixelRect m_Bounds;
    int32_t m_FontSize;
    TextAlignment m_Alignment{ TextAlignment::Center };
    bool m_Bold{ false };

    bool operator==(const TextOverlay&) const = default;
};

struct ScaleBarOverlay
{
    PixelRect m_Bar;
    uint32_t m_Segments;
    TextOverlay m_StartLabel;
    TextOverlay m_EndLabel;

    bool operator==(const ScaleBarOverlay&) const = default;
};

/*
        Overlay positions are in page coordinates, including the margin
*/
struct PageOverlays
{
    std::optional<BorderOverlay> m_Border;
    std::vector<LineOverlay> m_Dividers;
    std::vector<TextOverlay> m_Captions;
    std::optional<ScaleBarOverlay> m_ScaleBar;
    std::vector<TextOverlay> m_Numbers;

    bool operator==(const PageOverlays&) const = default;
};

struct Page
{
    uint32_t m_Index;
    dla::ivec2 m_Size;
    dla::ivec2 m_ContentOrigin;
    std::vector<PlacedImage> m_Images;
    PageOverlays m_Overlays;

    bool operator==(const Page&) const = default;
};
