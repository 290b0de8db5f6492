#include <plm/layout/placement.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include <plm/layout/grid_placement.hpp>
#include <plm/layout/manual_placement.hpp>
#include <plm/layout/masonry_placement.hpp>
#include <plm/layout/puzzle_placement.hpp>

std::unique_ptr<PlacementStrategy> CreatePlacementStrategy(LayoutMode mode)
{
    switch (mode)
    {
    case LayoutMode::Grid:
        return std::make_unique<GridPlacement>();
    case LayoutMode::Puzzle:
        return std::make_unique<PuzzlePlacement>();
    case LayoutMode::Masonry:
        return std::make_unique<MasonryPlacement>();
    case LayoutMode::Manual:
        return std::make_unique<ManualPlacementStrategy>();
    }
    std::unreachable();
}

std::optional<Footprint> FitFootprint(dla::ivec2 image_size, const CaptionBlock& caption, dla::ivec2 available)
{
    const int32_t max_image_height{ available.y - caption.m_Size.y };
    if (available.x < 1 || max_image_height < 1 || image_size.x < 1 || image_size.y < 1)
    {
        return std::nullopt;
    }

    Footprint footprint{
        .m_ImageSize{ image_size },
        .m_Size{},
        .m_Shrunk = false,
    };
    if (image_size.x > available.x || image_size.y > max_image_height)
    {
        const float factor{
            std::min(static_cast<float>(available.x) / static_cast<float>(image_size.x),
                     static_cast<float>(max_image_height) / static_cast<float>(image_size.y))
        };
        footprint.m_ImageSize = dla::ivec2{
            std::clamp(static_cast<int32_t>(std::floor(static_cast<float>(image_size.x) * factor)), 1, available.x),
            std::clamp(static_cast<int32_t>(std::floor(static_cast<float>(image_size.y) * factor)), 1, max_image_height),
        };
        footprint.m_Shrunk = true;
    }

    // Captions wider than the available space overflow instead of pushing the layout
    footprint.m_Size = dla::ivec2{
        std::max(footprint.m_ImageSize.x, std::min(caption.m_Size.x, available.x)),
        footprint.m_ImageSize.y + caption.m_Size.y,
    };
    return footprint;
}

PlacedImage MakePlacedImage(const PlacementItem& item, const Footprint& footprint, dla::ivec2 position)
{
    const dla::ivec2 image_position{
        position.x + (footprint.m_Size.x - footprint.m_ImageSize.x) / 2,
        position.y,
    };
    return PlacedImage{
        .m_Item = item.m_Item,
        .m_Image{ image_position, footprint.m_ImageSize },
        .m_Footprint{ position, footprint.m_Size },
        .m_Caption{ item.m_Caption },
        .m_PageIndex = 0,
        .m_Shrunk = footprint.m_Shrunk,
    };
}

GenerationFailure MakeOversizedFailure(const PlacementItem& item, dla::ivec2 available)
{
    return GenerationFailure{
        .m_Kind = FailureKind::OversizedImage,
        .m_ImageName{ item.m_Item->m_Name },
        .m_Message{
            fmt::format("Image {} with its caption does not fit into {}x{} pixels, it was dropped",
                        item.m_Item->m_Name,
                        available.x,
                        available.y),
        },
    };
}
