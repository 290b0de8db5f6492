#pragma once

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <plm/layout/errors.hpp>
#include <plm/layout/layout_config.hpp>
#include <plm/layout/types.hpp>

class Paginator;

/*
        An image ready for placement, sized at the resolved scale with its caption measured
*/
struct PlacementItem
{
    const ImageItem* m_Item;
    dla::ivec2 m_ImageSize;
    CaptionBlock m_Caption;
    std::optional<std::string> m_GroupKey;
};

struct PlacedPage
{
    std::vector<PlacedImage> m_Images;
    // Content-box coordinates, same as the images
    std::vector<PixelRect> m_Dividers;
};

struct PlacementResult
{
    std::vector<PlacedPage> m_Pages;
    GenerationFailures m_Failures;
};

class PlacementStrategy
{
  public:
    virtual ~PlacementStrategy() = default;

    /*
            Places all items in order, page closing goes through the paginator so that
            breaks between groups and page limits apply to every strategy alike
    */
    virtual PlacementResult Place(std::span<const PlacementItem> items,
                                  const LayoutConfig& config,
                                  Paginator& paginator) const = 0;
};

std::unique_ptr<PlacementStrategy> CreatePlacementStrategy(LayoutMode mode);

/*
        Image and caption sizes after fitting into the available space, preserving the
        image aspect ratio, returns std::nullopt when not even a single pixel of the image fits
*/
struct Footprint
{
    dla::ivec2 m_ImageSize;
    dla::ivec2 m_Size;
    bool m_Shrunk;
};
std::optional<Footprint> FitFootprint(dla::ivec2 image_size, const CaptionBlock& caption, dla::ivec2 available);

/*
        Lays out a footprint at the given position, the image is centered horizontally
        with the caption directly below it
*/
PlacedImage MakePlacedImage(const PlacementItem& item, const Footprint& footprint, dla::ivec2 position);

GenerationFailure MakeOversizedFailure(const PlacementItem& item, dla::ivec2 available);
