#pragma once

#include <plm/layout/placement.hpp>

/*
        Dense packing via maximal free rectangles, larger images are placed first
        and each image goes to the free rectangle that wastes the least area
*/
class PuzzlePlacement final : public PlacementStrategy
{
  public:
    virtual PlacementResult Place(std::span<const PlacementItem> items,
                                  const LayoutConfig& config,
                                  Paginator& paginator) const override;
};
