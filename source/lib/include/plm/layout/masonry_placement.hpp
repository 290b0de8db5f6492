#pragma once

#include <plm/layout/placement.hpp>

/*
        Equal width columns, every image is scaled to the column width and appended
        to the currently shortest column
*/
class MasonryPlacement final : public PlacementStrategy
{
  public:
    virtual PlacementResult Place(std::span<const PlacementItem> items,
                                  const LayoutConfig& config,
                                  Paginator& paginator) const override;
};
