#pragma once

#include <plm/layout/placement.hpp>

/*
        Fixed rows and columns of equally sized cells, every footprint is shrunk to fit
        its cell and centered within it. Incomplete rows are centered horizontally.
*/
class GridPlacement final : public PlacementStrategy
{
  public:
    virtual PlacementResult Place(std::span<const PlacementItem> items,
                                  const LayoutConfig& config,
                                  Paginator& paginator) const override;
};
