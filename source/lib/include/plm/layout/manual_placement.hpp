#pragma once

#include <plm/layout/placement.hpp>

/*
        Takes page and position of every image from the layout configuration as they are,
        there is no check for overlaps or images leaving the content box
*/
class ManualPlacementStrategy final : public PlacementStrategy
{
  public:
    virtual PlacementResult Place(std::span<const PlacementItem> items,
                                  const LayoutConfig& config,
                                  Paginator& paginator) const override;
};
