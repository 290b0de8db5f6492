#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <plm/layout/layout_config.hpp>
#include <plm/layout/placement.hpp>

enum class PageBoundary
{
    None,
    NewPage,
    Divider,
};

/*
        Collects the pages a strategy closes and decides the boundaries a strategy can't know about,
        i.e. breaks between primary sort groups and an optional limit on the number of pages.
*/
class Paginator
{
  public:
    Paginator(const PageBreakSpec& spec, std::optional<uint32_t> max_pages = std::nullopt);

    PageBoundary BoundaryBefore(std::span<const PlacementItem> items, size_t index) const;

    // Empty pages are skipped unless forced
    void ClosePage(PlacedPage page, bool force = false);

    // True once the page limit is reached, strategies stop placing then
    bool Done() const;

    /*
            The vertical room a divider takes when placed at the top of the next content,
            content after the divider starts at top + DividerAdvance
    */
    int32_t DividerAdvance(int32_t spacing) const;
    int32_t DividerThickness() const;
    PixelRect MakeDivider(int32_t top, int32_t content_width) const;

    std::vector<PlacedPage> TakePages();

  private:
    PageBreakSpec m_Spec;
    std::optional<uint32_t> m_MaxPages;
    std::vector<PlacedPage> m_Pages;
};
