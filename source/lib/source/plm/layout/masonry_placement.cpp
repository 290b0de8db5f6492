#include <plm/layout/masonry_placement.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

#include <fmt/format.h>

#include <plm/layout/paginator.hpp>
#include <plm/layout/scale.hpp>

PlacementResult MasonryPlacement::Place(std::span<const PlacementItem> items,
                                        const LayoutConfig& config,
                                        Paginator& paginator) const
{
    const int32_t columns{ static_cast<int32_t>(config.m_MasonryColumns) };
    const int32_t spacing{ config.m_Spacing };
    const dla::ivec2 content_size{ config.ContentSize() };
    const int32_t column_width{ (content_size.x - (columns - 1) * spacing) / columns };
    if (column_width < 1)
    {
        throw GenerationError{
            fmt::format("{} masonry columns with spacing {} leave no room in content of width {}",
                        columns,
                        spacing,
                        content_size.x),
        };
    }

    PlacementResult result{};
    PlacedPage page{};

    // Next free y per column, already including the spacing after the last image
    std::vector<int32_t> column_heights(columns, 0);

    const auto close_page{
        [&]()
        {
            paginator.ClosePage(std::move(page));
            page = {};
            std::ranges::fill(column_heights, 0);
        }
    };

    for (size_t i = 0; i < items.size(); ++i)
    {
        if (paginator.Done())
        {
            break;
        }

        switch (paginator.BoundaryBefore(items, i))
        {
        case PageBoundary::NewPage:
            close_page();
            break;
        case PageBoundary::Divider:
            if (!page.m_Images.empty())
            {
                const int32_t top{ std::ranges::max(column_heights) };
                const int32_t next_top{ top + paginator.DividerAdvance(spacing) };
                if (next_top >= content_size.y)
                {
                    close_page();
                }
                else
                {
                    page.m_Dividers.push_back(paginator.MakeDivider(top, content_size.x));
                    std::ranges::fill(column_heights, next_top);
                }
            }
            break;
        case PageBoundary::None:
            break;
        }

        const PlacementItem& item{ items[i] };
        const dla::ivec2 column_size{ column_width, content_size.y };
        const double column_height{
            std::round(static_cast<double>(item.m_ImageSize.y) * column_width / item.m_ImageSize.x)
        };
        const dla::ivec2 scaled_size{
            column_width,
            static_cast<int32_t>(std::clamp(column_height, 1.0, static_cast<double>(c_MaxScaledSide))),
        };
        const auto footprint{ FitFootprint(scaled_size, item.m_Caption, column_size) };
        if (!footprint.has_value())
        {
            result.m_Failures.push_back(MakeOversizedFailure(item, column_size));
            continue;
        }

        // The shortest column is the only candidate, if it has no room no column has
        auto shortest{ std::ranges::min_element(column_heights) };
        if (*shortest + footprint->m_Size.y > content_size.y)
        {
            close_page();
            if (paginator.Done())
            {
                break;
            }
            shortest = column_heights.begin();
        }

        const int32_t column{ static_cast<int32_t>(shortest - column_heights.begin()) };
        const dla::ivec2 position{
            column * (column_width + spacing) + (column_width - footprint->m_Size.x) / 2,
            *shortest,
        };
        page.m_Images.push_back(MakePlacedImage(item, footprint.value(), position));
        *shortest += footprint->m_Size.y + spacing;
    }
    close_page();

    result.m_Pages = paginator.TakePages();
    return result;
}
