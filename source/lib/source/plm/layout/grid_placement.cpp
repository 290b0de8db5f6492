#include <plm/layout/grid_placement.hpp>

#include <fmt/format.h>

#include <plm/layout/paginator.hpp>
#include <plm/util/log.hpp>

PlacementResult GridPlacement::Place(std::span<const PlacementItem> items,
                                     const LayoutConfig& config,
                                     Paginator& paginator) const
{
    const int32_t columns{ static_cast<int32_t>(config.m_GridColumns) };
    const int32_t rows{ static_cast<int32_t>(config.m_GridRows) };
    const int32_t spacing{ config.m_Spacing };
    const dla::ivec2 content_size{ config.ContentSize() };
    const dla::ivec2 cell_size{
        (content_size.x - (columns - 1) * spacing) / columns,
        (content_size.y - (rows - 1) * spacing) / rows,
    };
    if (cell_size.x < 1 || cell_size.y < 1)
    {
        throw GenerationError{
            fmt::format("Grid of {}x{} with spacing {} leaves no room for cells in content of size {}x{}",
                        columns,
                        rows,
                        spacing,
                        content_size.x,
                        content_size.y),
        };
    }

    PlacementResult result{};
    PlacedPage page{};
    std::vector<PlacedImage> row_images{};
    int32_t row{ 0 };
    int32_t column{ 0 };

    const auto row_top{
        [&](int32_t r)
        {
            return r * (cell_size.y + spacing);
        }
    };
    const auto flush_row{
        [&]()
        {
            const int32_t row_count{ static_cast<int32_t>(row_images.size()) };
            if (row_count > 0 && row_count < columns)
            {
                const int32_t row_width{ row_count * cell_size.x + (row_count - 1) * spacing };
                const dla::ivec2 offset{ (content_size.x - row_width) / 2, 0 };
                for (PlacedImage& image : row_images)
                {
                    image.m_Image = image.m_Image.Translated(offset);
                    image.m_Footprint = image.m_Footprint.Translated(offset);
                }
            }
            page.m_Images.insert(page.m_Images.end(), row_images.begin(), row_images.end());
            row_images.clear();
        }
    };
    const auto close_page{
        [&]()
        {
            flush_row();
            paginator.ClosePage(std::move(page));
            page = {};
            row = 0;
            column = 0;
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
            if (column > 0)
            {
                flush_row();
                column = 0;
                ++row;
            }
            if (row >= rows)
            {
                close_page();
            }
            else if (row > 0)
            {
                const int32_t gap_center{ row_top(row) - spacing / 2 };
                page.m_Dividers.push_back(paginator.MakeDivider(gap_center - paginator.DividerThickness() / 2,
                                                                content_size.x));
            }
            break;
        case PageBoundary::None:
            break;
        }

        const PlacementItem& item{ items[i] };
        const auto footprint{ FitFootprint(item.m_ImageSize, item.m_Caption, cell_size) };
        if (!footprint.has_value())
        {
            result.m_Failures.push_back(MakeOversizedFailure(item, cell_size));
            continue;
        }

        const dla::ivec2 position{
            column * (cell_size.x + spacing) + (cell_size.x - footprint->m_Size.x) / 2,
            row_top(row) + (cell_size.y - footprint->m_Size.y) / 2,
        };
        row_images.push_back(MakePlacedImage(item, footprint.value(), position));
        if (footprint->m_Shrunk)
        {
            LogDebug("Shrunk image {} to {}x{} to fit its grid cell",
                     item.m_Item->m_Name,
                     footprint->m_ImageSize.x,
                     footprint->m_ImageSize.y);
        }

        ++column;
        if (column == columns)
        {
            flush_row();
            column = 0;
            ++row;
            if (row == rows)
            {
                close_page();
            }
        }
    }
    close_page();

    result.m_Pages = paginator.TakePages();
    return result;
}
