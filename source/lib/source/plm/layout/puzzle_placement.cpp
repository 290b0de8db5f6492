#include <plm/layout/puzzle_placement.hpp>

#include <algorithm>
#include <functional>
#include <limits>
#include <vector>

#include <plm/layout/paginator.hpp>

namespace
{
class FreeRectPacker
{
  public:
    FreeRectPacker(dla::ivec2 bin_size)
        : m_BinSize{ bin_size }
    {
        Reset(0);
    }

    // Starts a new section below top, everything above is treated as used
    void Reset(int32_t top)
    {
        m_FreeRects.clear();
        if (top < m_BinSize.y)
        {
            m_FreeRects.push_back(PixelRect{ { 0, top }, { m_BinSize.x, m_BinSize.y - top } });
        }
    }

    std::optional<dla::ivec2> Insert(dla::ivec2 size)
    {
        const PixelRect* best{ nullptr };
        int64_t best_area_fit{ std::numeric_limits<int64_t>::max() };
        for (const PixelRect& free_rect : m_FreeRects)
        {
            if (size.x > free_rect.m_Size.x || size.y > free_rect.m_Size.y)
            {
                continue;
            }

            const int64_t area_fit{
                static_cast<int64_t>(free_rect.m_Size.x) * free_rect.m_Size.y -
                static_cast<int64_t>(size.x) * size.y
            };
            const bool better{
                best == nullptr ||
                area_fit < best_area_fit ||
                (area_fit == best_area_fit && free_rect.Top() < best->Top()) ||
                (area_fit == best_area_fit && free_rect.Top() == best->Top() && free_rect.Left() < best->Left())
            };
            if (better)
            {
                best = &free_rect;
                best_area_fit = area_fit;
            }
        }

        if (best == nullptr)
        {
            return std::nullopt;
        }

        const PixelRect used{ best->m_Position, size };
        Split(used);
        Prune();
        return used.m_Position;
    }

  private:
    void Split(const PixelRect& used)
    {
        std::vector<PixelRect> next_free;
        next_free.reserve(m_FreeRects.size() * 2);
        for (const PixelRect& free_rect : m_FreeRects)
        {
            if (!free_rect.Intersects(used))
            {
                next_free.push_back(free_rect);
                continue;
            }

            if (used.Left() > free_rect.Left())
            {
                next_free.push_back(PixelRect{
                    free_rect.m_Position,
                    { used.Left() - free_rect.Left(), free_rect.m_Size.y },
                });
            }
            if (used.Right() < free_rect.Right())
            {
                next_free.push_back(PixelRect{
                    { used.Right(), free_rect.Top() },
                    { free_rect.Right() - used.Right(), free_rect.m_Size.y },
                });
            }
            if (used.Top() > free_rect.Top())
            {
                next_free.push_back(PixelRect{
                    free_rect.m_Position,
                    { free_rect.m_Size.x, used.Top() - free_rect.Top() },
                });
            }
            if (used.Bottom() < free_rect.Bottom())
            {
                next_free.push_back(PixelRect{
                    { free_rect.Left(), used.Bottom() },
                    { free_rect.m_Size.x, free_rect.Bottom() - used.Bottom() },
                });
            }
        }
        m_FreeRects = std::move(next_free);
    }

    // Drops free rects that are fully contained in another one
    void Prune()
    {
        size_t i{ 0 };
        while (i < m_FreeRects.size())
        {
            bool removed_i{ false };
            size_t j{ i + 1 };
            while (j < m_FreeRects.size())
            {
                if (m_FreeRects[i].Contains(m_FreeRects[j]))
                {
                    m_FreeRects.erase(m_FreeRects.begin() + static_cast<std::ptrdiff_t>(j));
                    continue;
                }
                if (m_FreeRects[j].Contains(m_FreeRects[i]))
                {
                    m_FreeRects.erase(m_FreeRects.begin() + static_cast<std::ptrdiff_t>(i));
                    removed_i = true;
                    break;
                }
                ++j;
            }
            if (!removed_i)
            {
                ++i;
            }
        }
    }

    dla::ivec2 m_BinSize;
    std::vector<PixelRect> m_FreeRects;
};

struct PuzzleCandidate
{
    const PlacementItem* m_Item;
    Footprint m_Footprint;
};
} // namespace

PlacementResult PuzzlePlacement::Place(std::span<const PlacementItem> items,
                                       const LayoutConfig& config,
                                       Paginator& paginator) const
{
    const int32_t spacing{ config.m_Spacing };
    const dla::ivec2 content_size{ config.ContentSize() };

    // Every rect carries the spacing on its right and bottom, the bin grows by the same amount
    FreeRectPacker packer{ dla::ivec2{ content_size.x + spacing, content_size.y + spacing } };

    PlacementResult result{};
    PlacedPage page{};

    // Top of the current section, sections are only started by dividers
    int32_t section_top{ 0 };

    const auto close_page{
        [&]()
        {
            paginator.ClosePage(std::move(page));
            page = {};
            section_top = 0;
            packer.Reset(0);
        }
    };
    const auto start_section{
        [&]()
        {
            if (page.m_Images.empty())
            {
                return;
            }

            const auto lowest{ std::ranges::max(page.m_Images, {}, [](const PlacedImage& image)
                                                { return image.m_Footprint.Bottom(); }) };
            const int32_t divider_top{ lowest.m_Footprint.Bottom() + spacing };
            const int32_t next_top{ divider_top + paginator.DividerAdvance(spacing) };
            if (next_top >= content_size.y)
            {
                close_page();
                return;
            }

            page.m_Dividers.push_back(paginator.MakeDivider(divider_top, content_size.x));
            section_top = next_top;
            packer.Reset(section_top);
        }
    };

    size_t segment_begin{ 0 };
    while (segment_begin < items.size() && !paginator.Done())
    {
        switch (paginator.BoundaryBefore(items, segment_begin))
        {
        case PageBoundary::NewPage:
            close_page();
            break;
        case PageBoundary::Divider:
            start_section();
            break;
        case PageBoundary::None:
            break;
        }

        size_t segment_end{ segment_begin + 1 };
        while (segment_end < items.size() && paginator.BoundaryBefore(items, segment_end) == PageBoundary::None)
        {
            ++segment_end;
        }

        std::vector<PuzzleCandidate> batch;
        for (const PlacementItem& item : items.subspan(segment_begin, segment_end - segment_begin))
        {
            // Packing has no cells to shrink into, images larger than the page are dropped
            auto footprint{ FitFootprint(item.m_ImageSize, item.m_Caption, content_size) };
            if (!footprint.has_value() || footprint->m_Shrunk)
            {
                result.m_Failures.push_back(MakeOversizedFailure(item, content_size));
                continue;
            }
            batch.push_back(PuzzleCandidate{ &item, footprint.value() });
        }
        std::ranges::stable_sort(batch,
                                 std::greater{},
                                 [](const PuzzleCandidate& candidate)
                                 {
                                     const dla::ivec2 size{ candidate.m_Footprint.m_Size };
                                     return static_cast<int64_t>(size.x) * size.y;
                                 });

        for (const PuzzleCandidate& candidate : batch)
        {
            if (paginator.Done())
            {
                break;
            }

            const dla::ivec2 padded_size{
                candidate.m_Footprint.m_Size.x + spacing,
                candidate.m_Footprint.m_Size.y + spacing,
            };
            auto position{ packer.Insert(padded_size) };
            if (!position.has_value())
            {
                close_page();
                if (paginator.Done())
                {
                    break;
                }
                position = packer.Insert(padded_size);
            }

            if (!position.has_value())
            {
                result.m_Failures.push_back(MakeOversizedFailure(*candidate.m_Item, content_size));
                continue;
            }
            page.m_Images.push_back(MakePlacedImage(*candidate.m_Item, candidate.m_Footprint, position.value()));
        }

        segment_begin = segment_end;
    }
    close_page();

    result.m_Pages = paginator.TakePages();
    return result;
}
