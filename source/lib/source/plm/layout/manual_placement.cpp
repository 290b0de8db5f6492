#include <plm/layout/manual_placement.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <plm/layout/paginator.hpp>

PlacementResult ManualPlacementStrategy::Place(std::span<const PlacementItem> items,
                                               const LayoutConfig& config,
                                               Paginator& paginator) const
{
    PlacementResult result{};
    std::vector<PlacedPage> pages{};

    for (const PlacementItem& item : items)
    {
        const std::string& name{ item.m_Item->m_Name };
        const auto it{ config.m_ManualPlacements.find(name) };
        if (it == config.m_ManualPlacements.end())
        {
            result.m_Failures.push_back(GenerationFailure{
                .m_Kind = FailureKind::MissingManualPlacement,
                .m_ImageName{ name },
                .m_Message{ fmt::format("No manual placement given for image {}", name) },
            });
            continue;
        }

        const ManualPlacement& placement{ it->second };
        const size_t page_index{ placement.m_PageIndex };
        if (page_index >= items.size())
        {
            // A manual layout never has more pages than images
            result.m_Failures.push_back(GenerationFailure{
                .m_Kind = FailureKind::InvalidManualPlacement,
                .m_ImageName{ name },
                .m_Message{
                    fmt::format("Manual placement for image {} names page {} but there are only {} images",
                                name,
                                page_index,
                                items.size()),
                },
            });
            continue;
        }

        const dla::ivec2 image_size{ placement.m_Size.value_or(item.m_ImageSize) };
        if (image_size.x <= 0 || image_size.y <= 0)
        {
            result.m_Failures.push_back(GenerationFailure{
                .m_Kind = FailureKind::InvalidManualPlacement,
                .m_ImageName{ name },
                .m_Message{
                    fmt::format("Manual placement for image {} has invalid size {}x{}", name, image_size.x, image_size.y),
                },
            });
            continue;
        }

        const Footprint footprint{
            .m_ImageSize{ image_size },
            .m_Size{
                std::max(image_size.x, item.m_Caption.m_Size.x),
                image_size.y + item.m_Caption.m_Size.y,
            },
            .m_Shrunk = false,
        };
        const dla::ivec2 footprint_position{
            placement.m_Position.x - (footprint.m_Size.x - image_size.x) / 2,
            placement.m_Position.y,
        };

        if (page_index >= pages.size())
        {
            pages.resize(page_index + 1);
        }
        pages[page_index].m_Images.push_back(MakePlacedImage(item, footprint, footprint_position));
    }

    // Pages without images in between stay so that page indices match the configuration
    for (PlacedPage& page : pages)
    {
        paginator.ClosePage(std::move(page), true);
    }

    result.m_Pages = paginator.TakePages();
    return result;
}
