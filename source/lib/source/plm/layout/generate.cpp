#include <plm/layout/generate.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <plm/layout/annotations.hpp>
#include <plm/layout/paginator.hpp>
#include <plm/layout/placement.hpp>
#include <plm/layout/scale.hpp>
#include <plm/layout/sort.hpp>
#include <plm/util/log.hpp>

namespace
{
struct LayoutRun
{
    std::vector<Page> m_Pages;
    GenerationFailures m_Failures;
    ScaleReport m_Scale;
};

// Items with captions and group keys but still at their intrinsic size
std::vector<PlacementItem> PreparePlacementItems(std::span<const ImageItem> images,
                                                 const LayoutConfig& config,
                                                 const TextMeasurer& measurer)
{
    std::vector<PlacementItem> items;
    items.reserve(images.size());
    for (const ImageItem* image : SortImages(images, config.m_Sort))
    {
        items.push_back(PlacementItem{
            .m_Item = image,
            .m_ImageSize{ image->m_Size },
            .m_Caption{ BuildCaption(*image, config.m_Caption, measurer) },
            .m_GroupKey{ PrimaryGroupKey(*image, config.m_Sort) },
        });
    }
    return items;
}

// Images too large to scale to whole pixels are dropped as oversized
std::vector<PlacementItem> ApplyScale(std::span<const PlacementItem> items, float factor, GenerationFailures& failures)
{
    std::vector<PlacementItem> scaled_items;
    scaled_items.reserve(items.size());
    for (PlacementItem item : items)
    {
        const auto scaled_size{ ScaledSize(item.m_Item->m_Size, factor) };
        if (!scaled_size.has_value())
        {
            failures.push_back(GenerationFailure{
                .m_Kind = FailureKind::OversizedImage,
                .m_ImageName{ item.m_Item->m_Name },
                .m_Message{
                    fmt::format("Image {} of size {}x{} exceeds {} pixels at scale {}, it was dropped",
                                item.m_Item->m_Name,
                                item.m_Item->m_Size.x,
                                item.m_Item->m_Size.y,
                                c_MaxScaledSide,
                                factor),
                },
            });
            continue;
        }
        item.m_ImageSize = scaled_size.value();
        scaled_items.push_back(std::move(item));
    }
    return scaled_items;
}

ScaleReport ResolveScale(std::span<const PlacementItem> items,
                         const LayoutConfig& config,
                         const PlacementStrategy& strategy,
                         GenerationFailures& failures)
{
    const ScaleSpec& spec{ config.m_Scale };
    if (spec.m_Mode == ScaleMode::Fixed)
    {
        return ScaleReport{
            .m_Factor = spec.m_Factor,
        };
    }

    // Every candidate is laid out from scratch, nothing leaks between dry runs
    const auto count_first_page{
        [&](float factor) -> uint32_t
        {
            GenerationFailures dry_run_failures{};
            const auto scaled_items{ ApplyScale(items, factor, dry_run_failures) };
            Paginator dry_run{ config.m_PageBreak, 1 };
            const PlacementResult result{ strategy.Place(scaled_items, config, dry_run) };
            if (result.m_Pages.empty())
            {
                return 0u;
            }

            // Shrunk images no longer match the scale bar, so they don't count as fitting
            return static_cast<uint32_t>(std::ranges::count(result.m_Pages.front().m_Images, false, &PlacedImage::m_Shrunk));
        }
    };

    const ScaleSearchResult search{
        SearchScale(spec.m_TargetImagesPerPage,
                    spec.m_MinFactor,
                    spec.m_MaxFactor,
                    spec.m_Tolerance,
                    count_first_page),
    };
    LogInfo("Auto scale resolved to {} with {} images on the first page, {} requested",
            search.m_Factor,
            search.m_Achieved,
            spec.m_TargetImagesPerPage);

    if (!search.m_Exact)
    {
        failures.push_back(GenerationFailure{
            .m_Kind = FailureKind::InfeasibleAutoScale,
            .m_ImageName{},
            .m_Message{
                fmt::format("Could not fit exactly {} images per page, using scale {} with {} images on the first page",
                            spec.m_TargetImagesPerPage,
                            search.m_Factor,
                            search.m_Achieved),
            },
        });
    }

    return ScaleReport{
        .m_Factor = search.m_Factor,
        .m_Auto = true,
        .m_TargetImagesPerPage = spec.m_TargetImagesPerPage,
        .m_AchievedImagesPerPage = search.m_Achieved,
        .m_Exact = search.m_Exact,
    };
}

void LogLayoutHints(const LayoutConfig& config, const GenerationFailures& failures)
{
    const bool any_oversized{
        std::ranges::contains(failures, FailureKind::OversizedImage, &GenerationFailure::m_Kind)
    };
    const bool infeasible_scale{
        std::ranges::contains(failures, FailureKind::InfeasibleAutoScale, &GenerationFailure::m_Kind)
    };
    if (!any_oversized && !infeasible_scale)
    {
        return;
    }

    LogInfo("Some images could not be laid out as requested, consider:");
    if (any_oversized)
    {
        LogInfo("\tusing a scale smaller than {}", config.m_Scale.m_Factor);
    }
    if (config.m_Margin > 0)
    {
        LogInfo("\treducing the margin of {} pixels", config.m_Margin);
    }
    if (config.m_Spacing > 0)
    {
        LogInfo("\treducing the spacing of {} pixels", config.m_Spacing);
    }
    LogInfo("\tchoosing a page larger than {}x{}", config.m_PageSize.x, config.m_PageSize.y);
    if (config.m_Mode == LayoutMode::Grid || config.m_Mode == LayoutMode::Manual)
    {
        LogInfo("\tswitching from {} to {} or {} mode",
                magic_enum::enum_name(config.m_Mode),
                magic_enum::enum_name(LayoutMode::Puzzle),
                magic_enum::enum_name(LayoutMode::Masonry));
    }
}

void LogIneffectiveOptions(const LayoutConfig& config)
{
    const std::string& primary_field{ config.m_Sort.m_Primary.m_Field };
    if (config.m_PageBreak.m_Enabled && !IsMetadataSortField(primary_field))
    {
        LogWarning("Page breaks follow the primary sort field, but {} is not a metadata field so no breaks will occur",
                   primary_field);
    }

    if (config.m_Mode == LayoutMode::Masonry && config.m_ScaleBar.m_Enabled)
    {
        LogWarning("{} mode scales every image to its column width, the scale bar does not match the images",
                   magic_enum::enum_name(config.m_Mode));
    }
}

LayoutRun RunLayout(std::span<const ImageItem> images,
                    const LayoutConfig& config,
                    const TextMeasurer& measurer,
                    std::optional<uint32_t> max_pages)
{
    config.Validate();

    LogInfo("Laying out {} images in {} mode", images.size(), magic_enum::enum_name(config.m_Mode));
    LogIneffectiveOptions(config);

    const auto strategy{ CreatePlacementStrategy(config.m_Mode) };
    const auto items{ PreparePlacementItems(images, config, measurer) };

    LayoutRun run{};
    run.m_Scale = ResolveScale(items, config, *strategy, run.m_Failures);

    const auto scaled_items{ ApplyScale(items, run.m_Scale.m_Factor, run.m_Failures) };
    Paginator paginator{ config.m_PageBreak, max_pages };
    PlacementResult placement{ strategy->Place(scaled_items, config, paginator) };
    run.m_Failures.insert(run.m_Failures.end(),
                          std::make_move_iterator(placement.m_Failures.begin()),
                          std::make_move_iterator(placement.m_Failures.end()));

    uint32_t running_number{ config.m_Numbering.m_StartNumber };
    for (PlacedPage& placed_page : placement.m_Pages)
    {
        Page page{
            .m_Index = static_cast<uint32_t>(run.m_Pages.size()),
            .m_Size{ config.m_PageSize },
            .m_ContentOrigin{ config.ContentOrigin() },
            .m_Images{ std::move(placed_page.m_Images) },
            .m_Overlays{},
        };
        for (const PlacedImage& image : page.m_Images)
        {
            if (image.m_Shrunk)
            {
                LogWarning("Image {} was shrunk to {}x{} to fit, the scale bar does not apply to it",
                           image.m_Item->m_Name,
                           image.m_Image.m_Size.x,
                           image.m_Image.m_Size.y);
            }
        }
        page.m_Overlays = ComposeOverlays(page,
                                          placed_page.m_Dividers,
                                          config,
                                          run.m_Scale.m_Factor,
                                          measurer,
                                          running_number);
        run.m_Pages.push_back(std::move(page));
    }

    LogLayoutHints(config, run.m_Failures);
    return run;
}
} // namespace

Document GenerateDocument(std::span<const ImageItem> images,
                          const LayoutConfig& config,
                          const TextMeasurer& measurer,
                          GenerationFailures load_failures)
{
    LayoutRun run{ RunLayout(images, config, measurer, std::nullopt) };
    load_failures.insert(load_failures.end(),
                         std::make_move_iterator(run.m_Failures.begin()),
                         std::make_move_iterator(run.m_Failures.end()));
    return AssembleDocument(std::move(run.m_Pages), std::move(load_failures), run.m_Scale);
}

Page PreviewFirstPage(std::span<const ImageItem> images,
                      const LayoutConfig& config,
                      const TextMeasurer& measurer)
{
    LayoutRun run{ RunLayout(images, config, measurer, 1) };
    if (!run.m_Pages.empty())
    {
        Page page{ std::move(run.m_Pages.front()) };
        page.m_Index = 0;
        return page;
    }

    uint32_t running_number{ config.m_Numbering.m_StartNumber };
    Page page{
        .m_Index = 0,
        .m_Size{ config.m_PageSize },
        .m_ContentOrigin{ config.ContentOrigin() },
        .m_Images{},
        .m_Overlays{},
    };
    page.m_Overlays = ComposeOverlays(page, {}, config, run.m_Scale.m_Factor, measurer, running_number);
    return page;
}
