#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <plm/layout/layout_config.hpp>
#include <plm/layout/text_measurer.hpp>
#include <plm/layout/types.hpp>

inline constexpr int32_t c_CaptionLineGap{ 2 };
inline constexpr int32_t c_ScaleBarHeight{ 15 };
inline constexpr int32_t c_ScaleBarLabelGap{ 4 };
inline constexpr int32_t c_NumberInset{ 5 };
inline constexpr int32_t c_BorderThickness{ 2 };

std::string CaptionDisplayName(const ImageItem& image, const CaptionSpec& spec);

/*
        The display name followed by one line per selected metadata field,
        without any selection all fields of the image are listed
*/
std::vector<std::string> CaptionLines(const ImageItem& image, const CaptionSpec& spec);

// Empty block when captions are disabled
CaptionBlock BuildCaption(const ImageItem& image, const CaptionSpec& spec, const TextMeasurer& measurer);

int32_t ScaleBarLength(const ScaleBarSpec& spec, float scale);

ScaleBarOverlay BuildScaleBar(const LayoutConfig& config, float scale, const TextMeasurer& measurer);

std::string NumberText(const NumberingSpec& spec, uint32_t number);

/*
        All overlays of a single page in page coordinates. The running number is shared
        across pages and advanced for every number handed out.
*/
PageOverlays ComposeOverlays(const Page& page,
                             std::span<const PixelRect> dividers,
                             const LayoutConfig& config,
                             float scale,
                             const TextMeasurer& measurer,
                             uint32_t& running_number);
