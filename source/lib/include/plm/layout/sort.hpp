#pragma once

#include <compare>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <plm/layout/layout_config.hpp>
#include <plm/layout/types.hpp>

inline constexpr std::string_view c_SortNone{ "none" };
inline constexpr std::string_view c_SortAlphabetical{ "alphabetical" };
inline constexpr std::string_view c_SortNaturalName{ "natural_name" };
inline constexpr std::string_view c_SortRandom{ "random" };

bool IsMetadataSortField(std::string_view field);

/*
        Digit runs compare by value, other runs compare case-insensitively,
        a final case-sensitive comparison keeps the order total
*/
std::strong_ordering NaturalCompare(std::string_view lhs, std::string_view rhs);

/*
        Values that both parse as numbers compare by value, others lexicographically
*/
std::strong_ordering MetadataValueCompare(std::string_view lhs, std::string_view rhs);

/*
        Returns a stably sorted view on the images, the images themselves are not touched
*/
std::vector<const ImageItem*> SortImages(std::span<const ImageItem> images, const SortSpec& spec);

/*
        Group key for page breaks, only metadata primary keys form groups
*/
std::optional<std::string> PrimaryGroupKey(const ImageItem& image, const SortSpec& spec);
