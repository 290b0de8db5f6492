#include <plm/layout/sort.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <random>
#include <ranges>

#include <plm/util/log.hpp>

bool IsMetadataSortField(std::string_view field)
{
    return !field.empty() &&
           field != c_SortNone &&
           field != c_SortAlphabetical &&
           field != c_SortNaturalName &&
           field != c_SortRandom;
}

static bool IsDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static std::string_view NextRun(std::string_view& str)
{
    const bool digits{ IsDigit(str.front()) };
    const auto run_end{ std::ranges::find_if(str, [digits](char c)
                                             { return IsDigit(c) != digits; }) };
    const size_t run_length{ static_cast<size_t>(run_end - str.begin()) };
    const std::string_view run{ str.substr(0, run_length) };
    str.remove_prefix(run_length);
    return run;
}

static std::strong_ordering CompareDigitRuns(std::string_view lhs, std::string_view rhs)
{
    // Compare by value without parsing, so arbitrarily long runs work
    const auto strip_zeros{
        [](std::string_view run)
        {
            const auto first_non_zero{ run.find_first_not_of('0') };
            return first_non_zero == std::string_view::npos ? std::string_view{} : run.substr(first_non_zero);
        }
    };
    const auto lhs_value{ strip_zeros(lhs) };
    const auto rhs_value{ strip_zeros(rhs) };
    if (const auto cmp{ lhs_value.size() <=> rhs_value.size() }; cmp != 0)
    {
        return cmp;
    }
    return lhs_value.compare(rhs_value) <=> 0;
}

static std::strong_ordering CompareTextRuns(std::string_view lhs, std::string_view rhs)
{
    return std::lexicographical_compare_three_way(
        lhs.begin(),
        lhs.end(),
        rhs.begin(),
        rhs.end(),
        [](char l, char r)
        {
            return std::tolower(static_cast<unsigned char>(l)) <=> std::tolower(static_cast<unsigned char>(r));
        });
}

std::strong_ordering NaturalCompare(std::string_view lhs, std::string_view rhs)
{
    std::string_view lhs_rest{ lhs };
    std::string_view rhs_rest{ rhs };
    while (!lhs_rest.empty() && !rhs_rest.empty())
    {
        const bool lhs_digits{ IsDigit(lhs_rest.front()) };
        const bool rhs_digits{ IsDigit(rhs_rest.front()) };
        if (lhs_digits != rhs_digits)
        {
            // Numbers before text
            return lhs_digits ? std::strong_ordering::less : std::strong_ordering::greater;
        }

        const auto lhs_run{ NextRun(lhs_rest) };
        const auto rhs_run{ NextRun(rhs_rest) };
        const auto cmp{
            lhs_digits
                ? CompareDigitRuns(lhs_run, rhs_run)
                : CompareTextRuns(lhs_run, rhs_run)
        };
        if (cmp != 0)
        {
            return cmp;
        }
    }

    if (lhs_rest.empty() != rhs_rest.empty())
    {
        return lhs_rest.empty() ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    // "a01" and "a1" or "A" and "a" are equal so far
    return lhs.compare(rhs) <=> 0;
}

static std::optional<double> ParseDouble(std::string_view str)
{
    double val{};
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
    return val;
}

std::strong_ordering MetadataValueCompare(std::string_view lhs, std::string_view rhs)
{
    const auto lhs_number{ ParseDouble(lhs) };
    const auto rhs_number{ ParseDouble(rhs) };
    if (lhs_number.has_value() && rhs_number.has_value())
    {
        const auto cmp{ lhs_number.value() <=> rhs_number.value() };
        if (cmp == std::partial_ordering::less)
        {
            return std::strong_ordering::less;
        }
        else if (cmp == std::partial_ordering::greater)
        {
            return std::strong_ordering::greater;
        }
    }
    return lhs.compare(rhs) <=> 0;
}

namespace
{
struct SortEntry
{
    const ImageItem* m_Image;
    uint64_t m_PrimaryRandom;
    uint64_t m_SecondaryRandom;
};
} // namespace

static std::strong_ordering Reverse(std::strong_ordering cmp)
{
    return 0 <=> cmp;
}

static std::strong_ordering CompareByKey(const SortEntry& lhs,
                                         const SortEntry& rhs,
                                         const SortKey& key,
                                         bool primary)
{
    const std::string_view field{ key.m_Field };
    const bool descending{ key.m_Direction == SortDirection::Descending };
    const auto directed{
        [descending](std::strong_ordering cmp)
        {
            return descending ? Reverse(cmp) : cmp;
        }
    };

    if (field == c_SortNone || field.empty())
    {
        return std::strong_ordering::equal;
    }
    else if (field == c_SortAlphabetical)
    {
        return directed(lhs.m_Image->m_Name.compare(rhs.m_Image->m_Name) <=> 0);
    }
    else if (field == c_SortNaturalName)
    {
        return directed(NaturalCompare(lhs.m_Image->m_Name, rhs.m_Image->m_Name));
    }
    else if (field == c_SortRandom)
    {
        return primary
                   ? lhs.m_PrimaryRandom <=> rhs.m_PrimaryRandom
                   : lhs.m_SecondaryRandom <=> rhs.m_SecondaryRandom;
    }

    const auto get_value{
        [&](const ImageItem& image) -> const std::string*
        {
            const std::string* value{ image.FindField(field) };
            return value != nullptr && !value->empty() ? value : nullptr;
        }
    };
    const std::string* lhs_value{ get_value(*lhs.m_Image) };
    const std::string* rhs_value{ get_value(*rhs.m_Image) };

    // Missing values go last, regardless of direction
    if (lhs_value == nullptr || rhs_value == nullptr)
    {
        if (lhs_value == rhs_value)
        {
            return std::strong_ordering::equal;
        }
        return lhs_value == nullptr ? std::strong_ordering::greater : std::strong_ordering::less;
    }

    return directed(MetadataValueCompare(*lhs_value, *rhs_value));
}

std::vector<const ImageItem*> SortImages(std::span<const ImageItem> images, const SortSpec& spec)
{
    const bool uses_random{
        spec.m_Primary.m_Field == c_SortRandom ||
        spec.m_Secondary.m_Field == c_SortRandom
    };

    const uint64_t seed{
        spec.m_RandomSeed.has_value()
            ? spec.m_RandomSeed.value()
            : uses_random ? std::random_device{}() : 0u
    };
    std::mt19937_64 generator{ seed };

    std::vector<SortEntry> entries;
    entries.reserve(images.size());
    for (const ImageItem& image : images)
    {
        const uint64_t primary_random{ uses_random ? generator() : 0u };
        const uint64_t secondary_random{ uses_random ? generator() : 0u };
        entries.push_back({ &image, primary_random, secondary_random });
    }

    const bool metadata_tie_break{
        IsMetadataSortField(spec.m_Primary.m_Field) ||
        IsMetadataSortField(spec.m_Secondary.m_Field)
    };
    std::ranges::stable_sort(entries,
                             [&spec, metadata_tie_break](const SortEntry& lhs, const SortEntry& rhs)
                             {
                                 if (const auto cmp{ CompareByKey(lhs, rhs, spec.m_Primary, true) }; cmp != 0)
                                 {
                                     return cmp < 0;
                                 }
                                 if (const auto cmp{ CompareByKey(lhs, rhs, spec.m_Secondary, false) }; cmp != 0)
                                 {
                                     return cmp < 0;
                                 }
                                 // Equal metadata values fall back to the image name
                                 return metadata_tie_break &&
                                        NaturalCompare(lhs.m_Image->m_Name, rhs.m_Image->m_Name) < 0;
                             });

    LogInfo("Sorted {} images by {} then {}", entries.size(), spec.m_Primary.m_Field, spec.m_Secondary.m_Field);

    return entries |
           std::views::transform(&SortEntry::m_Image) |
           std::ranges::to<std::vector>();
}

std::optional<std::string> PrimaryGroupKey(const ImageItem& image, const SortSpec& spec)
{
    if (!IsMetadataSortField(spec.m_Primary.m_Field))
    {
        return std::nullopt;
    }

    const std::string* value{ image.FindField(spec.m_Primary.m_Field) };
    return value != nullptr ? *value : std::string{};
}
