#pragma once

#include <cstdint>
#include <vector>

#include <plm/layout/errors.hpp>
#include <plm/layout/types.hpp>

struct ScaleReport
{
    float m_Factor;
    bool m_Auto{ false };
    uint32_t m_TargetImagesPerPage{ 0 };
    uint32_t m_AchievedImagesPerPage{ 0 };
    bool m_Exact{ true };

    bool operator==(const ScaleReport&) const = default;
};

enum class PlacementStatus
{
    FullyPlaced,
    PartiallyPlaced,
};

struct Document
{
    std::vector<Page> m_Pages;
    size_t m_TotalImages{ 0 };
    size_t m_TotalPages{ 0 };
    GenerationFailures m_Failures;
    ScaleReport m_Scale{};

    // Partially placed as soon as any input image is missing from the pages
    PlacementStatus Status() const;

    bool operator==(const Document&) const = default;
};

/*
        Assigns contiguous page indices and computes the summary counters
*/
Document AssembleDocument(std::vector<Page> pages, GenerationFailures failures, ScaleReport scale);
