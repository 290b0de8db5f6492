#include <plm/layout/document.hpp>

#include <algorithm>
#include <numeric>

#include <plm/util/log.hpp>

PlacementStatus Document::Status() const
{
    const bool any_image_dropped{
        std::ranges::any_of(m_Failures,
                            [](const GenerationFailure& failure)
                            { return failure.m_Kind != FailureKind::InfeasibleAutoScale; })
    };
    return any_image_dropped ? PlacementStatus::PartiallyPlaced : PlacementStatus::FullyPlaced;
}

Document AssembleDocument(std::vector<Page> pages, GenerationFailures failures, ScaleReport scale)
{
    Document document{};
    document.m_Pages = std::move(pages);
    document.m_Failures = std::move(failures);
    document.m_Scale = scale;

    for (uint32_t i = 0; i < document.m_Pages.size(); i++)
    {
        Page& page{ document.m_Pages[i] };
        page.m_Index = i;
        for (PlacedImage& image : page.m_Images)
        {
            image.m_PageIndex = i;
        }
    }

    document.m_TotalPages = document.m_Pages.size();
    document.m_TotalImages = std::accumulate(document.m_Pages.begin(),
                                             document.m_Pages.end(),
                                             size_t{ 0 },
                                             [](size_t sum, const Page& page)
                                             { return sum + page.m_Images.size(); });

    LogInfo("Assembled {} images on {} pages", document.m_TotalImages, document.m_TotalPages);
    for (const GenerationFailure& failure : document.m_Failures)
    {
        LogWarning("{}", failure.m_Message);
    }

    return document;
}
