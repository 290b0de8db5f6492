#include <plm/layout/paginator.hpp>

#include <algorithm>

Paginator::Paginator(const PageBreakSpec& spec, std::optional<uint32_t> max_pages)
    : m_Spec{ spec }
    , m_MaxPages{ max_pages }
{
}

PageBoundary Paginator::BoundaryBefore(std::span<const PlacementItem> items, size_t index) const
{
    if (!m_Spec.m_Enabled || index == 0 || index >= items.size())
    {
        return PageBoundary::None;
    }

    const auto& previous_key{ items[index - 1].m_GroupKey };
    const auto& current_key{ items[index].m_GroupKey };
    if (!previous_key.has_value() || !current_key.has_value() || previous_key == current_key)
    {
        return PageBoundary::None;
    }

    return m_Spec.m_Kind == BreakKind::NewPage
               ? PageBoundary::NewPage
               : PageBoundary::Divider;
}

void Paginator::ClosePage(PlacedPage page, bool force)
{
    if (Done() || (page.m_Images.empty() && !force))
    {
        return;
    }
    m_Pages.push_back(std::move(page));
}

bool Paginator::Done() const
{
    return m_MaxPages.has_value() && m_Pages.size() >= m_MaxPages.value();
}

int32_t Paginator::DividerAdvance(int32_t spacing) const
{
    return m_Spec.m_DividerThickness + spacing;
}

int32_t Paginator::DividerThickness() const
{
    return m_Spec.m_DividerThickness;
}

PixelRect Paginator::MakeDivider(int32_t top, int32_t content_width) const
{
    const int32_t width{
        m_Spec.m_DividerWidth > 0
            ? std::min(m_Spec.m_DividerWidth, content_width)
            : content_width
    };
    return PixelRect{
        { (content_width - width) / 2, top },
        { width, m_Spec.m_DividerThickness },
    };
}

std::vector<PlacedPage> Paginator::TakePages()
{
    return std::move(m_Pages);
}
