#include <plm/layout/types.hpp>

#include <algorithm>

#include <dla/vector_math.h>

const std::string* ImageItem::FindField(std::string_view field_name) const
{
    const auto it{ std::ranges::find(m_Metadata, field_name, &MetadataField::m_Name) };
    return it != m_Metadata.end() ? &it->m_Value : nullptr;
}

bool PixelRect::Intersects(const PixelRect& rhs) const
{
    return Left() < rhs.Right() &&
           rhs.Left() < Right() &&
           Top() < rhs.Bottom() &&
           rhs.Top() < Bottom();
}

bool PixelRect::Contains(const PixelRect& rhs) const
{
    return Left() <= rhs.Left() &&
           Top() <= rhs.Top() &&
           rhs.Right() <= Right() &&
           rhs.Bottom() <= Bottom();
}

PixelRect PixelRect::Translated(dla::ivec2 offset) const
{
    return PixelRect{ m_Position + offset, m_Size };
}
