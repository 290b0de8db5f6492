#pragma once

#include <memory>
#include <string_view>

#include <plm/color.hpp>
#include <plm/layout/types.hpp>
#include <plm/output/generate.hpp>

class OutputDocument;

std::unique_ptr<OutputDocument> CreateOutputDocument(OutputFormat format);

/*
        A single page to draw on, all coordinates are page pixels with the origin top-left
*/
class OutputPage
{
  public:
    virtual ~OutputPage() = default;

    struct ImageData
    {
        const fs::path& m_Path;
        PixelRect m_Rect;
    };

    struct TextData
    {
        std::string_view m_Text;
        PixelRect m_Bounds;
        int32_t m_FontSize;
        TextAlignment m_Alignment;
        bool m_Bold;
    };

    virtual void DrawImage(ImageData data) = 0;

    virtual void FillRect(PixelRect rect, ColorRGB8 color) = 0;

    // The stroke lies inside of the rect
    virtual void StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color) = 0;

    virtual void DrawText(TextData data) = 0;

    virtual void Finish() = 0;
};

class OutputDocument
{
  public:
    virtual ~OutputDocument() = default;

    virtual OutputPage* NextPage(dla::ivec2 size) = 0;

    virtual fs::path Write(fs::path path) = 0;
};
