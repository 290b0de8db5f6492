#pragma once

#include <memory>
#include <vector>

#include <QBuffer>
#include <QPainter>
#include <QSvgGenerator>

#include <plm/output/backend.hpp>

class SvgPage final : public OutputPage
{
    friend class SvgDocument;

  public:
    virtual ~SvgPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void FillRect(PixelRect rect, ColorRGB8 color) override;

    virtual void StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color) override;

    virtual void DrawText(TextData data) override;

    virtual void Finish() override;

  private:
    SvgPage(dla::ivec2 size, uint32_t index);

    QBuffer m_Buffer;
    QSvgGenerator m_Generator;
    QPainter m_Painter;
};

/*
        Every page becomes its own svg with embedded images and captions as real text
*/
class SvgDocument final : public OutputDocument
{
  public:
    virtual ~SvgDocument() override = default;

    virtual SvgPage* NextPage(dla::ivec2 size) override;

    virtual fs::path Write(fs::path path) override;

  private:
    std::vector<std::unique_ptr<SvgPage>> m_Pages;
};
