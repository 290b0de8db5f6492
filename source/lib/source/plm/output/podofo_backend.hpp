#pragma once

#include <memory>
#include <vector>

#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <plm/output/backend.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public OutputPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void FillRect(PixelRect rect, ColorRGB8 color) override;

    virtual void StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color) override;

    virtual void DrawText(TextData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document,
               dla::ivec2 size);

    PoDoFo::Rect ToPoDoFoRect(const PixelRect& rect) const;

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
    dla::ivec2 m_Size;
};

class PoDoFoDocument final : public OutputDocument
{
  public:
    PoDoFoDocument();
    virtual ~PoDoFoDocument() override = default;

    virtual PoDoFoPage* NextPage(dla::ivec2 size) override;

    virtual fs::path Write(fs::path path) override;

    PoDoFo::PdfFont& GetFont(bool bold);
    std::unique_ptr<PoDoFo::PdfImage> MakeImage();

    double ToPoDoFoPoints(double pixels) const;

  private:
    double m_PointsPerPixel;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;
};
