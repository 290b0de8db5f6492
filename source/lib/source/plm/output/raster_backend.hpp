#pragma once

#include <memory>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <plm/output/backend.hpp>

class RasterPage final : public OutputPage
{
    friend class RasterDocument;

  public:
    virtual ~RasterPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void FillRect(PixelRect rect, ColorRGB8 color) override;

    virtual void StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color) override;

    virtual void DrawText(TextData data) override;

    virtual void Finish() override{};

  private:
    cv::Mat m_Page{};
};

/*
        Renders every page into an image, written as one file per page
        into a folder named after the output
*/
class RasterDocument final : public OutputDocument
{
  public:
    RasterDocument(OutputFormat format);
    virtual ~RasterDocument() override = default;

    virtual RasterPage* NextPage(dla::ivec2 size) override;

    virtual fs::path Write(fs::path path) override;

  private:
    OutputFormat m_Format;
    std::vector<std::unique_ptr<RasterPage>> m_Pages;
};
