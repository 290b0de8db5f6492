#include <plm/output/raster_backend.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <opencv2/imgproc.hpp>

#include <plm/config.hpp>
#include <plm/image.hpp>
#include <plm/layout/errors.hpp>
#include <plm/util/log.hpp>

static cv::Scalar ToCvColor(ColorRGB8 color)
{
    return cv::Scalar{
        static_cast<double>(color.b),
        static_cast<double>(color.g),
        static_cast<double>(color.r),
    };
}

static cv::Rect ToCvRect(const PixelRect& rect)
{
    return cv::Rect{ rect.Left(), rect.Top(), rect.m_Size.x, rect.m_Size.y };
}

void RasterPage::DrawImage(ImageData data)
{
    const Image loaded_image{ Image::Read(data.m_Path) };
    if (!loaded_image.Valid())
    {
        throw EncodingError{ fmt::format("Could not read image {} while rendering page", data.m_Path.string()) };
    }

    // Manually placed images may leave the page, only the visible part is copied
    const cv::Rect target{ ToCvRect(data.m_Rect) };
    const cv::Rect visible{ target & cv::Rect{ 0, 0, m_Page.cols, m_Page.rows } };
    if (visible.empty())
    {
        return;
    }

    const Image resized_image{ loaded_image.ToBGR().Resize(data.m_Rect.m_Size) };
    const cv::Rect source{ visible - target.tl() };
    resized_image.GetUnderlying()(source).copyTo(m_Page(visible));
}

void RasterPage::FillRect(PixelRect rect, ColorRGB8 color)
{
    cv::rectangle(m_Page, ToCvRect(rect), ToCvColor(color), cv::FILLED);
}

void RasterPage::StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color)
{
    const cv::Scalar cv_color{ ToCvColor(color) };
    const int32_t horizontal{ std::min(thickness, rect.m_Size.y) };
    const int32_t vertical{ std::min(thickness, rect.m_Size.x) };
    cv::rectangle(m_Page, cv::Rect{ rect.Left(), rect.Top(), rect.m_Size.x, horizontal }, cv_color, cv::FILLED);
    cv::rectangle(m_Page, cv::Rect{ rect.Left(), rect.Bottom() - horizontal, rect.m_Size.x, horizontal }, cv_color, cv::FILLED);
    cv::rectangle(m_Page, cv::Rect{ rect.Left(), rect.Top(), vertical, rect.m_Size.y }, cv_color, cv::FILLED);
    cv::rectangle(m_Page, cv::Rect{ rect.Right() - vertical, rect.Top(), vertical, rect.m_Size.y }, cv_color, cv::FILLED);
}

void RasterPage::DrawText(TextData data)
{
    static constexpr int c_Font{ cv::FONT_HERSHEY_SIMPLEX };

    const int thickness{ data.m_Bold ? 2 : 1 };
    const double font_scale{ cv::getFontScaleFromHeight(c_Font, data.m_FontSize, thickness) };
    const cv::String text{ data.m_Text.data(), data.m_Text.size() };

    int baseline{ 0 };
    const cv::Size text_size{ cv::getTextSize(text, c_Font, font_scale, thickness, &baseline) };

    const PixelRect& bounds{ data.m_Bounds };
    const int x{
        [&]()
        {
            switch (data.m_Alignment)
            {
            case TextAlignment::Left:
                return bounds.Left();
            case TextAlignment::Right:
                return bounds.Right() - text_size.width;
            case TextAlignment::Center:
            default:
                return bounds.Left() + (bounds.m_Size.x - text_size.width) / 2;
            }
        }()
    };
    const int y{ bounds.Top() + (bounds.m_Size.y + text_size.height) / 2 };

    cv::putText(m_Page, text, cv::Point{ x, y }, c_Font, font_scale, ToCvColor(c_Black), thickness, cv::LINE_AA);
}

RasterDocument::RasterDocument(OutputFormat format)
    : m_Format{ format }
{
}

RasterPage* RasterDocument::NextPage(dla::ivec2 size)
{
    auto& page{ m_Pages.emplace_back(new RasterPage) };
    page->m_Page = cv::Mat{ cv::Size{ size.x, size.y }, CV_8UC3, ToCvColor(c_White) };
    return page.get();
}

fs::path RasterDocument::Write(fs::path path)
{
    const fs::path folder{ fs::path{ path }.replace_extension() };
    fs::create_directories(folder);

    const std::string_view extension{ m_Format == OutputFormat::Jpg ? ".jpg" : ".png" };
    for (size_t i = 0; i < m_Pages.size(); i++)
    {
        const fs::path page_path{ folder / fmt::format("page_{:03}{}", i + 1, extension) };
        LogInfo("Saving to {}...", page_path.string());

        const Image page_image{ m_Pages[i]->m_Page };
        if (!page_image.Write(page_path, g_Cfg.m_PngCompression, g_Cfg.m_JpgQuality))
        {
            throw EncodingError{ fmt::format("Failed writing page {} to {}", i + 1, page_path.string()) };
        }
    }

    return folder;
}
