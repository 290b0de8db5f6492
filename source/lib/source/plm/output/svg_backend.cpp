#include <plm/output/svg_backend.hpp>

#include <fstream>

#include <fmt/format.h>

#include <QFont>
#include <QPen>

#include <plm/config.hpp>
#include <plm/image.hpp>
#include <plm/layout/errors.hpp>
#include <plm/util/log.hpp>

static QRect ToQRect(const PixelRect& rect)
{
    return QRect{ rect.Left(), rect.Top(), rect.m_Size.x, rect.m_Size.y };
}

static QColor ToQColor(ColorRGB8 color)
{
    return QColor{ color.r, color.g, color.b };
}

SvgPage::SvgPage(dla::ivec2 size, uint32_t index)
{
    m_Generator.setOutputDevice(&m_Buffer);
    m_Generator.setSize(QSize{ size.x, size.y });
    m_Generator.setViewBox(QRect{ 0, 0, size.x, size.y });
    m_Generator.setResolution(static_cast<int>(g_Cfg.m_OutputDPI / 1_dpi));
    m_Generator.setTitle(QString::fromStdString(fmt::format("Plate {}", index + 1)));
    m_Generator.setDescription("Generated by Plate Layout Maker");

    m_Painter.begin(&m_Generator);
    m_Painter.fillRect(QRect{ 0, 0, size.x, size.y }, ToQColor(c_White));
}

void SvgPage::DrawImage(ImageData data)
{
    const Image loaded_image{ Image::Read(data.m_Path) };
    if (!loaded_image.Valid())
    {
        throw EncodingError{ fmt::format("Could not read image {} while writing svg", data.m_Path.string()) };
    }

    const QImage image{ loaded_image.Resize(data.m_Rect.m_Size).StoreIntoQtImage() };
    m_Painter.drawImage(ToQRect(data.m_Rect), image);
}

void SvgPage::FillRect(PixelRect rect, ColorRGB8 color)
{
    m_Painter.fillRect(ToQRect(rect), ToQColor(color));
}

void SvgPage::StrokeRect(PixelRect rect, int32_t thickness, ColorRGB8 color)
{
    const int32_t inset{ thickness / 2 };
    const QRect path_rect{
        rect.Left() + inset,
        rect.Top() + inset,
        rect.m_Size.x - 2 * inset,
        rect.m_Size.y - 2 * inset,
    };

    m_Painter.save();
    QPen pen{};
    pen.setWidth(thickness);
    pen.setColor(ToQColor(color));
    pen.setJoinStyle(Qt::MiterJoin);
    m_Painter.setPen(pen);
    m_Painter.setBrush(Qt::NoBrush);
    m_Painter.drawRect(path_rect);
    m_Painter.restore();
}

void SvgPage::DrawText(TextData data)
{
    const Qt::Alignment horizontal_alignment{
        [&]()
        {
            switch (data.m_Alignment)
            {
            case TextAlignment::Left:
                return Qt::AlignLeft;
            case TextAlignment::Right:
                return Qt::AlignRight;
            case TextAlignment::Center:
            default:
                return Qt::AlignHCenter;
            }
        }()
    };

    QFont font{ "Helvetica" };
    font.setPixelSize(data.m_FontSize);
    font.setBold(data.m_Bold);

    m_Painter.save();
    m_Painter.setFont(font);
    m_Painter.setPen(ToQColor(c_Black));
    m_Painter.drawText(ToQRect(data.m_Bounds),
                       horizontal_alignment | Qt::AlignVCenter | Qt::TextDontClip,
                       QString::fromUtf8(data.m_Text.data(), static_cast<qsizetype>(data.m_Text.size())));
    m_Painter.restore();
}

void SvgPage::Finish()
{
    if (m_Painter.isActive())
    {
        m_Painter.end();
    }
}

SvgPage* SvgDocument::NextPage(dla::ivec2 size)
{
    const uint32_t index{ static_cast<uint32_t>(m_Pages.size()) };
    m_Pages.emplace_back(new SvgPage{ size, index });
    return m_Pages.back().get();
}

fs::path SvgDocument::Write(fs::path path)
{
    const fs::path folder{ fs::path{ path }.replace_extension() };
    fs::create_directories(folder);

    for (size_t i = 0; i < m_Pages.size(); i++)
    {
        SvgPage& page{ *m_Pages[i] };
        page.Finish();

        const fs::path page_path{ folder / fmt::format("page_{:03}.svg", i + 1) };
        LogInfo("Saving to {}...", page_path.string());

        std::ofstream file{ page_path, std::ios::binary };
        const QByteArray& data{ page.m_Buffer.data() };
        file.write(data.constData(), data.size());
        if (!file)
        {
            throw EncodingError{ fmt::format("Failed writing page {} to {}", i + 1, page_path.string()) };
        }
    }

    return folder;
}
