#include <plm/image.hpp>

#include <cstring>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <QImage>

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::~Image()
{
    Release();
}

Image::Image(Image&& rhs)
{
    *this = std::move(rhs);
}
Image::Image(const Image& rhs)
{
    *this = rhs;
}

Image& Image::operator=(Image&& rhs)
{
    m_Impl = std::move(rhs.m_Impl);
    return *this;
}
Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Read(const fs::path& path)
{
    Image img{};
    img.m_Impl = cv::imread(path.string().c_str(), cv::IMREAD_UNCHANGED);
    return img;
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression, std::optional<int32_t> jpg_quality) const
{
    const fs::path ext{ ToLower(path.extension().string()) };
    if (ext == ".png")
    {
        std::vector<int> png_params;
        if (png_compression.has_value())
        {
            png_params = {
                cv::IMWRITE_PNG_COMPRESSION,
                png_compression.value(),
                cv::IMWRITE_PNG_STRATEGY,
                cv::IMWRITE_PNG_STRATEGY_DEFAULT,
            };
        }

        return cv::imwrite(path.string().c_str(), m_Impl, png_params);
    }
    else if (ext == ".jpg" || ext == ".jpeg")
    {
        std::vector<int> jpg_params;
        if (jpg_quality.has_value())
        {
            jpg_params = {
                cv::IMWRITE_JPEG_QUALITY,
                jpg_quality.value(),
            };
        }

        return cv::imwrite(path.string().c_str(), m_Impl, jpg_params);
    }
    else
    {
        return cv::imwrite(path.string().c_str(), m_Impl);
    }
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<int> jpg_params;
    if (quality.has_value())
    {
        jpg_params = {
            cv::IMWRITE_JPEG_QUALITY,
            quality.value(),
        };
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".jpg", m_Impl, cv_buffer, jpg_params))
    {
        EncodedImage out_buffer(cv_buffer.size(), std::byte{});
        std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
        return out_buffer;
    }
    return {};
}

QImage Image::StoreIntoQtImage() const
{
    switch (m_Impl.channels())
    {
    case 1:
        return QImage(m_Impl.ptr(), m_Impl.cols, m_Impl.rows, m_Impl.step, QImage::Format_Grayscale8).copy();
    case 3:
        return QImage(m_Impl.ptr(), m_Impl.cols, m_Impl.rows, m_Impl.step, QImage::Format_BGR888).copy();
    case 4:
    {
        cv::Mat img;
        cv::cvtColor(m_Impl, img, cv::COLOR_BGRA2RGBA);
        return QImage(img.ptr(), img.cols, img.rows, img.step, QImage::Format_RGBA8888).copy();
    }
    default:
        return QImage{};
    }
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

Image Image::ToBGR() const
{
    Image img{};
    switch (m_Impl.channels())
    {
    case 1:
        cv::cvtColor(m_Impl, img.m_Impl, cv::COLOR_GRAY2BGR);
        break;
    case 4:
    {
        cv::Mat bgr;
        cv::Mat alpha;
        cv::cvtColor(m_Impl, bgr, cv::COLOR_BGRA2BGR);
        cv::extractChannel(m_Impl, alpha, 3);
        cv::cvtColor(alpha, alpha, cv::COLOR_GRAY2BGR);

        const cv::Mat white{ m_Impl.size(), CV_8UC3, cv::Scalar{ 255, 255, 255 } };
        cv::Mat alpha_f;
        alpha.convertTo(alpha_f, CV_32FC3, 1.0 / 255.0);
        cv::Mat bgr_f;
        cv::Mat white_f;
        bgr.convertTo(bgr_f, CV_32FC3);
        white.convertTo(white_f, CV_32FC3);
        const cv::Mat inverse_alpha_f{ cv::Scalar::all(1.0) - alpha_f };
        const cv::Mat blended{ bgr_f.mul(alpha_f) + white_f.mul(inverse_alpha_f) };
        blended.convertTo(img.m_Impl, CV_8UC3);
        break;
    }
    default:
        img.m_Impl = m_Impl.clone();
        break;
    }
    return img;
}

Image Image::Resize(dla::ivec2 size) const
{
    Image img{};
    cv::resize(m_Impl, img.m_Impl, cv::Size(size.x, size.y), 0.0, 0.0, cv::INTER_AREA);
    return img;
}

dla::ivec2 Image::Size() const
{
    return dla::ivec2{ m_Impl.cols, m_Impl.rows };
}

const cv::Mat& Image::GetUnderlying() const
{
    return m_Impl;
}

void Image::Release()
{
    m_Impl = cv::Mat{};
}
