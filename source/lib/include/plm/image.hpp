#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <dla/vector.h>

#include <plm/util.hpp>

class QImage;

using EncodedImage = std::vector<std::byte>;

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image();

    Image(Image&& rhs);
    Image(const Image& rhs);

    Image& operator=(Image&& rhs);
    Image& operator=(const Image& rhs);

    static Image Read(const fs::path& path);
    bool Write(const fs::path& path, std::optional<int32_t> png_compression = std::nullopt, std::optional<int32_t> jpg_quality = std::nullopt) const;

    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    // Deep copy, the QImage does not reference this image
    QImage StoreIntoQtImage() const;

    explicit operator bool() const;
    bool Valid() const;

    // Always three channel BGR, alpha is blended onto white
    Image ToBGR() const;

    Image Resize(dla::ivec2 size) const;

    dla::ivec2 Size() const;

    const cv::Mat& GetUnderlying() const;

  private:
    void Release();

    cv::Mat m_Impl{};
};
