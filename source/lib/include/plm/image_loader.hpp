#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <vector>

#include <plm/layout/errors.hpp>
#include <plm/layout/types.hpp>
#include <plm/metadata.hpp>
#include <plm/util.hpp>

inline const std::array g_SupportedImageExtensions{
    ".png"_p,
    ".jpg"_p,
    ".jpeg"_p,
    ".bmp"_p,
    ".tif"_p,
    ".tiff"_p,
    ".webp"_p,
};

struct ImageLoadOptions
{
    std::chrono::milliseconds m_Timeout;
    // Polled while waiting, decoding stops as soon as it is set
    const std::atomic_bool* m_Cancel{ nullptr };
};

struct LoadedImages
{
    std::vector<ImageItem> m_Images;
    GenerationFailures m_Failures;
};

/*
        Decodes all supported images in the directory on the global thread pool and attaches
        their metadata. Images that can't be decoded in time are reported as failures.
        Throws GenerationError if the directory does not exist.
*/
LoadedImages LoadImages(const fs::path& image_dir, const MetadataTable& metadata, const ImageLoadOptions& options);
