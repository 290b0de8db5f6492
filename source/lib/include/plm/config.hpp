#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <plm/util.hpp>

#include <dla/vector.h>

struct Config
{
    uint32_t m_MaxWorkerThreads{ 16 };
    std::chrono::milliseconds m_DecodeTimeout{ 30000 };
    std::string m_DefaultPageSize{ "A4" };
    PixelDensity m_OutputDPI{ 300_dpi };
    std::optional<int> m_PngCompression{ std::nullopt };
    std::optional<int> m_JpgQuality{ 95 };
    bool m_DeterministicPdfOutput{ false };

    struct SizeInfo
    {
        Size m_Dimensions;
        std::string m_Unit;
    };

    // HD and 4K are screen formats, expressed here as their size at 300 dpi
    inline static const std::map<std::string, SizeInfo> g_DefaultPageSizes{
        { "A5", { { 148_mm, 210_mm }, "mm" } },
        { "A4", { { 210_mm, 297_mm }, "mm" } },
        { "A3", { { 297_mm, 420_mm }, "mm" } },
        { "Letter", { { 8.5_in, 11_in }, "in" } },
        { "Legal", { { 8.5_in, 14_in }, "in" } },
        { "HD", { { 6.4_in, 3.6_in }, "in" } },
        { "4K", { { 12.8_in, 7.2_in }, "in" } },
    };
    std::map<std::string, SizeInfo> m_PageSizes{ g_DefaultPageSizes };

    /*
            Resolves either a named page size or a "<width>x<height>" pixel size
    */
    std::optional<dla::ivec2> ResolvePageSize(std::string_view name) const;
};

Config LoadConfig();
void SaveConfig(const Config& config);

extern Config g_Cfg;
