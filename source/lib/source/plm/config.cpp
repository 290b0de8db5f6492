#include <plm/config.hpp>

#include <algorithm>
#include <charconv>
#include <ranges>
#include <string>
#include <vector>

#include <QFile>
#include <QSettings>
#include <QString>

#include <fmt/format.h>

#include <plm/util/log.hpp>

Config g_Cfg{};

static constexpr auto c_ToStringViews{ std::views::transform(
    [](auto str)
    { return std::string_view(str.data(), str.size()); }) };

template<class T>
static std::optional<T> ParseNumber(std::string_view str)
{
    T val{};
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
    return val;
}

static std::optional<Length> GetUnit(std::string_view unit)
{
    if (unit == "mm")
    {
        return 1_mm;
    }
    else if (unit == "cm")
    {
        return 1_cm;
    }
    else if (unit == "in" || unit == "inches")
    {
        return 1_in;
    }
    return std::nullopt;
}

std::optional<dla::ivec2> Config::ResolvePageSize(std::string_view name) const
{
    if (const auto it{ m_PageSizes.find(std::string{ name }) }; it != m_PageSizes.end())
    {
        const auto& dimensions{ it->second.m_Dimensions };
        return dla::ivec2{
            ToPixels(dimensions.x, m_OutputDPI),
            ToPixels(dimensions.y, m_OutputDPI),
        };
    }

    const auto parts{
        name |
        std::views::split('x') |
        c_ToStringViews |
        std::ranges::to<std::vector>()
    };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto width{ ParseNumber<int32_t>(parts[0]) };
    const auto height{ ParseNumber<int32_t>(parts[1]) };
    if (!width.has_value() || !height.has_value())
    {
        return std::nullopt;
    }
    return dla::ivec2{ width.value(), height.value() };
}

Config LoadConfig()
{
    Config config{};
    if (!QFile::exists("config.ini"))
    {
        SaveConfig(config);
        return config;
    }

    QSettings settings("config.ini", QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogError("Failed reading config.ini, using default configuration...");
        return config;
    }

    static constexpr auto c_ParseSize{
        [](std::string str) -> std::optional<Config::SizeInfo>
        {
            std::ranges::replace(str, ',', '.');

            const auto parts{
                str |
                std::views::split(' ') |
                c_ToStringViews |
                std::ranges::to<std::vector>()
            };

            if (parts.size() != 4 || parts[1] != "x")
            {
                return std::nullopt;
            }

            const auto unit{ GetUnit(parts[3]) };
            const auto width{ ParseNumber<float>(parts[0]) };
            const auto height{ ParseNumber<float>(parts[2]) };
            if (!unit.has_value() || !width.has_value() || !height.has_value())
            {
                return std::nullopt;
            }

            return Config::SizeInfo{
                { width.value() * unit.value(), height.value() * unit.value() },
                std::string{ parts[3] },
            };
        },
    };

    {
        settings.beginGroup("DEFAULT");

        config.m_MaxWorkerThreads = std::max(settings.value("Max.Worker.Threads", 16).toUInt(), 1u);
        config.m_DecodeTimeout = std::chrono::milliseconds{ settings.value("Decode.Timeout.Ms", 30000).toLongLong() };
        config.m_DefaultPageSize = settings.value("Page.Size", "A4").toString().toStdString();
        config.m_OutputDPI = settings.value("Output.DPI", 300).toFloat() * 1_dpi;
        config.m_DeterministicPdfOutput = settings.value("Deterministic.Pdf.Output", false).toBool();

        {
            auto png_compression{ settings.value("Png.Compression") };
            if (png_compression.isValid())
            {
                config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
            }
        }

        {
            auto jpg_quality{ settings.value("Jpg.Quality") };
            if (jpg_quality.isValid())
            {
                config.m_JpgQuality = std::clamp(jpg_quality.toInt(), 0, 100);
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const auto& key : settings.allKeys())
        {
            const std::string name{ key.toStdString() };
            if (config.m_PageSizes.contains(name))
            {
                continue;
            }

            if (auto info{ c_ParseSize(settings.value(key).toString().toStdString()) })
            {
                config.m_PageSizes[name] = std::move(info).value();
            }
            else
            {
                LogWarning("Ignoring malformed page size {} in config.ini", name);
            }
        }

        settings.endGroup();
    }

    return config;
}

void SaveConfig(const Config& config)
{
    QSettings settings("config.ini", QSettings::IniFormat);

    {
        settings.beginGroup("DEFAULT");

        settings.setValue("Max.Worker.Threads", config.m_MaxWorkerThreads);
        settings.setValue("Decode.Timeout.Ms", static_cast<qlonglong>(config.m_DecodeTimeout.count()));
        settings.setValue("Page.Size", QString::fromStdString(config.m_DefaultPageSize));
        settings.setValue("Output.DPI", config.m_OutputDPI / 1_dpi);
        settings.setValue("Deterministic.Pdf.Output", config.m_DeterministicPdfOutput);

        if (config.m_PngCompression.has_value())
        {
            settings.setValue("Png.Compression", config.m_PngCompression.value());
        }

        if (config.m_JpgQuality.has_value())
        {
            settings.setValue("Jpg.Quality", config.m_JpgQuality.value());
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const auto& [name, info] : config.m_PageSizes)
        {
            if (Config::g_DefaultPageSizes.contains(name))
            {
                continue;
            }

            const auto unit{ GetUnit(info.m_Unit).value_or(1_mm) };
            const auto [width, height]{ (info.m_Dimensions / unit).pod() };
            settings.setValue(QString::fromStdString(name),
                              QString::fromStdString(fmt::format("{:.1f} x {:.1f} {}", width, height, info.m_Unit)));
        }

        settings.endGroup();
    }

    settings.sync();
}
